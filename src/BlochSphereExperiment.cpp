#include "BlochSphereExperiment.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

void validateFieldStrength(double strength) {
    if (!(strength >= -1.0 && strength <= 1.0)) {
        std::ostringstream msg;
        msg << "magnetic field strength " << strength << " outside [-1, 1]";
        throw InvalidConfigurationError(msg.str());
    }
}

void validateTimeToMeasurement(double seconds) {
    if (!(seconds >= 0.0 && seconds <= MAX_TIME_TO_MEASUREMENT)) {
        std::ostringstream msg;
        msg << "time to measurement " << seconds << " outside [0, " << MAX_TIME_TO_MEASUREMENT << "]";
        throw InvalidConfigurationError(msg.str());
    }
}

} // anonymous namespace

BlochSphereExperiment::BlochSphereExperiment(const Config& config)
    : config_(config),
      random_(config.seed),
      multi_states_(MULTI_MEASUREMENT_SPHERE_COUNT),
      selected_direction_(StateDirection::Z_PLUS),
      scene_(config.scene),
      magnetic_field_strength_(config.magnetic_field_strength),
      measurement_basis_(config.measurement_basis),
      single_measurement_mode_(config.single_measurement_mode),
      time_to_measurement_(config.time_to_measurement) {
    validateFieldStrength(config.magnetic_field_strength);
    validateTimeToMeasurement(config.time_to_measurement);

    selectStateDirection(config.initial_direction);
    updatePrecessionRates();
}

// =============================================================================
// Preparation
// =============================================================================

void BlochSphereExperiment::selectStateDirection(StateDirection direction) {
    selected_direction_ = direction;
    if (direction != StateDirection::CUSTOM) {
        preparation_.setFromDirection(direction);
        propagatePreparation();
    }
}

void BlochSphereExperiment::setPreparationAngles(double polar_angle, double azimuthal_angle) {
    preparation_.setFromAngles(polar_angle, azimuthal_angle);
    selected_direction_ = StateDirection::CUSTOM;
    propagatePreparation();
}

double BlochSphereExperiment::upCoefficient() const {
    return std::cos(preparation_.polarAngle() / 2.0);
}

double BlochSphereExperiment::downCoefficient() const {
    return std::sin(preparation_.polarAngle() / 2.0);
}

double BlochSphereExperiment::phaseFactor() const {
    return preparation_.azimuthalAngle() / PI;
}

void BlochSphereExperiment::propagatePreparation() {
    single_state_.setFromAngles(preparation_.polarAngle(), preparation_.azimuthalAngle());
    for (auto& state : multi_states_) {
        state.setFromAngles(preparation_.polarAngle(), preparation_.azimuthalAngle());
    }
}

// =============================================================================
// Settings
// =============================================================================

void BlochSphereExperiment::setScene(BlochSphereScene scene) {
    scene_ = scene;
    updatePrecessionRates();
}

void BlochSphereExperiment::setMagneticFieldStrength(double strength) {
    validateFieldStrength(strength);
    magnetic_field_strength_ = strength;
    updatePrecessionRates();
}

void BlochSphereExperiment::updatePrecessionRates() {
    double rate = scene_ == BlochSphereScene::PRECESSION ? magnetic_field_strength_ : 0.0;
    single_state_.setPrecessionRate(rate);
    for (auto& state : multi_states_) {
        state.setPrecessionRate(rate);
    }
}

void BlochSphereExperiment::setMeasurementBasis(MeasurementAxis basis) {
    measurement_basis_ = basis;
    resetCounts();
}

void BlochSphereExperiment::setSingleMeasurementMode(bool single) {
    single_measurement_mode_ = single;
}

void BlochSphereExperiment::setTimeToMeasurement(double seconds) {
    validateTimeToMeasurement(seconds);
    time_to_measurement_ = seconds;
}

// =============================================================================
// Measurement
// =============================================================================

void BlochSphereExperiment::measureState(BlochState& state) {
    bool up = random_.nextBoolean(state.upProbability(measurement_basis_));
    state.collapseOnto(measurement_basis_, up);
    if (up) {
        up_count_++;
    } else {
        down_count_++;
    }
}

void BlochSphereExperiment::observe() {
    if (!ready_to_observe_) return;

    if (single_measurement_mode_) {
        measureState(single_state_);
    } else {
        for (auto& state : multi_states_) {
            measureState(state);
        }
    }

    ready_to_observe_ = false;
    measurement_state_ = SpinMeasurementState::OBSERVED;
    observation_timer_ = 0.0;
}

void BlochSphereExperiment::startTimedObservation() {
    if (!ready_to_observe_) return;

    if (time_to_measurement_ <= 0.0) {
        observe();
        return;
    }
    measurement_state_ = SpinMeasurementState::TIMING_OBSERVATION;
    observation_timer_ = time_to_measurement_;
}

void BlochSphereExperiment::reprepare() {
    propagatePreparation();
    ready_to_observe_ = true;
    measurement_state_ = SpinMeasurementState::PREPARED;
    observation_timer_ = 0.0;
}

void BlochSphereExperiment::step(double dt) {
    if (dt <= 0.0) return;

    single_state_.step(dt);
    for (auto& state : multi_states_) {
        state.step(dt);
    }

    if (measurement_state_ == SpinMeasurementState::TIMING_OBSERVATION) {
        observation_timer_ -= dt;
        if (observation_timer_ <= 0.0) {
            observe();
        }
    }
}

void BlochSphereExperiment::resetCounts() {
    up_count_ = 0;
    down_count_ = 0;
}

void BlochSphereExperiment::reset() {
    resetCounts();
    random_.reseed(config_.seed);

    scene_ = config_.scene;
    magnetic_field_strength_ = config_.magnetic_field_strength;
    measurement_basis_ = config_.measurement_basis;
    single_measurement_mode_ = config_.single_measurement_mode;
    time_to_measurement_ = config_.time_to_measurement;

    preparation_.reset();
    selectStateDirection(config_.initial_direction);
    updatePrecessionRates();

    ready_to_observe_ = true;
    measurement_state_ = SpinMeasurementState::PREPARED;
    observation_timer_ = 0.0;
}

BlochSphereScene parseBlochSphereScene(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "measurement") return BlochSphereScene::MEASUREMENT;
    if (t == "precession") return BlochSphereScene::PRECESSION;
    throw InvalidConfigurationError("unknown Bloch sphere scene '" + text + "'");
}

} // namespace QMSIM
