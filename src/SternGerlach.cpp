#include "SternGerlach.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

constexpr double PARTICLE_HOLE_WIDTH = 0.025;
constexpr std::size_t MAX_STAGES = 2;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

SternGerlachDeviceConfig stage(DeviceOrientation orientation, bool active) {
    SternGerlachDeviceConfig config;
    config.orientation = orientation;
    config.active = active;
    return config;
}

/// Device center so that its entrance sits at entrance_x on the beam line
Point2D deviceCenterForEntrance(double entrance_x) {
    return Point2D(entrance_x + SG_DEVICE_WIDTH / 2.0 + PARTICLE_HOLE_WIDTH / 2.0, 0.0);
}

} // anonymous namespace

// =============================================================================
// SternGerlachDevice
// =============================================================================

SternGerlachDevice::SternGerlachDevice(const SternGerlachDeviceConfig& config,
                                       const Point2D& position)
    : orientation_(DeviceOrientation::Z), axis_(0, 0, 1),
      active_(config.active), position_(position) {
    if (!config.orientation) {
        throw InvalidConfigurationError("Stern-Gerlach device has no orientation");
    }
    orientation_ = *config.orientation;

    switch (orientation_) {
        case DeviceOrientation::Z:
            axis_ = directionToVector(MeasurementAxis::Z);
            break;
        case DeviceOrientation::X:
            axis_ = directionToVector(MeasurementAxis::X);
            break;
        case DeviceOrientation::CUSTOM:
            if (!(config.custom_polar_angle >= 0.0 && config.custom_polar_angle <= PI) ||
                !std::isfinite(config.custom_azimuthal_angle)) {
                std::ostringstream msg;
                msg << "custom device polar angle " << config.custom_polar_angle
                    << " outside [0, pi]";
                throw InvalidConfigurationError(msg.str());
            }
            axis_ = anglesToVector(config.custom_polar_angle, config.custom_azimuthal_angle);
            break;
    }
}

double SternGerlachDevice::prepare(const Vector3D& incoming) {
    up_probability_ = spinUpProbability(incoming, axis_);
    return up_probability_;
}

StageResult SternGerlachDevice::measure(const Vector3D& incoming, RandomSource& random) const {
    StageResult result;
    if (!active_) {
        result.output_direction = incoming;
        return result;
    }

    result.measured = true;
    result.up_probability = spinUpProbability(incoming, axis_);
    result.up = random.nextBoolean(result.up_probability);
    result.output_direction = result.up ? axis_ : oppositeAxis();
    return result;
}

void SternGerlachDevice::recordOutcome(bool up) {
    if (up) {
        up_count_++;
    } else {
        down_count_++;
    }
}

void SternGerlachDevice::resetCounts() {
    up_count_ = 0;
    down_count_ = 0;
}

Point2D SternGerlachDevice::entrancePosition() const {
    return position_ + Point2D(-SG_DEVICE_WIDTH / 2.0 - PARTICLE_HOLE_WIDTH / 2.0, 0.0);
}

Point2D SternGerlachDevice::topExitPosition() const {
    return position_ + Point2D(SG_DEVICE_WIDTH / 2.0 + PARTICLE_HOLE_WIDTH / 2.0,
                               SG_DEVICE_HEIGHT / 4.0);
}

Point2D SternGerlachDevice::bottomExitPosition() const {
    return position_ + Point2D(SG_DEVICE_WIDTH / 2.0 + PARTICLE_HOLE_WIDTH / 2.0,
                               -SG_DEVICE_HEIGHT / 4.0);
}

// =============================================================================
// MeasurementLine
// =============================================================================

MeasurementLine::MeasurementLine(double x, bool active)
    : x_(x), initially_active_(active), active_(active) {}

void MeasurementLine::setActive(bool active) {
    active_ = active;
    state_ = LineMeasurementState::NOT_MEASURED;
    timer_ = 0.0;
}

void MeasurementLine::recordCrossing(const Vector3D& spin) {
    if (!active_) return;
    spin_ = spin;
    crossings_++;
    state_ = LineMeasurementState::MEASURING;
    timer_ = MEASUREMENT_LINE_TIMEOUT;
}

void MeasurementLine::step(double dt) {
    if (state_ != LineMeasurementState::MEASURING) return;
    timer_ -= dt;
    if (timer_ <= 0.0) {
        timer_ = 0.0;
        state_ = LineMeasurementState::MEASURED;
    }
}

void MeasurementLine::reset() {
    active_ = initially_active_;
    state_ = LineMeasurementState::NOT_MEASURED;
    spin_ = Vector3D(0, 0, 1);
    timer_ = 0.0;
    crossings_ = 0;
}

// =============================================================================
// SternGerlachExperiment
// =============================================================================

std::vector<SternGerlachDeviceConfig> SternGerlachExperiment::presetStages(SpinExperimentPreset preset) {
    switch (preset) {
        case SpinExperimentPreset::EXPERIMENT_1:
            return {stage(DeviceOrientation::Z, true)};
        case SpinExperimentPreset::EXPERIMENT_2:
            return {stage(DeviceOrientation::X, true)};
        case SpinExperimentPreset::EXPERIMENT_3:
            return {stage(DeviceOrientation::Z, true), stage(DeviceOrientation::X, true)};
        case SpinExperimentPreset::EXPERIMENT_4:
            return {stage(DeviceOrientation::Z, true), stage(DeviceOrientation::Z, true)};
        case SpinExperimentPreset::EXPERIMENT_5:
            return {stage(DeviceOrientation::X, true), stage(DeviceOrientation::Z, true)};
        case SpinExperimentPreset::EXPERIMENT_6:
            return {stage(DeviceOrientation::X, true), stage(DeviceOrientation::X, true)};
        case SpinExperimentPreset::CUSTOM:
            return {stage(DeviceOrientation::X, true), stage(DeviceOrientation::Z, true)};
    }
    return {};
}

std::string SternGerlachExperiment::presetName(SpinExperimentPreset preset) {
    switch (preset) {
        case SpinExperimentPreset::EXPERIMENT_1: return "Experiment 1 [SGz]";
        case SpinExperimentPreset::EXPERIMENT_2: return "Experiment 2 [SGx]";
        case SpinExperimentPreset::EXPERIMENT_3: return "Experiment 3 [Sz, Sx]";
        case SpinExperimentPreset::EXPERIMENT_4: return "Experiment 4 [Sz, Sz]";
        case SpinExperimentPreset::EXPERIMENT_5: return "Experiment 5 [Sx, Sz]";
        case SpinExperimentPreset::EXPERIMENT_6: return "Experiment 6 [Sx, Sx]";
        case SpinExperimentPreset::CUSTOM:       return "Custom";
    }
    return "Unknown";
}

SternGerlachExperiment::SternGerlachExperiment(const Config& config)
    : config_(config), random_(config.seed),
      source_vector_(0, 0, 1),
      source_mode_(config.source_mode),
      particle_amount_(1.0),
      blocking_mode_(config.blocking_mode) {
    if (config.stages.empty() || config.stages.size() > MAX_STAGES) {
        throw InvalidConfigurationError("Stern-Gerlach experiment needs 1 or 2 stages, got " +
                                        std::to_string(config.stages.size()));
    }

    const double entrances[MAX_STAGES] = {SG_STAGE1_X, SG_STAGE2_X};
    devices_.reserve(config.stages.size());
    for (std::size_t i = 0; i < config.stages.size(); ++i) {
        devices_.emplace_back(config.stages[i], deviceCenterForEntrance(entrances[i]));
    }
    for (double x : MEASUREMENT_LINE_X) {
        lines_.emplace_back(x);
    }

    if (config.source_direction == StateDirection::CUSTOM) {
        setSourceDirection(config.custom_source_direction);
    } else {
        setSourceDirection(config.source_direction);
    }
    setParticleAmount(config.particle_amount);
}

void SternGerlachExperiment::setSourceDirection(StateDirection direction) {
    if (direction == StateDirection::CUSTOM) {
        setSourceDirection(config_.custom_source_direction);
        return;
    }
    source_vector_ = directionToVector(direction);
}

void SternGerlachExperiment::setSourceDirection(const Vector3D& direction) {
    if (direction.norm() < 1e-12) {
        throw InvalidConfigurationError("source spin direction must be non-zero");
    }
    source_vector_ = direction.normalized();
}

void SternGerlachExperiment::setSourceMode(SourceMode mode) {
    source_mode_ = mode;
    emission_accumulator_ = 0.0;
}

void SternGerlachExperiment::setParticleAmount(double amount) {
    if (!(amount >= 0.0 && amount <= 1.0)) {
        std::ostringstream msg;
        msg << "particle amount " << amount << " outside [0, 1]";
        throw InvalidConfigurationError(msg.str());
    }
    particle_amount_ = amount;
}

const SternGerlachDevice& SternGerlachExperiment::device(std::size_t index) const {
    if (index >= devices_.size()) {
        throw std::out_of_range("Stern-Gerlach stage index out of range");
    }
    return devices_[index];
}

SternGerlachDevice& SternGerlachExperiment::device(std::size_t index) {
    if (index >= devices_.size()) {
        throw std::out_of_range("Stern-Gerlach stage index out of range");
    }
    return devices_[index];
}

void SternGerlachExperiment::recordStageOutcome(std::size_t stage, bool up,
                                                const std::optional<bool>& stage1_up) {
    devices_[stage].recordOutcome(up);
    if (stage != 1 || !stage1_up) return;

    BranchCounts& branch = *stage1_up ? stage2_after_up_ : stage2_after_down_;
    if (up) {
        branch.up++;
    } else {
        branch.down++;
    }
}

const MeasurementLine& SternGerlachExperiment::measurementLine(std::size_t index) const {
    if (index >= lines_.size()) {
        throw std::out_of_range("measurement line index out of range");
    }
    return lines_[index];
}

MeasurementLine& SternGerlachExperiment::measurementLine(std::size_t index) {
    if (index >= lines_.size()) {
        throw std::out_of_range("measurement line index out of range");
    }
    return lines_[index];
}

bool SternGerlachExperiment::isBlocked(bool stage1_up) const {
    switch (blocking_mode_) {
        case BlockingMode::NO_BLOCKER: return false;
        case BlockingMode::BLOCK_UP:   return stage1_up;
        case BlockingMode::BLOCK_DOWN: return !stage1_up;
    }
    return false;
}

// =============================================================================
// Immediate measurement
// =============================================================================

ChainResult SternGerlachExperiment::measureChain() {
    return measureChain(source_vector_);
}

ChainResult SternGerlachExperiment::measureChain(const Vector3D& incoming) {
    ChainResult chain;
    Vector3D direction = incoming;
    std::optional<bool> stage1_up;

    for (std::size_t i = 0; i < devices_.size(); ++i) {
        StageResult result = devices_[i].measure(direction, random_);
        chain.stages.push_back(result);
        if (!result.measured) continue;

        recordStageOutcome(i, result.up, stage1_up);
        direction = result.output_direction;
        if (i == 0) {
            stage1_up = result.up;
        }

        if (i == 0 && isBlocked(result.up)) {
            chain.blocked = true;
            blocked_count_++;
            break;
        }
    }
    return chain;
}

ExpectedProbabilities SternGerlachExperiment::expectedUpProbabilities() {
    ExpectedProbabilities expected;
    SternGerlachDevice& first = devices_[0];
    expected.stage1_up = first.prepare(source_vector_);

    if (devices_.size() > 1) {
        SternGerlachDevice& second = devices_[1];
        if (first.isActive()) {
            expected.stage2_up_after_up = spinUpProbability(first.measurementAxis(),
                                                            second.measurementAxis());
            expected.stage2_up_after_down = spinUpProbability(first.oppositeAxis(),
                                                              second.measurementAxis());
        } else {
            // Stage 1 passes the source through unchanged
            expected.stage2_up_after_up = spinUpProbability(source_vector_,
                                                            second.measurementAxis());
            expected.stage2_up_after_down = expected.stage2_up_after_up;
        }
    }
    return expected;
}

// =============================================================================
// Particle kinematics
// =============================================================================

void SternGerlachExperiment::shootSingleParticle() {
    emitParticle(true);
}

void SternGerlachExperiment::emitParticle(bool single) {
    SpinParticle particle;
    particle.position = Point2D(0.0, 0.0);
    particle.velocity = Directions::RIGHT * SPIN_PARTICLE_SPEED;
    particle.spin = source_vector_;
    particle.segment_spins.push_back(source_vector_);
    particle.single = single;
    particles_.push_back(particle);
}

void SternGerlachExperiment::emitParticles(double dt) {
    if (source_mode_ != SourceMode::CONTINUOUS) return;

    emission_accumulator_ += particle_amount_ * MAX_PARTICLE_CREATION_RATE * dt;
    while (emission_accumulator_ >= 1.0) {
        emitParticle(false);
        emission_accumulator_ -= 1.0;
    }
}

void SternGerlachExperiment::advanceParticle(SpinParticle& particle, double dt,
                                             std::vector<StageEvent>& events,
                                             int& blocked, int& retired, bool& remove) {
    enum class Waypoint { ENTRANCE, EXIT, RETIRE };

    double remaining = dt;
    while (remaining > 0.0 && !remove) {
        Waypoint waypoint;
        double target_x;
        if (particle.exiting) {
            waypoint = Waypoint::EXIT;
            target_x = particle.exit_target.x;
        } else if (particle.next_stage < devices_.size()) {
            waypoint = Waypoint::ENTRANCE;
            target_x = devices_[particle.next_stage].entrancePosition().x;
        } else {
            waypoint = Waypoint::RETIRE;
            target_x = SG_DETECTION_X;
        }

        double time_to_waypoint = std::max(0.0, (target_x - particle.position.x) / particle.velocity.x);
        if (time_to_waypoint > remaining) {
            particle.position = particle.position + particle.velocity * remaining;
            break;
        }

        particle.position = particle.position + particle.velocity * time_to_waypoint;
        remaining -= time_to_waypoint;

        switch (waypoint) {
            case Waypoint::ENTRANCE: {
                const SternGerlachDevice& device = devices_[particle.next_stage];
                StageResult result = device.measure(particle.spin, random_);
                particle.segment_spins.push_back(result.output_direction);
                if (!result.measured) {
                    particle.next_stage++;
                    break;
                }
                events.push_back({particle.next_stage, result.up, particle.stage1_up});
                particle.spin = result.output_direction;
                particle.last_up = result.up;
                if (particle.next_stage == 0) {
                    particle.stage1_up = result.up;
                }
                particle.exiting = particle.next_stage;
                particle.exit_target = result.up ? device.topExitPosition() : device.bottomExitPosition();
                particle.velocity = (particle.exit_target - particle.position).normalized() * SPIN_PARTICLE_SPEED;
                break;
            }
            case Waypoint::EXIT: {
                std::size_t stage_index = *particle.exiting;
                particle.position = particle.exit_target;
                particle.velocity = Directions::RIGHT * SPIN_PARTICLE_SPEED;
                particle.exiting.reset();
                particle.next_stage = stage_index + 1;
                if (stage_index == 0 && isBlocked(particle.last_up)) {
                    blocked++;
                    remove = true;
                }
                break;
            }
            case Waypoint::RETIRE:
                retired++;
                remove = true;
                break;
        }
    }
}

void SternGerlachExperiment::findLineCrossings(const SpinParticle& particle, double x_before,
                                               std::vector<LineCrossing>& crossings) const {
    if (!particle.single || particle.segment_spins.empty()) return;

    for (std::size_t i = 0; i < lines_.size(); ++i) {
        const double x = lines_[i].position();
        if (x_before < x && !lines_[i].isParticleBehind(particle.position)) {
            std::size_t segment = std::min(i, particle.segment_spins.size() - 1);
            crossings.push_back({i, particle.segment_spins[segment]});
        }
    }
}

void SternGerlachExperiment::step(double dt) {
    if (dt <= 0.0) return;

    emitParticles(dt);

    // Outcomes are committed after every particle has moved
    std::vector<StageEvent> events;
    std::vector<LineCrossing> crossings;
    int blocked = 0;
    int retired = 0;

    std::vector<SpinParticle> survivors;
    survivors.reserve(particles_.size());
    for (auto& particle : particles_) {
        bool remove = false;
        const double x_before = particle.position.x;
        advanceParticle(particle, dt, events, blocked, retired, remove);
        findLineCrossings(particle, x_before, crossings);
        if (!remove) {
            survivors.push_back(particle);
        }
    }

    particles_.swap(survivors);
    for (const auto& event : events) {
        recordStageOutcome(event.stage, event.up, event.stage1_up);
    }
    blocked_count_ += blocked;
    retired_count_ += retired;

    for (auto& line : lines_) {
        line.step(dt);
    }
    for (const auto& crossing : crossings) {
        lines_[crossing.line].recordCrossing(crossing.spin);
    }
}

void SternGerlachExperiment::reset() {
    particles_.clear();
    emission_accumulator_ = 0.0;
    blocked_count_ = 0;
    retired_count_ = 0;
    stage2_after_up_ = BranchCounts();
    stage2_after_down_ = BranchCounts();
    for (auto& line : lines_) {
        line.reset();
    }
    random_.reseed(config_.seed);

    for (std::size_t i = 0; i < devices_.size(); ++i) {
        devices_[i].resetCounts();
        devices_[i].setActive(config_.stages[i].active);
    }

    source_mode_ = config_.source_mode;
    blocking_mode_ = config_.blocking_mode;
    particle_amount_ = config_.particle_amount;
    setSourceDirection(config_.source_direction);
}

// =============================================================================
// Parsing helpers
// =============================================================================

DeviceOrientation parseDeviceOrientation(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "z" || t == "sgz") return DeviceOrientation::Z;
    if (t == "x" || t == "sgx") return DeviceOrientation::X;
    if (t == "custom") return DeviceOrientation::CUSTOM;
    throw InvalidConfigurationError("unknown device orientation '" + text + "'");
}

BlockingMode parseBlockingMode(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "none" || t == "no_blocker") return BlockingMode::NO_BLOCKER;
    if (t == "up" || t == "block_up") return BlockingMode::BLOCK_UP;
    if (t == "down" || t == "block_down") return BlockingMode::BLOCK_DOWN;
    throw InvalidConfigurationError("unknown blocking mode '" + text + "'");
}

SourceMode parseSourceMode(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "single") return SourceMode::SINGLE;
    if (t == "continuous") return SourceMode::CONTINUOUS;
    throw InvalidConfigurationError("unknown source mode '" + text + "'");
}

SpinExperimentPreset parseSpinExperimentPreset(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "1" || t == "experiment_1") return SpinExperimentPreset::EXPERIMENT_1;
    if (t == "2" || t == "experiment_2") return SpinExperimentPreset::EXPERIMENT_2;
    if (t == "3" || t == "experiment_3") return SpinExperimentPreset::EXPERIMENT_3;
    if (t == "4" || t == "experiment_4") return SpinExperimentPreset::EXPERIMENT_4;
    if (t == "5" || t == "experiment_5") return SpinExperimentPreset::EXPERIMENT_5;
    if (t == "6" || t == "experiment_6") return SpinExperimentPreset::EXPERIMENT_6;
    if (t == "custom") return SpinExperimentPreset::CUSTOM;
    throw InvalidConfigurationError("unknown spin experiment preset '" + text + "'");
}

} // namespace QMSIM
