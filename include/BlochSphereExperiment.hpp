/**
 * @file BlochSphereExperiment.hpp
 * @brief Preparation, precession and measurement of Bloch-sphere states
 *
 * A preparation state is copied into one single-measurement state and ten
 * multi-measurement states. In the precession scene the measured states
 * rotate about z at a rate equal to the magnetic field strength. observe()
 * measures them in the selected basis, collapses each one and accumulates
 * up/down counts; reprepare() restores the prepared direction.
 */

#ifndef BLOCH_SPHERE_EXPERIMENT_HPP
#define BLOCH_SPHERE_EXPERIMENT_HPP

#include "BlochState.hpp"
#include "QMSIM.hpp"
#include "RandomSource.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace QMSIM {

enum class BlochSphereScene {
    MEASUREMENT,
    PRECESSION
};

enum class SpinMeasurementState {
    PREPARED,
    TIMING_OBSERVATION,
    OBSERVED
};

class BlochSphereExperiment {
public:
    struct Config {
        StateDirection initial_direction = StateDirection::Z_PLUS;
        BlochSphereScene scene = BlochSphereScene::MEASUREMENT;
        double magnetic_field_strength = 1.0;   ///< [-1, 1], rad/s of precession
        MeasurementAxis measurement_basis = MeasurementAxis::Z;
        bool single_measurement_mode = true;
        double time_to_measurement = 0.0;       ///< [0, 1] s
        std::uint64_t seed = RandomSource::DEFAULT_SEED;
    };

    explicit BlochSphereExperiment(const Config& config);

    // Preparation -----------------------------------------------------------

    /// Cardinal directions set the preparation angles; CUSTOM keeps them
    void selectStateDirection(StateDirection direction);
    StateDirection selectedStateDirection() const { return selected_direction_; }

    /// Arbitrary preparation angles; selects CUSTOM
    void setPreparationAngles(double polar_angle, double azimuthal_angle);
    const BlochState& preparationState() const { return preparation_; }

    double upCoefficient() const;     ///< cos(polar/2)
    double downCoefficient() const;   ///< sin(polar/2)
    double phaseFactor() const;       ///< azimuthal / pi

    // Scene and measurement settings ----------------------------------------

    void setScene(BlochSphereScene scene);
    BlochSphereScene scene() const { return scene_; }

    void setMagneticFieldStrength(double strength);
    double magneticFieldStrength() const { return magnetic_field_strength_; }

    /// Changing the basis clears the counts
    void setMeasurementBasis(MeasurementAxis basis);
    MeasurementAxis measurementBasis() const { return measurement_basis_; }

    void setSingleMeasurementMode(bool single);
    bool isSingleMeasurementMode() const { return single_measurement_mode_; }

    void setTimeToMeasurement(double seconds);
    double timeToMeasurement() const { return time_to_measurement_; }

    // Measurement -----------------------------------------------------------

    /// Measure the active state(s) if ready; no-op otherwise
    void observe();

    /// Observe after timeToMeasurement() of step() time
    void startTimedObservation();

    /// Copy the preparation angles into the measured states and become ready
    void reprepare();

    void step(double dt);
    void reset();

    bool isReadyToObserve() const { return ready_to_observe_; }
    SpinMeasurementState measurementState() const { return measurement_state_; }
    int upCount() const { return up_count_; }
    int downCount() const { return down_count_; }

    const BlochState& singleMeasurementState() const { return single_state_; }
    const std::vector<BlochState>& multiMeasurementStates() const { return multi_states_; }

private:
    void propagatePreparation();
    void updatePrecessionRates();
    void measureState(BlochState& state);
    void resetCounts();

    Config config_;
    RandomSource random_;

    BlochState preparation_;
    BlochState single_state_;
    std::vector<BlochState> multi_states_;

    StateDirection selected_direction_;
    BlochSphereScene scene_;
    double magnetic_field_strength_;
    MeasurementAxis measurement_basis_;
    bool single_measurement_mode_;
    double time_to_measurement_;

    bool ready_to_observe_ = true;
    SpinMeasurementState measurement_state_ = SpinMeasurementState::PREPARED;
    double observation_timer_ = 0.0;

    int up_count_ = 0;
    int down_count_ = 0;
};

BlochSphereScene parseBlochSphereScene(const std::string& text);

} // namespace QMSIM

#endif // BLOCH_SPHERE_EXPERIMENT_HPP
