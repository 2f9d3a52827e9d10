#ifndef QMSIM_HPP
#define QMSIM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <functional>

namespace QMSIM {

// Forward declarations
class Simulator;
class RandomSource;
class TwoOutcomeSystem;
class TwoOutcomeEnsemble;
class CoinSet;
class CoinExperimentScene;
class BlochState;
class BlochSphereExperiment;
class SternGerlachDevice;
class SternGerlachExperiment;
class Photon;
class OpticalElement;
class PhotonExperiment;

// Enumerations
enum class ExperimentKind {
    COINS,
    BLOCH_SPHERE,
    STERN_GERLACH,
    PHOTONS
};

enum class SystemType {
    CLASSICAL,
    QUANTUM
};

enum class ExperimentMeasurementState {
    READY_TO_BE_MEASURED,
    PREPARING_TO_BE_MEASURED,
    MEASURED_AND_HIDDEN,
    REVEALED
};

// =============================================================================
// Simulation Constants
// =============================================================================
namespace SimulationConstants {
    constexpr double PI = 3.14159265358979323846;
    constexpr double TWO_PI = 2.0 * PI;

    // Numerical tolerances
    constexpr double AMPLITUDE_TOLERANCE = 1e-9;          // |alpha|^2 + |beta|^2 - 1
    constexpr double SNAP_TOLERANCE = 1e-12;              // cardinal axis cleanup

    // Coin experiments
    constexpr double MEASUREMENT_PREPARATION_TIME = 1.0;  // s
    constexpr std::array<std::size_t, 3> MULTI_COIN_EXPERIMENT_QUANTITIES = {10, 100, 10000};
    constexpr std::size_t DEFAULT_MULTI_COIN_QUANTITY = 100;

    // Bloch sphere experiments
    constexpr std::size_t MULTI_MEASUREMENT_SPHERE_COUNT = 10;
    constexpr double MAX_TIME_TO_MEASUREMENT = 1.0;       // s

    // Stern-Gerlach apparatus (model space, meters)
    constexpr double SG_DEVICE_WIDTH = 0.75;
    constexpr double SG_DEVICE_HEIGHT = 0.5;
    constexpr double SG_STAGE1_X = 0.5;                   // entrance of stage 1
    constexpr double SG_STAGE2_X = 2.0;                   // entrance of stage 2
    constexpr double SG_DETECTION_X = 4.0;                // particles retire here
    constexpr double SPIN_PARTICLE_SPEED = 1.0;           // m/s
    constexpr double MAX_PARTICLE_CREATION_RATE = 300.0;  // particles/s at amount 1
    constexpr std::array<double, 3> MEASUREMENT_LINE_X = {0.25, 1.6, 3.5};
    constexpr double MEASUREMENT_LINE_TIMEOUT = 1.0;      // s in MEASURING after a crossing

    // Photon experiments
    constexpr double PHOTON_SPEED = 0.3;                  // m/s
    constexpr double PHOTON_BEAM_WIDTH = 0.04;            // m
    constexpr double MAX_PHOTON_EMISSION_RATE = 200.0;    // photons/s
    constexpr std::size_t MAX_PHOTONS = 800;
    constexpr double DETECTOR_APERTURE = PHOTON_BEAM_WIDTH * 1.75;
    constexpr double DETECTION_RATE_TIME_CONSTANT = 2.0;  // s
    constexpr double FIELD_HALF_EXTENT = 1.0;             // m
}

// Driver configuration
struct SimulationConfig {
    ExperimentKind experiment = ExperimentKind::COINS;

    double dt = 1.0 / 60.0;            // frame time step (s)
    double max_dt = 1.0 / 30.0;        // frames longer than this are clamped
    int max_steps = 600;
    int report_interval = 100;
    int trials = 100;                  // repeated prepare/measure cycles

    std::uint64_t seed = 5489u;
};

} // namespace QMSIM

#endif // QMSIM_HPP
