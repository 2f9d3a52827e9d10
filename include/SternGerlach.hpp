/**
 * @file SternGerlach.hpp
 * @brief Stern-Gerlach devices and chained spin-measurement experiments
 *
 * A device is oriented along a measurement axis d. A particle with spin
 * direction s leaves through the top exit with probability
 *
 *   P(+) = cos^2(theta/2),  theta = angle(s, d)
 *
 * and its spin collapses onto +d (top) or -d (bottom). In a two-stage
 * experiment the second device receives the sampled output of the first.
 *
 * Layout (model space, meters, particles move along +x at 1 m/s):
 *
 *   source (0,0) -> stage 1 entrance (0.5) -> stage 2 entrance (2.0) -> retire (4.0)
 *
 * The blocker, when present, stops one branch at the stage 1 exit. Stage 2
 * keeps separate counts for particles arriving from the stage 1 top and
 * bottom exits, so P(up | stage 1 up) and P(up | stage 1 down) can be read
 * back independently.
 *
 * Three measurement lines (before stage 1, between the stages, after stage 2)
 * hold the spin of the last single particle that crossed them.
 */

#ifndef STERN_GERLACH_HPP
#define STERN_GERLACH_HPP

#include "Geometry.hpp"
#include "QMSIM.hpp"
#include "RandomSource.hpp"
#include "StateDirection.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace QMSIM {

enum class DeviceOrientation {
    Z,
    X,
    CUSTOM
};

enum class BlockingMode {
    NO_BLOCKER,
    BLOCK_UP,
    BLOCK_DOWN
};

enum class SourceMode {
    SINGLE,
    CONTINUOUS
};

enum class SpinExperimentPreset {
    EXPERIMENT_1,   ///< [SGz]
    EXPERIMENT_2,   ///< [SGx]
    EXPERIMENT_3,   ///< [SGz, SGx]
    EXPERIMENT_4,   ///< [SGz, SGz]
    EXPERIMENT_5,   ///< [SGx, SGz]
    EXPERIMENT_6,   ///< [SGx, SGx]
    CUSTOM          ///< [SGx, SGz], starting point for user-chosen stages
};

/**
 * @brief Construction parameters of one device
 *
 * `orientation` has no default; a device built without one is rejected.
 */
struct SternGerlachDeviceConfig {
    std::optional<DeviceOrientation> orientation;
    double custom_polar_angle = 0.0;       ///< CUSTOM only
    double custom_azimuthal_angle = 0.0;   ///< CUSTOM only
    bool active = true;
};

/// Result of one particle passing one stage
struct StageResult {
    bool measured = false;        ///< false for an inactive (pass-through) stage
    bool up = false;
    double up_probability = 0.0;
    Vector3D output_direction;
};

class SternGerlachDevice {
public:
    explicit SternGerlachDevice(const SternGerlachDeviceConfig& config,
                                const Point2D& position = Point2D());

    DeviceOrientation orientation() const { return orientation_; }
    const Vector3D& measurementAxis() const { return axis_; }
    Vector3D oppositeAxis() const { return -axis_; }

    bool isActive() const { return active_; }
    void setActive(bool active) { active_ = active; }

    /// Expected P(+) for an incoming direction; stored as upProbability()
    double prepare(const Vector3D& incoming);
    double upProbability() const { return up_probability_; }
    double downProbability() const { return 1.0 - up_probability_; }

    /// Sample one particle; inactive devices pass the direction through
    StageResult measure(const Vector3D& incoming, RandomSource& random) const;

    void recordOutcome(bool up);
    int upCount() const { return up_count_; }
    int downCount() const { return down_count_; }
    void resetCounts();

    const Point2D& position() const { return position_; }
    Point2D entrancePosition() const;
    Point2D topExitPosition() const;
    Point2D bottomExitPosition() const;

private:
    DeviceOrientation orientation_;
    Vector3D axis_;
    bool active_;
    Point2D position_;

    double up_probability_ = 0.5;
    int up_count_ = 0;
    int down_count_ = 0;
};

enum class LineMeasurementState {
    NOT_MEASURED,
    MEASURING,      ///< a particle crossed within the last MEASUREMENT_LINE_TIMEOUT
    MEASURED
};

/**
 * @brief Vertical line across the beam that records crossing spins
 *
 * Line i records the spin a particle carries on beam segment i: the source
 * spin, the stage 1 output, then the stage 2 output. Inactive lines ignore
 * crossings; switching a line on or off clears its measurement state.
 */
class MeasurementLine {
public:
    explicit MeasurementLine(double x, bool active = true);

    double position() const { return x_; }
    bool isParticleBehind(const Point2D& p) const { return p.x < x_; }

    bool isActive() const { return active_; }
    void setActive(bool active);

    void recordCrossing(const Vector3D& spin);
    void step(double dt);
    void reset();

    LineMeasurementState measurementState() const { return state_; }
    const Vector3D& spinState() const { return spin_; }
    int crossingCount() const { return crossings_; }

private:
    double x_;
    bool initially_active_;
    bool active_;
    LineMeasurementState state_ = LineMeasurementState::NOT_MEASURED;
    Vector3D spin_ = Vector3D(0, 0, 1);
    double timer_ = 0.0;
    int crossings_ = 0;
};

/// Particle in flight through the apparatus
struct SpinParticle {
    Point2D position;
    Point2D velocity;
    Vector3D spin;
    std::size_t next_stage = 0;            ///< index of the next device entrance
    std::optional<std::size_t> exiting;    ///< stage whose exit is being approached
    Point2D exit_target;
    bool last_up = false;
    std::optional<bool> stage1_up;         ///< unset until an active stage 1 measures it
    std::vector<Vector3D> segment_spins;   ///< spin on each beam segment so far
    bool single = false;                   ///< shot by shootSingleParticle()
};

/// Expected branch probabilities for the current source and devices
struct ExpectedProbabilities {
    double stage1_up = 0.0;
    double stage2_up_after_up = 0.0;
    double stage2_up_after_down = 0.0;
};

/// Stage 2 outcomes of particles that left one stage 1 exit
struct BranchCounts {
    int up = 0;
    int down = 0;

    int total() const { return up + down; }
    double upFraction() const { return total() == 0 ? 0.0 : static_cast<double>(up) / total(); }
};

struct ChainResult {
    std::vector<StageResult> stages;
    bool blocked = false;
};

class SternGerlachExperiment {
public:
    struct Config {
        std::vector<SternGerlachDeviceConfig> stages;
        StateDirection source_direction = StateDirection::Z_PLUS;
        Vector3D custom_source_direction = Vector3D(0, 0, 1);   ///< source_direction == CUSTOM
        SourceMode source_mode = SourceMode::SINGLE;
        double particle_amount = 1.0;                           ///< [0, 1] of the max rate
        BlockingMode blocking_mode = BlockingMode::NO_BLOCKER;
        std::uint64_t seed = RandomSource::DEFAULT_SEED;
    };

    /// Stage list of a preset
    static std::vector<SternGerlachDeviceConfig> presetStages(SpinExperimentPreset preset);
    static std::string presetName(SpinExperimentPreset preset);

    explicit SternGerlachExperiment(const Config& config);

    // Source ----------------------------------------------------------------

    void setSourceDirection(StateDirection direction);
    void setSourceDirection(const Vector3D& direction);
    Vector3D sourceVector() const { return source_vector_; }

    void setSourceMode(SourceMode mode);
    SourceMode sourceMode() const { return source_mode_; }

    void setParticleAmount(double amount);
    double particleAmount() const { return particle_amount_; }

    void setBlockingMode(BlockingMode mode) { blocking_mode_ = mode; }
    BlockingMode blockingMode() const { return blocking_mode_; }

    // Particles -------------------------------------------------------------

    /// Emit one particle from the source
    void shootSingleParticle();

    /**
     * @brief Send one particle through every stage immediately
     *
     * Device counts are updated; the blocker ends the chain after stage 1.
     */
    ChainResult measureChain();
    ChainResult measureChain(const Vector3D& incoming);

    /// Expected probabilities of stage 1 and, if present, stage 2 per stage 1 branch
    ExpectedProbabilities expectedUpProbabilities();

    /// Emit (continuous mode), move particles, measure at device entrances
    void step(double dt);

    void reset();

    std::size_t stageCount() const { return devices_.size(); }
    const SternGerlachDevice& device(std::size_t index) const;
    SternGerlachDevice& device(std::size_t index);
    const std::vector<SpinParticle>& particles() const { return particles_; }
    int blockedCount() const { return blocked_count_; }
    int retiredCount() const { return retired_count_; }

    /**
     * @brief Stage 2 counts of particles that left stage 1 up or down
     *
     * Only particles measured by an active stage 1 are split by branch;
     * device(1) still counts every stage 2 outcome.
     */
    const BranchCounts& stage2CountsAfter(bool stage1_up) const {
        return stage1_up ? stage2_after_up_ : stage2_after_down_;
    }

    std::size_t measurementLineCount() const { return lines_.size(); }
    const MeasurementLine& measurementLine(std::size_t index) const;
    MeasurementLine& measurementLine(std::size_t index);

private:
    struct StageEvent {
        std::size_t stage;
        bool up;
        std::optional<bool> stage1_up;
    };

    struct LineCrossing {
        std::size_t line;
        Vector3D spin;
    };

    void recordStageOutcome(std::size_t stage, bool up, const std::optional<bool>& stage1_up);

    bool isBlocked(bool stage1_up) const;
    void advanceParticle(SpinParticle& particle, double dt,
                         std::vector<StageEvent>& events, int& blocked, int& retired, bool& remove);
    void findLineCrossings(const SpinParticle& particle, double x_before,
                           std::vector<LineCrossing>& crossings) const;
    void emitParticle(bool single);
    void emitParticles(double dt);

    Config config_;
    RandomSource random_;
    std::vector<SternGerlachDevice> devices_;
    std::vector<MeasurementLine> lines_;

    Vector3D source_vector_;
    SourceMode source_mode_;
    double particle_amount_;
    BlockingMode blocking_mode_;

    std::vector<SpinParticle> particles_;
    double emission_accumulator_ = 0.0;
    int blocked_count_ = 0;
    int retired_count_ = 0;
    BranchCounts stage2_after_up_;
    BranchCounts stage2_after_down_;
};

DeviceOrientation parseDeviceOrientation(const std::string& text);
BlockingMode parseBlockingMode(const std::string& text);
SourceMode parseSourceMode(const std::string& text);
SpinExperimentPreset parseSpinExperimentPreset(const std::string& text);

} // namespace QMSIM

#endif // STERN_GERLACH_HPP
