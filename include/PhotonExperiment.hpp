/**
 * @file PhotonExperiment.hpp
 * @brief Laser source and per-frame photon propagation
 *
 * Default layout (model space, meters):
 *
 *                 vertical detector (0, 0.2), faces up
 *                        |
 *   laser (-0.15, 0) --> PBS (0, 0) --> mirror (0.125, 0)
 *                                              |
 *                          horizontal detector (0.125, -0.075), faces down
 *
 * Each frame every in-flight photon is tested against all elements. For
 * every candidate trajectory the nearest crossing (smallest t) wins; the
 * candidate moves to the crossing, takes the element's effect and spends
 * the rest of the frame on its new course. Detector crossings are then
 * resolved in order of t by sampling against the candidate weight: a
 * click collapses the photon onto that detector, a miss removes the
 * candidate and renormalizes the rest. Candidates that leave the field
 * are resolved the same way against the environment (ABSORBED).
 * Detector counts of a frame are committed when the frame ends.
 */

#ifndef PHOTON_EXPERIMENT_HPP
#define PHOTON_EXPERIMENT_HPP

#include "OpticalElement.hpp"
#include "Photon.hpp"
#include "QMSIM.hpp"
#include "RandomSource.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace QMSIM {

enum class PhotonEmissionMode {
    SINGLE_PHOTON,
    MANY_PHOTONS
};

PhotonEmissionMode parsePhotonEmissionMode(const std::string& text);

// =============================================================================
// Laser
// =============================================================================

class Laser {
public:
    Laser(const Point2D& position, PhotonEmissionMode mode);

    PhotonEmissionMode emissionMode() const { return mode_; }
    const Point2D& position() const { return position_; }
    const Point2D& emissionDirection() const { return Directions::RIGHT; }

    void setEmissionRate(double photons_per_second);
    double emissionRate() const { return emission_rate_; }

    void setPolarizationPreset(PolarizationPreset preset) { preset_ = preset; }
    PolarizationPreset polarizationPreset() const { return preset_; }
    void setCustomPolarizationAngle(double degrees) { custom_angle_ = degrees; }
    double customPolarizationAngle() const { return custom_angle_; }

    /// Polarization of emitted photons in degrees
    double polarizationAngle() const;

    /// Number of photons due this frame (many-photon mode)
    int step(double dt);

    /// New photon at the laser with a random lateral offset inside the beam
    Photon createPhoton(std::uint64_t id, RandomSource& random) const;

    void reset();

private:
    Point2D position_;
    PhotonEmissionMode mode_;
    double emission_rate_ = 0.0;
    double emission_accumulator_ = 0.0;
    PolarizationPreset preset_ = PolarizationPreset::FORTY_FIVE_DEGREES;
    double custom_angle_ = 45.0;
};

// =============================================================================
// PhotonExperiment
// =============================================================================

class PhotonExperiment {
public:
    struct Config {
        PhotonEmissionMode emission_mode = PhotonEmissionMode::MANY_PHOTONS;
        double emission_rate = 0.0;                       ///< photons/s, many-photon mode
        PolarizationPreset polarization = PolarizationPreset::FORTY_FIVE_DEGREES;
        double custom_polarization_angle = 45.0;          ///< degrees
        double splitter_axis_angle = 0.0;                 ///< degrees
        double field_half_extent = SimulationConstants::FIELD_HALF_EXTENT;
        std::uint64_t seed = RandomSource::DEFAULT_SEED;
    };

    // Element indices
    static constexpr int SPLITTER_INDEX = 0;
    static constexpr int MIRROR_INDEX = 1;
    static constexpr int HORIZONTAL_DETECTOR_INDEX = 2;
    static constexpr int VERTICAL_DETECTOR_INDEX = 3;

    explicit PhotonExperiment(const Config& config);

    /// Emit one photon now; false when MAX_PHOTONS are already in flight
    bool emitPhoton();

    /// Emit (many-photon mode), propagate, resolve detections, commit counts
    void step(double dt);

    void setPlaying(bool playing) { playing_ = playing; }
    bool isPlaying() const { return playing_; }

    /// In single-photon mode a polarization change clears photons and counts
    void setPolarizationPreset(PolarizationPreset preset);
    void setCustomPolarizationAngle(double degrees);

    /**
     * @brief (H - V) / (H + V) from counts (single photon) or rates (many photons)
     *
     * 0 when nothing has been detected.
     */
    double normalizedOutcomeValue() const;

    /// Expected fraction of photons reaching the horizontal detector
    double expectedHorizontalFraction() const;

    void reset();

    const std::vector<Photon>& photons() const { return photons_; }
    const std::vector<std::unique_ptr<OpticalElement>>& elements() const { return elements_; }

    Laser& laser() { return laser_; }
    const Laser& laser() const { return laser_; }
    const PolarizingBeamSplitter& splitter() const;
    PolarizingBeamSplitter& splitter();
    const Mirror& mirror() const;
    const PhotonDetector& horizontalDetector() const;
    const PhotonDetector& verticalDetector() const;

    std::uint64_t launchedCount() const { return launched_; }
    std::uint64_t detectedCount() const { return detected_; }
    std::uint64_t absorbedCount() const { return absorbed_; }
    std::uint64_t droppedEmissions() const { return dropped_emissions_; }
    std::uint64_t discardedCount() const { return discarded_; }

    /// Weight of every launched photon: resolved or discarded (1 each) plus in flight
    double totalTrackedWeight() const;

private:
    struct PendingResolution {
        TrajectoryLabel label;
        int element;     ///< -1 for the environment
        double t;
    };

    void propagatePhoton(Photon& photon, double dt, std::vector<int>& frame_detections,
                         std::uint64_t& frame_absorbed);
    bool isOutsideField(const Point2D& p) const;
    void clearPhotonsAndCounts();
    PhotonDetector& detector(int index);

    Config config_;
    RandomSource random_;
    Laser laser_;
    std::vector<std::unique_ptr<OpticalElement>> elements_;

    std::vector<Photon> photons_;
    bool playing_ = true;

    std::uint64_t next_photon_id_ = 0;
    std::uint64_t launched_ = 0;
    std::uint64_t detected_ = 0;
    std::uint64_t absorbed_ = 0;
    std::uint64_t dropped_emissions_ = 0;
    std::uint64_t discarded_ = 0;
};

} // namespace QMSIM

#endif // PHOTON_EXPERIMENT_HPP
