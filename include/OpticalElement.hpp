/**
 * @file OpticalElement.hpp
 * @brief Stationary optical elements of the photon experiment
 *
 * Each element is a line segment. testForInteraction() sweeps every
 * candidate trajectory of a photon over one time step (position to
 * position + direction * speed * dt) and reports, per trajectory label,
 * whether the sweep crosses the element and what the crossing does:
 *
 * - Mirror: reflects into a fixed direction
 * - PolarizingBeamSplitter: splits into a transmitted HORIZONTAL branch
 *   with weight cos^2(delta) and a reflected VERTICAL branch with weight
 *   sin^2(delta), delta = photon polarization - splitter axis
 * - PhotonDetector: reports a detection candidate
 *
 * Elements never mutate photons; the experiment applies the results.
 */

#ifndef OPTICAL_ELEMENT_HPP
#define OPTICAL_ELEMENT_HPP

#include "Geometry.hpp"
#include "Photon.hpp"
#include "QMSIM.hpp"
#include <map>
#include <string>
#include <vector>

namespace QMSIM {

enum class OpticalElementKind {
    MIRROR,
    BEAM_SPLITTER,
    DETECTOR
};

enum class InteractionType {
    NONE,
    REFLECTED,
    SPLIT,
    DETECTED
};

struct SplitBranch {
    TrajectoryLabel label;
    Point2D direction;
    double probability;
};

struct InteractionResult {
    InteractionType type = InteractionType::NONE;
    Point2D point;                       ///< crossing point
    double t = 1.0;                      ///< fraction of the step at the crossing
    Point2D reflection_direction;        ///< REFLECTED
    std::vector<SplitBranch> branches;   ///< SPLIT
};

using InteractionMap = std::map<TrajectoryLabel, InteractionResult>;

// =============================================================================
// OpticalElement
// =============================================================================

class OpticalElement {
public:
    virtual ~OpticalElement() = default;

    OpticalElementKind kind() const { return kind_; }
    const LineSegment& geometry() const { return geometry_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Test every in-flight candidate of a photon for a crossing
     * @param element_index index of this element in the experiment; a
     *        candidate whose last_element matches is skipped
     *
     * Only crossings are reported; labels without one are absent.
     */
    InteractionMap testForInteraction(const Photon& photon, double dt, int element_index) const;

protected:
    OpticalElement(OpticalElementKind kind, const LineSegment& geometry, const std::string& name);

    /// Effect of a crossing for one candidate
    virtual InteractionResult interact(const Photon& photon, const CandidateTrajectory& candidate,
                                       const SegmentIntersection& hit) const = 0;

private:
    OpticalElementKind kind_;
    LineSegment geometry_;
    std::string name_;
};

// =============================================================================
// Mirror
// =============================================================================

class Mirror : public OpticalElement {
public:
    static constexpr double DEFAULT_LENGTH = 0.095;   // m

    /**
     * @param center mirror center
     * @param length mirror length
     * @param surface_angle angle of the mirror surface (radians, ccw from +x)
     * @param reflection_direction outgoing direction after reflection
     */
    Mirror(const Point2D& center, double length = DEFAULT_LENGTH,
           double surface_angle = -SimulationConstants::PI / 4.0,
           const Point2D& reflection_direction = Directions::DOWN);

    const Point2D& reflectionDirection() const { return reflection_direction_; }

protected:
    InteractionResult interact(const Photon& photon, const CandidateTrajectory& candidate,
                               const SegmentIntersection& hit) const override;

private:
    Point2D reflection_direction_;
};

// =============================================================================
// PolarizingBeamSplitter
// =============================================================================

enum class PolarizationPreset {
    HORIZONTAL,
    VERTICAL,
    FORTY_FIVE_DEGREES,
    CUSTOM
};

/// Angle of a preset in degrees; CUSTOM returns custom_angle
double polarizationPresetAngle(PolarizationPreset preset, double custom_angle);
PolarizationPreset parsePolarizationPreset(const std::string& text);

class PolarizingBeamSplitter : public OpticalElement {
public:
    static constexpr double DEFAULT_SIZE = 0.1;   // m, square side

    /**
     * @param center splitter center; the polarizing surface is its
     *        lower-left to upper-right diagonal
     * @param axis_angle polarization passed straight through (degrees)
     */
    explicit PolarizingBeamSplitter(const Point2D& center, double axis_angle = 0.0,
                                    double size = DEFAULT_SIZE);

    double axisAngle() const { return axis_angle_; }
    void setAxisAngle(double degrees) { axis_angle_ = degrees; }
    const Point2D& center() const { return center_; }

    /// Transmitted (horizontal path) probability for a polarization angle in degrees
    double transmissionProbability(double polarization_angle) const;

protected:
    InteractionResult interact(const Photon& photon, const CandidateTrajectory& candidate,
                               const SegmentIntersection& hit) const override;

private:
    Point2D center_;
    double axis_angle_;
};

// =============================================================================
// PhotonDetector
// =============================================================================

enum class DetectionDirection {
    UP,
    DOWN
};

/**
 * @brief Exponential moving average of an event rate
 *
 * Each step the instantaneous rate events/dt is blended in with weight
 * 1 - exp(-dt / time_constant).
 */
class DetectionRateAverager {
public:
    explicit DetectionRateAverager(double time_constant);

    void countEvents(int events) { pending_events_ += events; }
    void step(double dt);
    void reset();
    double rate() const { return rate_; }

private:
    double time_constant_;
    double rate_ = 0.0;
    int pending_events_ = 0;
};

class PhotonDetector : public OpticalElement {
public:
    PhotonDetector(const Point2D& position, DetectionDirection direction,
                   const std::string& name,
                   double aperture = SimulationConstants::DETECTOR_APERTURE);

    DetectionDirection detectionDirection() const { return direction_; }
    /// Unit vector a photon must travel along to be detected
    Point2D facing() const;
    const Point2D& position() const { return position_; }

    /// Credit committed detections and update the rate average
    void commitDetections(int events);
    void step(double dt) { averager_.step(dt); }

    int detectionCount() const { return count_; }
    double detectionRate() const { return averager_.rate(); }
    void resetDetectionCount() { count_ = 0; }
    void reset();

protected:
    InteractionResult interact(const Photon& photon, const CandidateTrajectory& candidate,
                               const SegmentIntersection& hit) const override;

private:
    Point2D position_;
    DetectionDirection direction_;
    int count_ = 0;
    DetectionRateAverager averager_;
};

} // namespace QMSIM

#endif // OPTICAL_ELEMENT_HPP
