#include "OpticalElement.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

double degreesToRadians(double degrees) {
    return degrees * PI / 180.0;
}

} // anonymous namespace

// =============================================================================
// OpticalElement
// =============================================================================

OpticalElement::OpticalElement(OpticalElementKind kind, const LineSegment& geometry,
                               const std::string& name)
    : kind_(kind), geometry_(geometry), name_(name) {
    if (geometry.length() < 1e-12) {
        throw InvalidConfigurationError("optical element '" + name + "' has zero length");
    }
}

InteractionMap OpticalElement::testForInteraction(const Photon& photon, double dt,
                                                  int element_index) const {
    InteractionMap results;
    if (!photon.isInFlight() || dt <= 0.0) {
        return results;
    }

    for (const auto& entry : photon.possibleStates()) {
        const CandidateTrajectory& candidate = entry.second;
        if (candidate.last_element == element_index) {
            continue;
        }

        Point2D end = candidate.position + candidate.direction * (PHOTON_SPEED * dt);
        auto hit = intersectSegments(candidate.position, end, geometry_.start, geometry_.end);
        if (!hit) {
            continue;
        }

        InteractionResult result = interact(photon, candidate, *hit);
        if (result.type == InteractionType::NONE) {
            continue;
        }
        result.point = hit->point;
        result.t = hit->t;
        results[entry.first] = result;
    }
    return results;
}

// =============================================================================
// Mirror
// =============================================================================

Mirror::Mirror(const Point2D& center, double length, double surface_angle,
               const Point2D& reflection_direction)
    : OpticalElement(OpticalElementKind::MIRROR,
                     LineSegment(center - Point2D(std::cos(surface_angle), std::sin(surface_angle)) * (length / 2.0),
                                 center + Point2D(std::cos(surface_angle), std::sin(surface_angle)) * (length / 2.0)),
                     "mirror"),
      reflection_direction_(reflection_direction.normalized()) {
    if (reflection_direction.norm() < 1e-12) {
        throw InvalidConfigurationError("mirror reflection direction must be non-zero");
    }
}

InteractionResult Mirror::interact(const Photon&, const CandidateTrajectory&,
                                   const SegmentIntersection&) const {
    InteractionResult result;
    result.type = InteractionType::REFLECTED;
    result.reflection_direction = reflection_direction_;
    return result;
}

// =============================================================================
// PolarizingBeamSplitter
// =============================================================================

double polarizationPresetAngle(PolarizationPreset preset, double custom_angle) {
    switch (preset) {
        case PolarizationPreset::HORIZONTAL:         return 0.0;
        case PolarizationPreset::VERTICAL:           return 90.0;
        case PolarizationPreset::FORTY_FIVE_DEGREES: return 45.0;
        case PolarizationPreset::CUSTOM:             return custom_angle;
    }
    return custom_angle;
}

PolarizationPreset parsePolarizationPreset(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "horizontal") return PolarizationPreset::HORIZONTAL;
    if (t == "vertical") return PolarizationPreset::VERTICAL;
    if (t == "45" || t == "fortyfivedegrees" || t == "forty_five_degrees") {
        return PolarizationPreset::FORTY_FIVE_DEGREES;
    }
    if (t == "custom") return PolarizationPreset::CUSTOM;
    throw InvalidConfigurationError("unknown polarization preset '" + text + "'");
}

PolarizingBeamSplitter::PolarizingBeamSplitter(const Point2D& center, double axis_angle, double size)
    : OpticalElement(OpticalElementKind::BEAM_SPLITTER,
                     LineSegment(center - Point2D(size / 2.0, size / 2.0),
                                 center + Point2D(size / 2.0, size / 2.0)),
                     "polarizing beam splitter"),
      center_(center), axis_angle_(axis_angle) {}

double PolarizingBeamSplitter::transmissionProbability(double polarization_angle) const {
    double c = std::cos(degreesToRadians(polarization_angle - axis_angle_));
    double p = c * c;
    // Snap so aligned and crossed polarizations split exactly
    if (p < SNAP_TOLERANCE) return 0.0;
    if (1.0 - p < SNAP_TOLERANCE) return 1.0;
    return p;
}

InteractionResult PolarizingBeamSplitter::interact(const Photon& photon,
                                                   const CandidateTrajectory& candidate,
                                                   const SegmentIntersection&) const {
    double transmitted = transmissionProbability(photon.polarizationAngle());

    InteractionResult result;
    result.type = InteractionType::SPLIT;
    result.branches.push_back({TrajectoryLabel::HORIZONTAL, candidate.direction, transmitted});
    result.branches.push_back({TrajectoryLabel::VERTICAL, Directions::UP, 1.0 - transmitted});
    return result;
}

// =============================================================================
// PhotonDetector
// =============================================================================

DetectionRateAverager::DetectionRateAverager(double time_constant)
    : time_constant_(time_constant) {
    if (!(time_constant > 0.0)) {
        throw InvalidConfigurationError("detection rate time constant must be positive");
    }
}

void DetectionRateAverager::step(double dt) {
    if (dt <= 0.0) return;

    double instantaneous = static_cast<double>(pending_events_) / dt;
    double alpha = 1.0 - std::exp(-dt / time_constant_);
    rate_ += alpha * (instantaneous - rate_);
    pending_events_ = 0;
}

void DetectionRateAverager::reset() {
    rate_ = 0.0;
    pending_events_ = 0;
}

PhotonDetector::PhotonDetector(const Point2D& position, DetectionDirection direction,
                               const std::string& name, double aperture)
    : OpticalElement(OpticalElementKind::DETECTOR,
                     LineSegment(position - Point2D(aperture / 2.0, 0.0),
                                 position + Point2D(aperture / 2.0, 0.0)),
                     name),
      position_(position), direction_(direction),
      averager_(DETECTION_RATE_TIME_CONSTANT) {}

void PhotonDetector::commitDetections(int events) {
    count_ += events;
    averager_.countEvents(events);
}

void PhotonDetector::reset() {
    count_ = 0;
    averager_.reset();
}

Point2D PhotonDetector::facing() const {
    return direction_ == DetectionDirection::UP ? Directions::UP : Directions::DOWN;
}

InteractionResult PhotonDetector::interact(const Photon&, const CandidateTrajectory& candidate,
                                           const SegmentIntersection&) const {
    InteractionResult result;
    // Only photons travelling into the sensing face register
    if (candidate.direction.dot(facing()) > 0.0) {
        result.type = InteractionType::DETECTED;
    }
    return result;
}

} // namespace QMSIM
