/**
 * @file Photon.hpp
 * @brief Photon with co-existing weighted candidate trajectories
 *
 * A photon starts on a single INCIDENT trajectory. A polarizing beam splitter
 * replaces it with a HORIZONTAL (transmitted) and a VERTICAL (reflected)
 * candidate whose weights sum to 1. Detection collapses the photon.
 */

#ifndef PHOTON_HPP
#define PHOTON_HPP

#include "Geometry.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace QMSIM {

enum class TrajectoryLabel {
    INCIDENT,
    HORIZONTAL,
    VERTICAL
};

enum class PhotonStatus {
    IN_FLIGHT,
    DETECTED,
    ABSORBED
};

std::string trajectoryLabelName(TrajectoryLabel label);

struct CandidateTrajectory {
    Point2D position;
    Point2D direction;              ///< unit vector
    double probability_weight = 1.0;
    Point2D position_offset;        ///< lateral beam offset assigned at emission
    int last_element = -1;          ///< element this candidate last interacted with
};

class Photon {
public:
    using CandidateMap = std::map<TrajectoryLabel, CandidateTrajectory>;

    Photon(std::uint64_t id, double polarization_angle, const Point2D& position,
           const Point2D& direction, const Point2D& position_offset = Point2D());

    std::uint64_t id() const { return id_; }

    /// Polarization angle in degrees, 0 = horizontal
    double polarizationAngle() const { return polarization_angle_; }

    PhotonStatus status() const { return status_; }
    bool isInFlight() const { return status_ == PhotonStatus::IN_FLIGHT; }

    const CandidateMap& possibleStates() const { return candidates_; }
    CandidateMap& possibleStates() { return candidates_; }
    bool hasCandidate(TrajectoryLabel label) const;
    const CandidateTrajectory& candidate(TrajectoryLabel label) const;

    /// Move every candidate by direction * speed * dt
    void step(double dt);

    /// Sum of in-flight candidate weights (1 while in flight, 0 once terminal)
    double inFlightWeight() const;

    /// Add a candidate; an existing candidate with the same label takes over its weight
    void addOrMergeCandidate(TrajectoryLabel label, const CandidateTrajectory& candidate);

    /// Remove a candidate and rescale the rest to sum to 1
    void dropCandidateAndRenormalize(TrajectoryLabel label);

    /// Collapse onto a terminal status
    void markDetected(int detector_index);
    void markAbsorbed();

    int detectedBy() const { return detected_by_; }

private:
    std::uint64_t id_;
    double polarization_angle_;
    PhotonStatus status_ = PhotonStatus::IN_FLIGHT;
    CandidateMap candidates_;
    int detected_by_ = -1;
};

} // namespace QMSIM

#endif // PHOTON_HPP
