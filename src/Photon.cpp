#include "Photon.hpp"
#include "MeasurementErrors.hpp"
#include "QMSIM.hpp"
#include <stdexcept>

namespace QMSIM {

std::string trajectoryLabelName(TrajectoryLabel label) {
    switch (label) {
        case TrajectoryLabel::INCIDENT:   return "incident";
        case TrajectoryLabel::HORIZONTAL: return "horizontal";
        case TrajectoryLabel::VERTICAL:   return "vertical";
    }
    return "unknown";
}

Photon::Photon(std::uint64_t id, double polarization_angle, const Point2D& position,
               const Point2D& direction, const Point2D& position_offset)
    : id_(id), polarization_angle_(polarization_angle) {
    if (direction.norm() < 1e-12) {
        throw InvalidConfigurationError("photon direction must be non-zero");
    }
    CandidateTrajectory incident;
    incident.position = position;
    incident.direction = direction.normalized();
    incident.probability_weight = 1.0;
    incident.position_offset = position_offset;
    candidates_[TrajectoryLabel::INCIDENT] = incident;
}

bool Photon::hasCandidate(TrajectoryLabel label) const {
    return candidates_.find(label) != candidates_.end();
}

const CandidateTrajectory& Photon::candidate(TrajectoryLabel label) const {
    auto it = candidates_.find(label);
    if (it == candidates_.end()) {
        throw std::out_of_range("photon has no " + trajectoryLabelName(label) + " trajectory");
    }
    return it->second;
}

void Photon::step(double dt) {
    if (!isInFlight()) return;
    for (auto& entry : candidates_) {
        CandidateTrajectory& c = entry.second;
        c.position = c.position + c.direction * (SimulationConstants::PHOTON_SPEED * dt);
    }
}

double Photon::inFlightWeight() const {
    if (!isInFlight()) return 0.0;
    double total = 0.0;
    for (const auto& entry : candidates_) {
        total += entry.second.probability_weight;
    }
    return total;
}

void Photon::addOrMergeCandidate(TrajectoryLabel label, const CandidateTrajectory& candidate) {
    auto it = candidates_.find(label);
    if (it == candidates_.end()) {
        candidates_[label] = candidate;
    } else {
        // Same path label reached twice: one candidate carrying both weights
        it->second.probability_weight += candidate.probability_weight;
    }
}

void Photon::dropCandidateAndRenormalize(TrajectoryLabel label) {
    candidates_.erase(label);

    double total = 0.0;
    for (const auto& entry : candidates_) {
        total += entry.second.probability_weight;
    }
    if (total <= 0.0) {
        candidates_.clear();
        return;
    }
    for (auto& entry : candidates_) {
        entry.second.probability_weight /= total;
    }
}

void Photon::markDetected(int detector_index) {
    status_ = PhotonStatus::DETECTED;
    detected_by_ = detector_index;
    candidates_.clear();
}

void Photon::markAbsorbed() {
    status_ = PhotonStatus::ABSORBED;
    candidates_.clear();
}

} // namespace QMSIM
