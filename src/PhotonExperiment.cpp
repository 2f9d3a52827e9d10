#include "PhotonExperiment.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>

namespace QMSIM {

using namespace SimulationConstants;

PhotonEmissionMode parsePhotonEmissionMode(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "single" || t == "single_photon" || t == "singlephoton") {
        return PhotonEmissionMode::SINGLE_PHOTON;
    }
    if (t == "many" || t == "many_photons" || t == "manyphotons") {
        return PhotonEmissionMode::MANY_PHOTONS;
    }
    throw InvalidConfigurationError("unknown photon emission mode '" + text + "'");
}

// =============================================================================
// Laser
// =============================================================================

Laser::Laser(const Point2D& position, PhotonEmissionMode mode)
    : position_(position), mode_(mode) {}

void Laser::setEmissionRate(double photons_per_second) {
    if (!(photons_per_second >= 0.0 && photons_per_second <= MAX_PHOTON_EMISSION_RATE)) {
        std::ostringstream msg;
        msg << "emission rate " << photons_per_second << " outside [0, "
            << MAX_PHOTON_EMISSION_RATE << "]";
        throw InvalidConfigurationError(msg.str());
    }
    emission_rate_ = photons_per_second;
}

double Laser::polarizationAngle() const {
    return polarizationPresetAngle(preset_, custom_angle_);
}

int Laser::step(double dt) {
    if (mode_ != PhotonEmissionMode::MANY_PHOTONS || dt <= 0.0) return 0;

    emission_accumulator_ += emission_rate_ * dt;
    int due = static_cast<int>(std::floor(emission_accumulator_));
    emission_accumulator_ -= due;
    return due;
}

Photon Laser::createPhoton(std::uint64_t id, RandomSource& random) const {
    double y_offset = PHOTON_BEAM_WIDTH / 2.0 * (1.0 - 2.0 * random.nextDouble());
    Point2D offset(0.0, y_offset);
    return Photon(id, polarizationAngle(), position_ + offset, emissionDirection(), offset);
}

void Laser::reset() {
    emission_rate_ = 0.0;
    emission_accumulator_ = 0.0;
    preset_ = PolarizationPreset::FORTY_FIVE_DEGREES;
    custom_angle_ = 45.0;
}

// =============================================================================
// PhotonExperiment
// =============================================================================

PhotonExperiment::PhotonExperiment(const Config& config)
    : config_(config), random_(config.seed),
      laser_(Point2D(-0.15, 0.0), config.emission_mode) {
    if (!(config.field_half_extent > 0.0)) {
        throw InvalidConfigurationError("photon field extent must be positive");
    }

    laser_.setEmissionRate(config.emission_rate);
    laser_.setPolarizationPreset(config.polarization);
    laser_.setCustomPolarizationAngle(config.custom_polarization_angle);

    // Order matters: indices are the *_INDEX constants
    elements_.push_back(std::make_unique<PolarizingBeamSplitter>(Point2D(0.0, 0.0),
                                                                 config.splitter_axis_angle));
    elements_.push_back(std::make_unique<Mirror>(Point2D(0.125, 0.0)));
    elements_.push_back(std::make_unique<PhotonDetector>(Point2D(0.125, -0.075),
                                                         DetectionDirection::DOWN,
                                                         "horizontal polarization detector"));
    elements_.push_back(std::make_unique<PhotonDetector>(Point2D(0.0, 0.2),
                                                         DetectionDirection::UP,
                                                         "vertical polarization detector"));

    photons_.reserve(MAX_PHOTONS);
}

const PolarizingBeamSplitter& PhotonExperiment::splitter() const {
    return static_cast<const PolarizingBeamSplitter&>(*elements_[SPLITTER_INDEX]);
}

PolarizingBeamSplitter& PhotonExperiment::splitter() {
    return static_cast<PolarizingBeamSplitter&>(*elements_[SPLITTER_INDEX]);
}

const Mirror& PhotonExperiment::mirror() const {
    return static_cast<const Mirror&>(*elements_[MIRROR_INDEX]);
}

const PhotonDetector& PhotonExperiment::horizontalDetector() const {
    return static_cast<const PhotonDetector&>(*elements_[HORIZONTAL_DETECTOR_INDEX]);
}

const PhotonDetector& PhotonExperiment::verticalDetector() const {
    return static_cast<const PhotonDetector&>(*elements_[VERTICAL_DETECTOR_INDEX]);
}

PhotonDetector& PhotonExperiment::detector(int index) {
    return static_cast<PhotonDetector&>(*elements_[index]);
}

bool PhotonExperiment::emitPhoton() {
    if (photons_.size() >= MAX_PHOTONS) {
        dropped_emissions_++;
        return false;
    }
    photons_.push_back(laser_.createPhoton(next_photon_id_++, random_));
    launched_++;
    return true;
}

bool PhotonExperiment::isOutsideField(const Point2D& p) const {
    return std::abs(p.x) > config_.field_half_extent || std::abs(p.y) > config_.field_half_extent;
}

void PhotonExperiment::propagatePhoton(Photon& photon, double dt,
                                       std::vector<int>& frame_detections,
                                       std::uint64_t& frame_absorbed) {
    // Nearest crossing per trajectory over all elements
    InteractionMap nearest;
    std::map<TrajectoryLabel, int> nearest_element;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        int index = static_cast<int>(i);
        InteractionMap hits = elements_[i]->testForInteraction(photon, dt, index);
        for (const auto& hit : hits) {
            auto it = nearest.find(hit.first);
            if (it == nearest.end() || hit.second.t < it->second.t) {
                nearest[hit.first] = hit.second;
                nearest_element[hit.first] = index;
            }
        }
    }

    const double travel = PHOTON_SPEED * dt;
    std::vector<PendingResolution> pending;

    if (nearest.empty()) {
        photon.step(dt);
    } else {
        Photon::CandidateMap current = photon.possibleStates();
        photon.possibleStates().clear();

        for (const auto& entry : current) {
            TrajectoryLabel label = entry.first;
            CandidateTrajectory candidate = entry.second;

            auto hit = nearest.find(label);
            if (hit == nearest.end()) {
                candidate.position = candidate.position + candidate.direction * travel;
                photon.addOrMergeCandidate(label, candidate);
                continue;
            }

            const InteractionResult& result = hit->second;
            int element = nearest_element[label];
            double remaining = travel * (1.0 - result.t);

            switch (result.type) {
                case InteractionType::REFLECTED:
                    candidate.direction = result.reflection_direction;
                    candidate.position = result.point + candidate.direction * remaining;
                    candidate.last_element = element;
                    photon.addOrMergeCandidate(label, candidate);
                    break;

                case InteractionType::SPLIT:
                    for (const auto& branch : result.branches) {
                        if (branch.probability <= 0.0) continue;
                        CandidateTrajectory child = candidate;
                        child.direction = branch.direction;
                        child.position = result.point + branch.direction * remaining;
                        child.probability_weight = candidate.probability_weight * branch.probability;
                        child.last_element = element;
                        photon.addOrMergeCandidate(branch.label, child);
                    }
                    break;

                case InteractionType::DETECTED:
                    candidate.position = result.point;
                    candidate.last_element = element;
                    photon.addOrMergeCandidate(label, candidate);
                    pending.push_back({label, element, result.t});
                    break;

                case InteractionType::NONE:
                    break;
            }
        }
    }

    for (const auto& entry : photon.possibleStates()) {
        if (isOutsideField(entry.second.position)) {
            pending.push_back({entry.first, -1, 1.0});
        }
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const PendingResolution& a, const PendingResolution& b) { return a.t < b.t; });

    for (const auto& resolution : pending) {
        if (!photon.isInFlight()) break;
        if (!photon.hasCandidate(resolution.label)) continue;

        double weight = photon.candidate(resolution.label).probability_weight;
        if (random_.nextBoolean(weight)) {
            if (resolution.element < 0) {
                photon.markAbsorbed();
                frame_absorbed++;
            } else {
                photon.markDetected(resolution.element);
                frame_detections[resolution.element]++;
            }
        } else {
            photon.dropCandidateAndRenormalize(resolution.label);
            if (photon.possibleStates().empty()) {
                photon.markAbsorbed();
                frame_absorbed++;
            }
        }
    }
}

void PhotonExperiment::step(double dt) {
    if (!playing_ || dt <= 0.0) return;

    int due = laser_.step(dt);
    for (int i = 0; i < due; ++i) {
        emitPhoton();
    }

    std::vector<int> frame_detections(elements_.size(), 0);
    std::uint64_t frame_absorbed = 0;

    for (auto& photon : photons_) {
        propagatePhoton(photon, dt, frame_detections, frame_absorbed);
    }

    // Commit the frame
    photons_.erase(std::remove_if(photons_.begin(), photons_.end(),
                                  [](const Photon& p) { return !p.isInFlight(); }),
                   photons_.end());

    for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (elements_[i]->kind() != OpticalElementKind::DETECTOR) continue;
        PhotonDetector& d = detector(static_cast<int>(i));
        d.commitDetections(frame_detections[i]);
        detected_ += static_cast<std::uint64_t>(frame_detections[i]);
        d.step(dt);
    }
    absorbed_ += frame_absorbed;
}

void PhotonExperiment::clearPhotonsAndCounts() {
    discarded_ += photons_.size();
    photons_.clear();
    detector(HORIZONTAL_DETECTOR_INDEX).resetDetectionCount();
    detector(VERTICAL_DETECTOR_INDEX).resetDetectionCount();
}

void PhotonExperiment::setPolarizationPreset(PolarizationPreset preset) {
    laser_.setPolarizationPreset(preset);
    if (laser_.emissionMode() == PhotonEmissionMode::SINGLE_PHOTON) {
        clearPhotonsAndCounts();
    }
}

void PhotonExperiment::setCustomPolarizationAngle(double degrees) {
    laser_.setCustomPolarizationAngle(degrees);
    if (laser_.emissionMode() == PhotonEmissionMode::SINGLE_PHOTON) {
        clearPhotonsAndCounts();
    }
}

double PhotonExperiment::normalizedOutcomeValue() const {
    double h = 0.0;
    double v = 0.0;
    if (laser_.emissionMode() == PhotonEmissionMode::SINGLE_PHOTON) {
        h = horizontalDetector().detectionCount();
        v = verticalDetector().detectionCount();
    } else {
        h = horizontalDetector().detectionRate();
        v = verticalDetector().detectionRate();
    }
    if (h + v == 0.0) return 0.0;
    return (h - v) / (h + v);
}

double PhotonExperiment::expectedHorizontalFraction() const {
    return splitter().transmissionProbability(laser_.polarizationAngle());
}

double PhotonExperiment::totalTrackedWeight() const {
    double weight = static_cast<double>(detected_ + absorbed_ + discarded_);
    for (const auto& photon : photons_) {
        weight += photon.inFlightWeight();
    }
    return weight;
}

void PhotonExperiment::reset() {
    photons_.clear();
    random_.reseed(config_.seed);

    laser_.reset();
    laser_.setEmissionRate(config_.emission_rate);
    laser_.setPolarizationPreset(config_.polarization);
    laser_.setCustomPolarizationAngle(config_.custom_polarization_angle);
    splitter().setAxisAngle(config_.splitter_axis_angle);

    detector(HORIZONTAL_DETECTOR_INDEX).reset();
    detector(VERTICAL_DETECTOR_INDEX).reset();

    playing_ = true;
    next_photon_id_ = 0;
    launched_ = 0;
    detected_ = 0;
    absorbed_ = 0;
    dropped_emissions_ = 0;
    discarded_ = 0;
}

} // namespace QMSIM
