#include "BlochState.hpp"
#include "MeasurementErrors.hpp"
#include "QMSIM.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace QMSIM {

using namespace SimulationConstants;

BlochState::BlochState() : polar_angle_(0.0), azimuthal_angle_(0.0) {}

BlochState::BlochState(StateDirection direction) : BlochState() {
    setFromDirection(direction);
}

BlochState::BlochState(double polar_angle, double azimuthal_angle) : BlochState() {
    setFromAngles(polar_angle, azimuthal_angle);
}

void BlochState::setFromDirection(StateDirection direction) {
    const auto& info = directionInfo(direction);
    polar_angle_ = info.polar_angle;
    azimuthal_angle_ = info.azimuthal_angle;
}

void BlochState::setFromDirection(MeasurementAxis axis) {
    setFromDirection(axisInfo(axis).positive_direction);
}

void BlochState::setFromAngles(double polar_angle, double azimuthal_angle) {
    if (!(polar_angle >= -SNAP_TOLERANCE && polar_angle <= PI + SNAP_TOLERANCE)) {
        std::ostringstream msg;
        msg << "polar angle " << polar_angle << " outside [0, pi]";
        throw std::out_of_range(msg.str());
    }
    if (!std::isfinite(azimuthal_angle)) {
        throw std::out_of_range("azimuthal angle must be finite");
    }

    polar_angle_ = std::clamp(polar_angle, 0.0, PI);
    bool at_pole = polar_angle_ < SNAP_TOLERANCE || PI - polar_angle_ < SNAP_TOLERANCE;
    azimuthal_angle_ = at_pole ? 0.0 : wrapAngle(azimuthal_angle);
}

void BlochState::setFromAmplitudes(std::complex<double> alpha, std::complex<double> beta) {
    double norm_sq = std::norm(alpha) + std::norm(beta);
    if (!std::isfinite(norm_sq) || std::abs(norm_sq - 1.0) > AMPLITUDE_TOLERANCE) {
        std::ostringstream msg;
        msg << "|alpha|^2 + |beta|^2 = " << norm_sq << " is not 1";
        throw InvalidAmplitudeError(msg.str());
    }

    double scale = 1.0 / std::sqrt(norm_sq);
    double a = std::abs(alpha) * scale;
    double b = std::abs(beta) * scale;

    double polar = 2.0 * std::atan2(b, a);
    double azimuthal = 0.0;
    if (a > SNAP_TOLERANCE && b > SNAP_TOLERANCE) {
        // Relative phase; the global phase goes with alpha
        azimuthal = std::arg(beta) - std::arg(alpha);
    }
    setFromAngles(std::clamp(polar, 0.0, PI), azimuthal);
}

void BlochState::setFromVector(const Vector3D& v) {
    double polar = 0.0;
    double azimuthal = 0.0;
    vectorToAngles(v, polar, azimuthal);
    setFromAngles(polar, azimuthal);
}

void BlochState::step(double dt) {
    if (precession_rate_ == 0.0 || dt <= 0.0) return;
    // At the poles the azimuthal angle carries no information
    if (polar_angle_ < SNAP_TOLERANCE || PI - polar_angle_ < SNAP_TOLERANCE) return;
    azimuthal_angle_ = wrapAngle(azimuthal_angle_ + precession_rate_ * dt);
}

void BlochState::reset() {
    polar_angle_ = 0.0;
    azimuthal_angle_ = 0.0;
}

double BlochState::upProbability(MeasurementAxis axis) const {
    return spinUpProbability(toVector(), directionToVector(axis));
}

void BlochState::collapseOnto(MeasurementAxis axis, bool up) {
    const auto& info = axisInfo(axis);
    setFromDirection(up ? info.positive_direction : info.opposite_direction);
}

double BlochState::elevationAngle() const {
    return PI / 2.0 - polar_angle_;
}

std::complex<double> BlochState::alpha() const {
    return std::complex<double>(std::cos(polar_angle_ / 2.0), 0.0);
}

std::complex<double> BlochState::beta() const {
    return std::polar(std::sin(polar_angle_ / 2.0), azimuthal_angle_);
}

Vector3D BlochState::toVector() const {
    return anglesToVector(polar_angle_, azimuthal_angle_);
}

} // namespace QMSIM
