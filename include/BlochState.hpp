/**
 * @file BlochState.hpp
 * @brief Two-level quantum state on the Bloch sphere
 *
 * The state is stored as (polar, azimuthal) angles with
 *   alpha = cos(polar/2)
 *   beta  = exp(i * azimuthal) * sin(polar/2)
 * so |alpha|^2 + |beta|^2 = 1 always holds and the global phase is fixed by
 * taking alpha real and non-negative.
 */

#ifndef BLOCH_STATE_HPP
#define BLOCH_STATE_HPP

#include "Geometry.hpp"
#include "StateDirection.hpp"
#include <complex>

namespace QMSIM {

class BlochState {
public:
    BlochState();
    explicit BlochState(StateDirection direction);
    BlochState(double polar_angle, double azimuthal_angle);

    void setFromDirection(StateDirection direction);
    void setFromDirection(MeasurementAxis axis);

    /**
     * @brief Set the spherical angles
     * @throws std::out_of_range if polar_angle is outside [0, pi]
     *
     * The azimuthal angle is wrapped into [0, 2pi). At the poles it is set to 0.
     */
    void setFromAngles(double polar_angle, double azimuthal_angle);

    /**
     * @brief Set the state from complex amplitudes
     * @throws InvalidAmplitudeError if | |alpha|^2 + |beta|^2 - 1 | > AMPLITUDE_TOLERANCE;
     *         the previous state is kept
     *
     * Pairs within tolerance are normalized exactly before use.
     */
    void setFromAmplitudes(std::complex<double> alpha, std::complex<double> beta);

    /// Set the state from a (not necessarily unit) direction vector
    void setFromVector(const Vector3D& v);

    /// Precess about z; no-op when the precession rate is zero
    void step(double dt);

    void setPrecessionRate(double radians_per_second) { precession_rate_ = radians_per_second; }
    double precessionRate() const { return precession_rate_; }

    /// Back to +Z, precession rate unchanged
    void reset();

    /// Probability of the + outcome along an axis
    double upProbability(MeasurementAxis axis) const;

    /// Collapse onto the positive (up = true) or opposite direction of an axis
    void collapseOnto(MeasurementAxis axis, bool up);

    double polarAngle() const { return polar_angle_; }
    double azimuthalAngle() const { return azimuthal_angle_; }
    double elevationAngle() const;   ///< pi/2 - polar, in [-pi/2, pi/2]

    std::complex<double> alpha() const;
    std::complex<double> beta() const;

    Vector3D toVector() const;

private:
    double polar_angle_;
    double azimuthal_angle_;
    double precession_rate_ = 0.0;
};

} // namespace QMSIM

#endif // BLOCH_STATE_HPP
