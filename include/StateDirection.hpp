/**
 * @file StateDirection.hpp
 * @brief Fixed axes of the Bloch sphere and measurement bases
 *
 * Angles follow the physics convention: polar angle from +z, azimuthal angle
 * from +x toward +y. Both enumerations are closed; switches over them list
 * every case so a new entry cannot be silently ignored.
 *
 *   Direction   polar   azimuthal
 *   +X          pi/2    0
 *   -X          pi/2    pi
 *   +Y          pi/2    pi/2
 *   -Y          pi/2    3pi/2
 *   +Z          0       0
 *   -Z          pi      0
 *   Custom      0       0
 */

#ifndef STATE_DIRECTION_HPP
#define STATE_DIRECTION_HPP

#include "Geometry.hpp"
#include <array>
#include <cstddef>
#include <string>

namespace QMSIM {

enum class StateDirection {
    X_PLUS,
    X_MINUS,
    Y_PLUS,
    Y_MINUS,
    Z_PLUS,
    Z_MINUS,
    CUSTOM
};

enum class MeasurementAxis {
    X,
    Y,
    Z
};

struct StateDirectionInfo {
    const char* label;
    double polar_angle;
    double azimuthal_angle;
};

struct MeasurementAxisInfo {
    const char* label;
    double polar_angle;
    double azimuthal_angle;
    StateDirection positive_direction;
    StateDirection opposite_direction;
};

constexpr std::size_t STATE_DIRECTION_COUNT = 7;
constexpr std::size_t MEASUREMENT_AXIS_COUNT = 3;

const StateDirectionInfo& directionInfo(StateDirection direction);
const MeasurementAxisInfo& axisInfo(MeasurementAxis axis);

/// All directions in declaration order
const std::array<StateDirection, STATE_DIRECTION_COUNT>& allStateDirections();

/// Unit vector of a direction (exact for the six cardinal directions)
Vector3D directionToVector(StateDirection direction);

/// Unit vector of the positive end of an axis
Vector3D directionToVector(MeasurementAxis axis);

/// Unit vector from spherical angles; components below SNAP_TOLERANCE become 0
Vector3D anglesToVector(double polar_angle, double azimuthal_angle);

/**
 * @brief Spherical angles of a vector
 *
 * The azimuthal angle lies in [0, 2pi) and is 0 at the poles.
 * A zero vector maps to (0, 0).
 */
void vectorToAngles(const Vector3D& v, double& polar_angle, double& azimuthal_angle);

/**
 * @brief Born-rule probability of the + outcome along `axis` for spin `state`
 *
 * P(+) = cos^2(theta/2) = (1 + cos theta) / 2. Colinear inputs give exactly
 * 1, anti-colinear inputs exactly 0.
 */
double spinUpProbability(const Vector3D& state, const Vector3D& axis);

/// Wrap an angle into [0, 2pi)
double wrapAngle(double angle);

StateDirection parseStateDirection(const std::string& text);
MeasurementAxis parseMeasurementAxis(const std::string& text);

} // namespace QMSIM

#endif // STATE_DIRECTION_HPP
