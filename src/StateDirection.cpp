#include "StateDirection.hpp"
#include "MeasurementErrors.hpp"
#include "QMSIM.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

// Indexed by StateDirection
constexpr std::array<StateDirectionInfo, STATE_DIRECTION_COUNT> DIRECTION_TABLE = {{
    {"+X", PI / 2.0, 0.0},
    {"-X", PI / 2.0, PI},
    {"+Y", PI / 2.0, PI / 2.0},
    {"-Y", PI / 2.0, 3.0 * PI / 2.0},
    {"+Z", 0.0, 0.0},
    {"-Z", PI, 0.0},
    {"Custom", 0.0, 0.0}
}};

// Indexed by MeasurementAxis
constexpr std::array<MeasurementAxisInfo, MEASUREMENT_AXIS_COUNT> AXIS_TABLE = {{
    {"S_x", PI / 2.0, 0.0, StateDirection::X_PLUS, StateDirection::X_MINUS},
    {"S_y", PI / 2.0, PI / 2.0, StateDirection::Y_PLUS, StateDirection::Y_MINUS},
    {"S_z", 0.0, 0.0, StateDirection::Z_PLUS, StateDirection::Z_MINUS}
}};

static_assert(static_cast<std::size_t>(StateDirection::CUSTOM) + 1 == STATE_DIRECTION_COUNT,
              "direction table out of sync with StateDirection");
static_assert(static_cast<std::size_t>(MeasurementAxis::Z) + 1 == MEASUREMENT_AXIS_COUNT,
              "axis table out of sync with MeasurementAxis");

double snap(double value) {
    return std::abs(value) < SNAP_TOLERANCE ? 0.0 : value;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

const StateDirectionInfo& directionInfo(StateDirection direction) {
    return DIRECTION_TABLE[static_cast<std::size_t>(direction)];
}

const MeasurementAxisInfo& axisInfo(MeasurementAxis axis) {
    return AXIS_TABLE[static_cast<std::size_t>(axis)];
}

const std::array<StateDirection, STATE_DIRECTION_COUNT>& allStateDirections() {
    static const std::array<StateDirection, STATE_DIRECTION_COUNT> directions = {
        StateDirection::X_PLUS, StateDirection::X_MINUS,
        StateDirection::Y_PLUS, StateDirection::Y_MINUS,
        StateDirection::Z_PLUS, StateDirection::Z_MINUS,
        StateDirection::CUSTOM
    };
    return directions;
}

Vector3D directionToVector(StateDirection direction) {
    switch (direction) {
        case StateDirection::X_PLUS:  return Vector3D(1, 0, 0);
        case StateDirection::X_MINUS: return Vector3D(-1, 0, 0);
        case StateDirection::Y_PLUS:  return Vector3D(0, 1, 0);
        case StateDirection::Y_MINUS: return Vector3D(0, -1, 0);
        case StateDirection::Z_PLUS:  return Vector3D(0, 0, 1);
        case StateDirection::Z_MINUS: return Vector3D(0, 0, -1);
        case StateDirection::CUSTOM: {
            const auto& info = directionInfo(direction);
            return anglesToVector(info.polar_angle, info.azimuthal_angle);
        }
    }
    return Vector3D(0, 0, 1);
}

Vector3D directionToVector(MeasurementAxis axis) {
    return directionToVector(axisInfo(axis).positive_direction);
}

Vector3D anglesToVector(double polar_angle, double azimuthal_angle) {
    double s = std::sin(polar_angle);
    return Vector3D(snap(s * std::cos(azimuthal_angle)),
                    snap(s * std::sin(azimuthal_angle)),
                    snap(std::cos(polar_angle)));
}

void vectorToAngles(const Vector3D& v, double& polar_angle, double& azimuthal_angle) {
    double n = v.norm();
    if (n < 1e-15) {
        polar_angle = 0.0;
        azimuthal_angle = 0.0;
        return;
    }

    polar_angle = std::acos(std::clamp(v.z / n, -1.0, 1.0));

    double rho = std::sqrt(v.x * v.x + v.y * v.y) / n;
    if (rho < SNAP_TOLERANCE) {
        azimuthal_angle = 0.0;   // pole
    } else {
        azimuthal_angle = wrapAngle(std::atan2(v.y, v.x));
    }
}

double spinUpProbability(const Vector3D& state, const Vector3D& axis) {
    double denom = state.norm() * axis.norm();
    if (denom < 1e-30) {
        throw InvalidConfigurationError("spin probability requires non-zero vectors");
    }

    double cos_theta = std::clamp(state.dot(axis) / denom, -1.0, 1.0);
    if (1.0 - cos_theta < SNAP_TOLERANCE) return 1.0;
    if (1.0 + cos_theta < SNAP_TOLERANCE) return 0.0;
    return 0.5 * (1.0 + cos_theta);
}

double wrapAngle(double angle) {
    double wrapped = std::fmod(angle, TWO_PI);
    if (wrapped < 0.0) wrapped += TWO_PI;
    // fmod of a tiny negative value can round up to exactly 2pi
    if (wrapped >= TWO_PI) wrapped = 0.0;
    return wrapped;
}

StateDirection parseStateDirection(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "+x" || t == "x_plus" || t == "x+") return StateDirection::X_PLUS;
    if (t == "-x" || t == "x_minus" || t == "x-") return StateDirection::X_MINUS;
    if (t == "+y" || t == "y_plus" || t == "y+") return StateDirection::Y_PLUS;
    if (t == "-y" || t == "y_minus" || t == "y-") return StateDirection::Y_MINUS;
    if (t == "+z" || t == "z_plus" || t == "z+") return StateDirection::Z_PLUS;
    if (t == "-z" || t == "z_minus" || t == "z-") return StateDirection::Z_MINUS;
    if (t == "custom") return StateDirection::CUSTOM;
    throw InvalidConfigurationError("unknown state direction '" + text + "'");
}

MeasurementAxis parseMeasurementAxis(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "x" || t == "s_x" || t == "sx") return MeasurementAxis::X;
    if (t == "y" || t == "s_y" || t == "sy") return MeasurementAxis::Y;
    if (t == "z" || t == "s_z" || t == "sz") return MeasurementAxis::Z;
    throw InvalidConfigurationError("unknown measurement axis '" + text + "'");
}

} // namespace QMSIM
