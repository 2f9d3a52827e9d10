/**
 * @file test_state_direction.cpp
 * @brief Unit tests for state directions, measurement axes and the Born rule
 */

#include <gtest/gtest.h>
#include "StateDirection.hpp"
#include "MeasurementErrors.hpp"
#include "QMSIM.hpp"
#include <petsc.h>
#include <cmath>
#include <string>

using namespace QMSIM;
using SimulationConstants::PI;
using SimulationConstants::TWO_PI;

class StateDirectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

TEST_F(StateDirectionTest, DirectionTable) {
    EXPECT_EQ(std::string(directionInfo(StateDirection::X_PLUS).label), "+X");
    EXPECT_EQ(std::string(directionInfo(StateDirection::Z_MINUS).label), "-Z");
    EXPECT_EQ(std::string(directionInfo(StateDirection::CUSTOM).label), "Custom");

    EXPECT_DOUBLE_EQ(directionInfo(StateDirection::Y_MINUS).polar_angle, PI / 2.0);
    EXPECT_DOUBLE_EQ(directionInfo(StateDirection::Y_MINUS).azimuthal_angle, 3.0 * PI / 2.0);
    EXPECT_DOUBLE_EQ(directionInfo(StateDirection::Z_MINUS).polar_angle, PI);

    EXPECT_EQ(allStateDirections().size(), 7u);
    EXPECT_EQ(allStateDirections().front(), StateDirection::X_PLUS);
    EXPECT_EQ(allStateDirections().back(), StateDirection::CUSTOM);
}

TEST_F(StateDirectionTest, AxisTable) {
    const MeasurementAxisInfo& z = axisInfo(MeasurementAxis::Z);
    EXPECT_EQ(std::string(z.label), "S_z");
    EXPECT_EQ(z.positive_direction, StateDirection::Z_PLUS);
    EXPECT_EQ(z.opposite_direction, StateDirection::Z_MINUS);

    EXPECT_EQ(std::string(axisInfo(MeasurementAxis::X).label), "S_x");
    EXPECT_EQ(axisInfo(MeasurementAxis::Y).opposite_direction, StateDirection::Y_MINUS);
}

TEST_F(StateDirectionTest, CardinalVectorsAreExact) {
    Vector3D x = directionToVector(StateDirection::X_PLUS);
    EXPECT_EQ(x.x, 1.0);
    EXPECT_EQ(x.y, 0.0);
    EXPECT_EQ(x.z, 0.0);

    Vector3D minus_y = directionToVector(StateDirection::Y_MINUS);
    EXPECT_EQ(minus_y.y, -1.0);
    EXPECT_EQ(minus_y.x, 0.0);

    Vector3D z = directionToVector(MeasurementAxis::Z);
    EXPECT_EQ(z.z, 1.0);
}

TEST_F(StateDirectionTest, AnglesToVectorSnaps) {
    Vector3D v = anglesToVector(PI / 2.0, 0.0);
    EXPECT_EQ(v.x, 1.0);
    EXPECT_EQ(v.y, 0.0);
    EXPECT_EQ(v.z, 0.0) << "cos(pi/2) residue is snapped to zero";

    Vector3D w = anglesToVector(PI / 3.0, PI / 4.0);
    EXPECT_NEAR(w.norm(), 1.0, 1e-12);
    EXPECT_NEAR(w.z, 0.5, 1e-12);
}

TEST_F(StateDirectionTest, VectorToAngles) {
    double polar = -1.0;
    double azimuthal = -1.0;

    vectorToAngles(Vector3D(0, 0, -2), polar, azimuthal);
    EXPECT_DOUBLE_EQ(polar, PI);
    EXPECT_EQ(azimuthal, 0.0);

    vectorToAngles(Vector3D(0, -1, 0), polar, azimuthal);
    EXPECT_DOUBLE_EQ(polar, PI / 2.0);
    EXPECT_DOUBLE_EQ(azimuthal, 3.0 * PI / 2.0);

    vectorToAngles(Vector3D(1, 1, 0), polar, azimuthal);
    EXPECT_NEAR(azimuthal, PI / 4.0, 1e-12);

    vectorToAngles(Vector3D(0, 0, 0), polar, azimuthal);
    EXPECT_EQ(polar, 0.0);
    EXPECT_EQ(azimuthal, 0.0);
}

TEST_F(StateDirectionTest, SpinUpProbability) {
    Vector3D z = directionToVector(StateDirection::Z_PLUS);
    Vector3D minus_z = directionToVector(StateDirection::Z_MINUS);
    Vector3D x = directionToVector(StateDirection::X_PLUS);

    EXPECT_EQ(spinUpProbability(z, z), 1.0);
    EXPECT_EQ(spinUpProbability(minus_z, z), 0.0);
    EXPECT_DOUBLE_EQ(spinUpProbability(x, z), 0.5);

    // Magnitudes do not matter
    EXPECT_EQ(spinUpProbability(z * 3.0, z * 0.5), 1.0);

    // 60 degrees from the axis
    Vector3D tilted = anglesToVector(PI / 3.0, 0.0);
    EXPECT_NEAR(spinUpProbability(tilted, z), 0.75, 1e-12);

    EXPECT_THROW(spinUpProbability(Vector3D(), z), InvalidConfigurationError);
}

TEST_F(StateDirectionTest, WrapAngle) {
    EXPECT_DOUBLE_EQ(wrapAngle(-0.5), TWO_PI - 0.5);
    EXPECT_EQ(wrapAngle(TWO_PI), 0.0);
    EXPECT_NEAR(wrapAngle(5.0 * PI), PI, 1e-12);

    double tiny = wrapAngle(-1e-18);
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, TWO_PI);
}

TEST_F(StateDirectionTest, ParseDirections) {
    EXPECT_EQ(parseStateDirection("+x"), StateDirection::X_PLUS);
    EXPECT_EQ(parseStateDirection("Z_MINUS"), StateDirection::Z_MINUS);
    EXPECT_EQ(parseStateDirection("y-"), StateDirection::Y_MINUS);
    EXPECT_EQ(parseStateDirection("custom"), StateDirection::CUSTOM);
    EXPECT_THROW(parseStateDirection("w+"), InvalidConfigurationError);

    EXPECT_EQ(parseMeasurementAxis("s_y"), MeasurementAxis::Y);
    EXPECT_EQ(parseMeasurementAxis("SZ"), MeasurementAxis::Z);
    EXPECT_EQ(parseMeasurementAxis("x"), MeasurementAxis::X);
    EXPECT_THROW(parseMeasurementAxis("q"), InvalidConfigurationError);
}
