/**
 * @file test_bloch_state.cpp
 * @brief Unit tests for BlochState
 */

#include <gtest/gtest.h>
#include "BlochState.hpp"
#include "MeasurementErrors.hpp"
#include "QMSIM.hpp"
#include <petsc.h>
#include <cmath>
#include <complex>
#include <stdexcept>

using namespace QMSIM;
using SimulationConstants::PI;
using SimulationConstants::TWO_PI;

class BlochStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

TEST_F(BlochStateTest, DefaultIsSpinUp) {
    BlochState state;

    EXPECT_EQ(state.polarAngle(), 0.0);
    EXPECT_EQ(state.azimuthalAngle(), 0.0);
    EXPECT_DOUBLE_EQ(state.alpha().real(), 1.0);
    EXPECT_DOUBLE_EQ(std::abs(state.beta()), 0.0);
    EXPECT_DOUBLE_EQ(state.elevationAngle(), PI / 2.0);
    EXPECT_EQ(state.upProbability(MeasurementAxis::Z), 1.0);
}

TEST_F(BlochStateTest, ElevationFollowsPolarAngle) {
    EXPECT_DOUBLE_EQ(BlochState(StateDirection::Z_MINUS).elevationAngle(), -PI / 2.0);
    EXPECT_DOUBLE_EQ(BlochState(StateDirection::X_PLUS).elevationAngle(), 0.0);
}

TEST_F(BlochStateTest, AmplitudesStayNormalized) {
    BlochState state(1.1, 2.3);
    double norm_sq = std::norm(state.alpha()) + std::norm(state.beta());

    EXPECT_NEAR(norm_sq, 1.0, 1e-12);
    EXPECT_EQ(state.alpha().imag(), 0.0) << "Global phase is carried by beta";
    EXPECT_NEAR(std::arg(state.beta()), 2.3, 1e-12);
}

TEST_F(BlochStateTest, AngleValidation) {
    BlochState state(StateDirection::X_PLUS);

    EXPECT_THROW(state.setFromAngles(-0.1, 0.0), std::out_of_range);
    EXPECT_THROW(state.setFromAngles(PI + 0.1, 0.0), std::out_of_range);
    EXPECT_THROW(state.setFromAngles(1.0, std::nan("")), std::out_of_range);

    // Rejected input leaves the state alone
    EXPECT_DOUBLE_EQ(state.polarAngle(), PI / 2.0);
}

TEST_F(BlochStateTest, AzimuthalAngleWrapsAndVanishesAtPoles) {
    BlochState state;

    state.setFromAngles(PI / 2.0, -PI / 2.0);
    EXPECT_DOUBLE_EQ(state.azimuthalAngle(), 3.0 * PI / 2.0);

    state.setFromAngles(0.0, 1.0);
    EXPECT_EQ(state.azimuthalAngle(), 0.0);

    state.setFromAngles(PI, 2.0);
    EXPECT_EQ(state.azimuthalAngle(), 0.0);
}

TEST_F(BlochStateTest, FromAmplitudes) {
    const double polar = 1.1;
    const double azimuthal = 2.3;
    std::complex<double> alpha(std::cos(polar / 2.0), 0.0);
    std::complex<double> beta = std::polar(std::sin(polar / 2.0), azimuthal);

    BlochState state;
    state.setFromAmplitudes(alpha, beta);
    EXPECT_NEAR(state.polarAngle(), polar, 1e-9);
    EXPECT_NEAR(state.azimuthalAngle(), azimuthal, 1e-9);

    // A global phase does not change the state
    std::complex<double> phase = std::polar(1.0, 0.7);
    BlochState rotated;
    rotated.setFromAmplitudes(alpha * phase, beta * phase);
    EXPECT_NEAR(rotated.polarAngle(), polar, 1e-9);
    EXPECT_NEAR(rotated.azimuthalAngle(), azimuthal, 1e-9);
}

TEST_F(BlochStateTest, FromAmplitudesEqualSuperposition) {
    BlochState state;
    double r = 1.0 / std::sqrt(2.0);

    state.setFromAmplitudes({r, 0.0}, {0.0, r});
    EXPECT_NEAR(state.polarAngle(), PI / 2.0, 1e-12);
    EXPECT_NEAR(state.azimuthalAngle(), PI / 2.0, 1e-12);

    state.setFromAmplitudes({0.0, 0.0}, {1.0, 0.0});
    EXPECT_NEAR(state.polarAngle(), PI, 1e-12);
    EXPECT_EQ(state.azimuthalAngle(), 0.0);
}

TEST_F(BlochStateTest, AmplitudeTolerance) {
    BlochState state(StateDirection::Y_PLUS);

    // Within tolerance: normalized and accepted
    double s = std::sqrt((1.0 + 5e-10) / 2.0);
    EXPECT_NO_THROW(state.setFromAmplitudes({s, 0.0}, {s, 0.0}));
    EXPECT_NEAR(state.polarAngle(), PI / 2.0, 1e-9);
    EXPECT_NEAR(state.azimuthalAngle(), 0.0, 1e-9);

    // Far outside: rejected, previous state kept
    EXPECT_THROW(state.setFromAmplitudes({1.0, 0.0}, {1.0, 0.0}), InvalidAmplitudeError);
    EXPECT_NEAR(state.polarAngle(), PI / 2.0, 1e-9);
    EXPECT_THROW(state.setFromAmplitudes({0.0, 0.0}, {0.0, 0.0}), InvalidAmplitudeError);
}

TEST_F(BlochStateTest, FromVector) {
    BlochState state;
    state.setFromVector(Vector3D(2.0, 2.0, 0.0));

    EXPECT_NEAR(state.polarAngle(), PI / 2.0, 1e-12);
    EXPECT_NEAR(state.azimuthalAngle(), PI / 4.0, 1e-12);
}

TEST_F(BlochStateTest, Precession) {
    BlochState state(StateDirection::X_PLUS);
    state.setPrecessionRate(1.0);

    state.step(PI / 2.0);
    EXPECT_NEAR(state.azimuthalAngle(), PI / 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(state.polarAngle(), PI / 2.0);

    state.step(2.0 * PI);
    EXPECT_NEAR(state.azimuthalAngle(), PI / 2.0, 1e-9);

    state.setPrecessionRate(-1.0);
    state.step(PI);
    EXPECT_NEAR(state.azimuthalAngle(), 3.0 * PI / 2.0, 1e-9);
    EXPECT_GE(state.azimuthalAngle(), 0.0);
    EXPECT_LT(state.azimuthalAngle(), TWO_PI);
}

TEST_F(BlochStateTest, PrecessionNoOps) {
    BlochState still(StateDirection::X_PLUS);
    still.step(1.0);
    EXPECT_EQ(still.azimuthalAngle(), 0.0) << "Zero rate leaves the state alone";

    BlochState pole(StateDirection::Z_PLUS);
    pole.setPrecessionRate(1.0);
    pole.step(1.0);
    EXPECT_EQ(pole.azimuthalAngle(), 0.0);
    EXPECT_EQ(pole.polarAngle(), 0.0);
}

TEST_F(BlochStateTest, ProbabilitiesAndCollapse) {
    BlochState state(StateDirection::X_PLUS);

    EXPECT_DOUBLE_EQ(state.upProbability(MeasurementAxis::Z), 0.5);
    EXPECT_EQ(state.upProbability(MeasurementAxis::X), 1.0);

    state.collapseOnto(MeasurementAxis::X, false);
    EXPECT_DOUBLE_EQ(state.polarAngle(), PI / 2.0);
    EXPECT_DOUBLE_EQ(state.azimuthalAngle(), PI);
    EXPECT_EQ(state.upProbability(MeasurementAxis::X), 0.0);

    state.collapseOnto(MeasurementAxis::Z, true);
    EXPECT_EQ(state.polarAngle(), 0.0);
}

TEST_F(BlochStateTest, ResetKeepsPrecessionRate) {
    BlochState state(StateDirection::Y_MINUS);
    state.setPrecessionRate(0.5);
    state.reset();

    EXPECT_EQ(state.polarAngle(), 0.0);
    EXPECT_EQ(state.azimuthalAngle(), 0.0);
    EXPECT_DOUBLE_EQ(state.precessionRate(), 0.5);
}
