/**
 * @file test_optical_elements.cpp
 * @brief Unit tests for photons, mirrors, beam splitters and detectors
 */

#include <gtest/gtest.h>
#include "OpticalElement.hpp"
#include "Photon.hpp"
#include "MeasurementErrors.hpp"
#include <petsc.h>
#include <cmath>
#include <stdexcept>

using namespace QMSIM;

class OpticalElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

// ============================================================================
// Photon
// ============================================================================

TEST_F(OpticalElementTest, PhotonStartsIncident) {
    Photon photon(7, 45.0, Point2D(-0.15, 0.0), Point2D(2.0, 0.0));

    EXPECT_EQ(photon.id(), 7u);
    EXPECT_TRUE(photon.isInFlight());
    EXPECT_EQ(photon.possibleStates().size(), 1u);
    EXPECT_EQ(photon.candidate(TrajectoryLabel::INCIDENT).direction.x, 1.0);
    EXPECT_DOUBLE_EQ(photon.inFlightWeight(), 1.0);
    EXPECT_THROW(photon.candidate(TrajectoryLabel::VERTICAL), std::out_of_range);

    EXPECT_THROW(Photon(1, 0.0, Point2D(), Point2D()), InvalidConfigurationError);
}

TEST_F(OpticalElementTest, PhotonMoves) {
    Photon photon(1, 0.0, Point2D(0.0, 0.0), Directions::UP);
    photon.step(1.0);

    EXPECT_NEAR(photon.candidate(TrajectoryLabel::INCIDENT).position.y,
                SimulationConstants::PHOTON_SPEED, 1e-12);

    photon.markAbsorbed();
    photon.step(1.0);
    EXPECT_TRUE(photon.possibleStates().empty());
}

TEST_F(OpticalElementTest, CandidateBookkeeping) {
    Photon photon(1, 45.0, Point2D(), Directions::RIGHT);
    photon.possibleStates()[TrajectoryLabel::INCIDENT].probability_weight = 0.5;

    CandidateTrajectory branch;
    branch.direction = Directions::UP;
    branch.probability_weight = 0.25;
    photon.addOrMergeCandidate(TrajectoryLabel::VERTICAL, branch);
    photon.addOrMergeCandidate(TrajectoryLabel::VERTICAL, branch);
    EXPECT_DOUBLE_EQ(photon.candidate(TrajectoryLabel::VERTICAL).probability_weight, 0.5);
    EXPECT_DOUBLE_EQ(photon.inFlightWeight(), 1.0);

    photon.dropCandidateAndRenormalize(TrajectoryLabel::INCIDENT);
    EXPECT_FALSE(photon.hasCandidate(TrajectoryLabel::INCIDENT));
    EXPECT_DOUBLE_EQ(photon.candidate(TrajectoryLabel::VERTICAL).probability_weight, 1.0);
}

TEST_F(OpticalElementTest, TerminalPhotons) {
    Photon detected(1, 0.0, Point2D(), Directions::RIGHT);
    detected.markDetected(2);
    EXPECT_EQ(detected.status(), PhotonStatus::DETECTED);
    EXPECT_EQ(detected.detectedBy(), 2);
    EXPECT_TRUE(detected.possibleStates().empty());
    EXPECT_EQ(detected.inFlightWeight(), 0.0);

    Photon absorbed(2, 0.0, Point2D(), Directions::RIGHT);
    absorbed.markAbsorbed();
    EXPECT_EQ(absorbed.status(), PhotonStatus::ABSORBED);
    EXPECT_FALSE(absorbed.isInFlight());
}

TEST_F(OpticalElementTest, TrajectoryNames) {
    EXPECT_EQ(trajectoryLabelName(TrajectoryLabel::INCIDENT), "incident");
    EXPECT_EQ(trajectoryLabelName(TrajectoryLabel::HORIZONTAL), "horizontal");
    EXPECT_EQ(trajectoryLabelName(TrajectoryLabel::VERTICAL), "vertical");
}

// ============================================================================
// Mirror
// ============================================================================

TEST_F(OpticalElementTest, MirrorReflectsDown) {
    Mirror mirror(Point2D(0.125, 0.0));
    Photon photon(1, 0.0, Point2D(0.1, 0.0), Directions::RIGHT);

    InteractionMap hits = mirror.testForInteraction(photon, 1.0, 1);
    ASSERT_EQ(hits.count(TrajectoryLabel::INCIDENT), 1u);

    const InteractionResult& hit = hits.at(TrajectoryLabel::INCIDENT);
    EXPECT_EQ(hit.type, InteractionType::REFLECTED);
    EXPECT_NEAR(hit.point.x, 0.125, 1e-12);
    EXPECT_NEAR(hit.point.y, 0.0, 1e-12);
    EXPECT_NEAR(hit.t, 0.025 / SimulationConstants::PHOTON_SPEED, 1e-12);
    EXPECT_EQ(hit.reflection_direction.y, -1.0);
    EXPECT_EQ(mirror.kind(), OpticalElementKind::MIRROR);
}

TEST_F(OpticalElementTest, NoInteractionCases) {
    Mirror mirror(Point2D(0.125, 0.0));

    // Too far away for one step
    Photon far(1, 0.0, Point2D(-1.0, 0.0), Directions::RIGHT);
    EXPECT_TRUE(mirror.testForInteraction(far, 1.0 / 60.0, 1).empty());

    // Zero time step
    Photon near(2, 0.0, Point2D(0.1, 0.0), Directions::RIGHT);
    EXPECT_TRUE(mirror.testForInteraction(near, 0.0, 1).empty());

    // Candidate that just left this element
    near.possibleStates()[TrajectoryLabel::INCIDENT].last_element = 1;
    EXPECT_TRUE(mirror.testForInteraction(near, 1.0, 1).empty());
    EXPECT_FALSE(mirror.testForInteraction(near, 1.0, 5).empty());

    // Terminal photon
    Photon done(3, 0.0, Point2D(0.1, 0.0), Directions::RIGHT);
    done.markAbsorbed();
    EXPECT_TRUE(mirror.testForInteraction(done, 1.0, 1).empty());
}

TEST_F(OpticalElementTest, ZeroLengthElementRejected) {
    EXPECT_THROW(Mirror(Point2D(), 0.0), InvalidConfigurationError);
    EXPECT_THROW(Mirror(Point2D(), 0.1, 0.0, Point2D()), InvalidConfigurationError);
}

// ============================================================================
// Polarizing beam splitter
// ============================================================================

TEST_F(OpticalElementTest, TransmissionProbability) {
    PolarizingBeamSplitter splitter(Point2D(0.0, 0.0));

    EXPECT_EQ(splitter.transmissionProbability(0.0), 1.0);
    EXPECT_EQ(splitter.transmissionProbability(90.0), 0.0);
    EXPECT_EQ(splitter.transmissionProbability(180.0), 1.0);
    EXPECT_NEAR(splitter.transmissionProbability(45.0), 0.5, 1e-12);
    EXPECT_NEAR(splitter.transmissionProbability(30.0), 0.75, 1e-12);

    splitter.setAxisAngle(30.0);
    EXPECT_EQ(splitter.transmissionProbability(30.0), 1.0);
    EXPECT_EQ(splitter.transmissionProbability(120.0), 0.0);
}

TEST_F(OpticalElementTest, SplitterBranches) {
    PolarizingBeamSplitter splitter(Point2D(0.0, 0.0));
    Photon photon(1, 45.0, Point2D(-0.1, 0.0), Directions::RIGHT);

    InteractionMap hits = splitter.testForInteraction(photon, 1.0, 0);
    ASSERT_EQ(hits.size(), 1u);

    const InteractionResult& hit = hits.at(TrajectoryLabel::INCIDENT);
    EXPECT_EQ(hit.type, InteractionType::SPLIT);
    EXPECT_NEAR(hit.point.x, 0.0, 1e-12);
    ASSERT_EQ(hit.branches.size(), 2u);

    EXPECT_EQ(hit.branches[0].label, TrajectoryLabel::HORIZONTAL);
    EXPECT_EQ(hit.branches[0].direction.x, 1.0);
    EXPECT_NEAR(hit.branches[0].probability, 0.5, 1e-12);

    EXPECT_EQ(hit.branches[1].label, TrajectoryLabel::VERTICAL);
    EXPECT_EQ(hit.branches[1].direction.y, 1.0);
    EXPECT_NEAR(hit.branches[0].probability + hit.branches[1].probability, 1.0, 1e-15);
}

TEST_F(OpticalElementTest, PolarizationPresets) {
    EXPECT_EQ(polarizationPresetAngle(PolarizationPreset::HORIZONTAL, 12.0), 0.0);
    EXPECT_EQ(polarizationPresetAngle(PolarizationPreset::VERTICAL, 12.0), 90.0);
    EXPECT_EQ(polarizationPresetAngle(PolarizationPreset::FORTY_FIVE_DEGREES, 12.0), 45.0);
    EXPECT_EQ(polarizationPresetAngle(PolarizationPreset::CUSTOM, 12.0), 12.0);

    EXPECT_EQ(parsePolarizationPreset("Vertical"), PolarizationPreset::VERTICAL);
    EXPECT_EQ(parsePolarizationPreset("45"), PolarizationPreset::FORTY_FIVE_DEGREES);
    EXPECT_EQ(parsePolarizationPreset("custom"), PolarizationPreset::CUSTOM);
    EXPECT_THROW(parsePolarizationPreset("circular"), InvalidConfigurationError);
}

// ============================================================================
// Detector
// ============================================================================

TEST_F(OpticalElementTest, DetectorCrossing) {
    PhotonDetector detector(Point2D(0.0, 0.2), DetectionDirection::UP, "vertical detector");
    EXPECT_EQ(detector.name(), "vertical detector");

    Photon photon(1, 90.0, Point2D(0.01, 0.1), Directions::UP);
    InteractionMap hits = detector.testForInteraction(photon, 1.0, 3);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits.at(TrajectoryLabel::INCIDENT).type, InteractionType::DETECTED);

    // Outside the aperture
    Photon wide(2, 90.0, Point2D(0.2, 0.1), Directions::UP);
    EXPECT_TRUE(detector.testForInteraction(wide, 1.0, 3).empty());

    // Parallel to the sensor
    Photon parallel(3, 90.0, Point2D(-0.1, 0.2), Directions::RIGHT);
    EXPECT_TRUE(detector.testForInteraction(parallel, 1.0, 3).empty());
}

TEST_F(OpticalElementTest, DetectorOnlySeesPhotonsTravellingIntoIt) {
    PhotonDetector up(Point2D(0.0, 0.2), DetectionDirection::UP, "vertical detector");
    PhotonDetector down(Point2D(0.0, 0.2), DetectionDirection::DOWN, "flipped detector");
    EXPECT_EQ(up.detectionDirection(), DetectionDirection::UP);
    EXPECT_EQ(up.facing().y, 1.0);
    EXPECT_EQ(down.facing().y, -1.0);

    Photon rising(1, 90.0, Point2D(0.0, 0.1), Directions::UP);
    Photon falling(2, 90.0, Point2D(0.0, 0.3), Directions::DOWN);

    EXPECT_EQ(up.testForInteraction(rising, 1.0, 3).size(), 1u);
    EXPECT_TRUE(up.testForInteraction(falling, 1.0, 3).empty())
        << "A photon leaving through the back of the sensor must not register";

    EXPECT_TRUE(down.testForInteraction(rising, 1.0, 3).empty());
    ASSERT_EQ(down.testForInteraction(falling, 1.0, 3).size(), 1u);
    EXPECT_EQ(down.testForInteraction(falling, 1.0, 3).at(TrajectoryLabel::INCIDENT).type,
              InteractionType::DETECTED);
}

TEST_F(OpticalElementTest, DetectorCounts) {
    PhotonDetector detector(Point2D(0.125, -0.075), DetectionDirection::DOWN, "horizontal detector");

    detector.commitDetections(2);
    detector.commitDetections(1);
    EXPECT_EQ(detector.detectionCount(), 3);

    detector.resetDetectionCount();
    EXPECT_EQ(detector.detectionCount(), 0);

    detector.commitDetections(1);
    detector.step(1.0);
    EXPECT_GT(detector.detectionRate(), 0.0);
    detector.reset();
    EXPECT_EQ(detector.detectionRate(), 0.0);
    EXPECT_EQ(detector.detectionCount(), 0);
}

TEST_F(OpticalElementTest, RateAveragerConverges) {
    DetectionRateAverager averager(2.0);
    const double dt = 1.0 / 60.0;

    for (int i = 0; i < 1200; ++i) {
        averager.countEvents(1);
        averager.step(dt);
    }
    // 20 s is ten time constants
    EXPECT_NEAR(averager.rate(), 60.0, 0.01);

    for (int i = 0; i < 1200; ++i) {
        averager.step(dt);
    }
    EXPECT_NEAR(averager.rate(), 0.0, 0.01);

    EXPECT_THROW(DetectionRateAverager(0.0), InvalidConfigurationError);
}
