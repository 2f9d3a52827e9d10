/**
 * @file test_born_rule_statistics.cpp
 * @brief Sampled outcome frequencies against Born-rule and Malus-law predictions
 *
 * Tolerances are at least four standard deviations of the binomial estimate
 * and every generator is seeded, so the checks are deterministic.
 */

#include <gtest/gtest.h>
#include "TwoOutcomeSystem.hpp"
#include "CoinExperiment.hpp"
#include "BlochSphereExperiment.hpp"
#include "SternGerlach.hpp"
#include "PhotonExperiment.hpp"
#include <petsc.h>
#include <cmath>
#include <memory>

using namespace QMSIM;
using SimulationConstants::PI;

class BornRuleStatisticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

// ============================================================================
// Two-outcome systems
// ============================================================================

TEST_F(BornRuleStatisticsTest, BiasedEnsembleFrequency) {
    auto bias = std::make_shared<BiasParameter>(0.3);
    auto random = std::make_shared<RandomSource>(2718);
    TwoOutcomeEnsemble coins(OutcomeLabels::quantumCoin(), Outcome::A, 10000, bias, random);

    coins.prepare();
    coins.measureAll();
    // sigma = sqrt(0.3 * 0.7 / 10000) ~ 0.0046
    EXPECT_NEAR(coins.counts().fractionA(), 0.3, 0.02);
}

TEST_F(BornRuleStatisticsTest, ClassicalCoinFlipsAreFair) {
    CoinExperimentScene::Config config;
    config.coin_count = 10000;
    config.seed = 314;
    CoinExperimentScene scene(config);

    scene.coinSet().startPreparation(true);
    scene.step(1.1);
    ASSERT_EQ(scene.coinSet().measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_NEAR(scene.coinSet().coins().counts().fractionA(), 0.5, 0.02);
}

// ============================================================================
// Bloch sphere
// ============================================================================

TEST_F(BornRuleStatisticsTest, EquatorStateMeasuredAlongZ) {
    BlochSphereExperiment::Config config;
    config.initial_direction = StateDirection::X_PLUS;
    config.single_measurement_mode = false;
    config.seed = 1618;
    BlochSphereExperiment experiment(config);

    for (int trial = 0; trial < 1000; ++trial) {
        experiment.reprepare();
        experiment.observe();
    }
    int total = experiment.upCount() + experiment.downCount();
    ASSERT_EQ(total, 10000);
    EXPECT_NEAR(static_cast<double>(experiment.upCount()) / total, 0.5, 0.02);
}

TEST_F(BornRuleStatisticsTest, TiltedStateMatchesCosineSquared) {
    BlochSphereExperiment::Config config;
    config.single_measurement_mode = false;
    config.seed = 4242;
    BlochSphereExperiment experiment(config);
    experiment.setPreparationAngles(PI / 3.0, 0.0);

    for (int trial = 0; trial < 1000; ++trial) {
        experiment.reprepare();
        experiment.observe();
    }
    double expected = std::pow(std::cos(PI / 6.0), 2);
    double measured = static_cast<double>(experiment.upCount()) /
                      (experiment.upCount() + experiment.downCount());
    EXPECT_NEAR(measured, expected, 0.02);
}

// ============================================================================
// Stern-Gerlach
// ============================================================================

TEST_F(BornRuleStatisticsTest, SequentialOrthogonalMeasurement) {
    SternGerlachExperiment::Config config;
    config.stages = SternGerlachExperiment::presetStages(SpinExperimentPreset::EXPERIMENT_3);
    config.seed = 8080;
    SternGerlachExperiment experiment(config);

    const int runs = 4000;
    for (int i = 0; i < runs; ++i) {
        experiment.measureChain();
    }
    EXPECT_EQ(experiment.device(0).upCount(), runs) << "+Z source passes SGz up";
    EXPECT_NEAR(static_cast<double>(experiment.device(1).upCount()) / runs, 0.5, 0.035);
}

TEST_F(BornRuleStatisticsTest, CustomAxisAtSixtyDegrees) {
    SternGerlachDeviceConfig stage;
    stage.orientation = DeviceOrientation::CUSTOM;
    stage.custom_polar_angle = PI / 3.0;

    SternGerlachExperiment::Config config;
    config.stages = {stage};
    config.seed = 777;
    SternGerlachExperiment experiment(config);
    EXPECT_NEAR(experiment.expectedUpProbabilities().stage1_up, 0.75, 1e-12);

    const int runs = 4000;
    for (int i = 0; i < runs; ++i) {
        experiment.measureChain();
    }
    // sigma ~ 0.0068
    EXPECT_NEAR(static_cast<double>(experiment.device(0).upCount()) / runs, 0.75, 0.03);
}

TEST_F(BornRuleStatisticsTest, ContinuousBeamSplitsEvenly) {
    SternGerlachExperiment::Config config;
    config.stages = SternGerlachExperiment::presetStages(SpinExperimentPreset::EXPERIMENT_2);
    config.source_mode = SourceMode::CONTINUOUS;
    config.seed = 55;
    SternGerlachExperiment experiment(config);

    for (int i = 0; i < 600; ++i) {
        experiment.step(1.0 / 60.0);
    }
    int up = experiment.device(0).upCount();
    int down = experiment.device(0).downCount();
    ASSERT_GT(up + down, 2000);
    EXPECT_NEAR(static_cast<double>(up) / (up + down), 0.5, 0.05);
    EXPECT_GT(experiment.retiredCount(), 0);
}

TEST_F(BornRuleStatisticsTest, SeededRunsAreReproducible) {
    SternGerlachExperiment::Config config;
    config.stages = SternGerlachExperiment::presetStages(SpinExperimentPreset::EXPERIMENT_5);
    config.source_direction = StateDirection::Y_PLUS;
    config.seed = 2020;

    SternGerlachExperiment a(config);
    SternGerlachExperiment b(config);
    for (int i = 0; i < 500; ++i) {
        ChainResult ra = a.measureChain();
        ChainResult rb = b.measureChain();
        ASSERT_EQ(ra.stages[0].up, rb.stages[0].up);
        ASSERT_EQ(ra.stages[1].up, rb.stages[1].up);
    }
}

// ============================================================================
// Photons
// ============================================================================

TEST_F(BornRuleStatisticsTest, MalusLawAtThirtyDegrees) {
    PhotonExperiment::Config config;
    config.emission_rate = 200.0;
    config.polarization = PolarizationPreset::CUSTOM;
    config.custom_polarization_angle = 30.0;
    config.seed = 9001;
    PhotonExperiment experiment(config);

    for (int i = 0; i < 1200; ++i) {
        experiment.step(1.0 / 60.0);
    }
    int h = experiment.horizontalDetector().detectionCount();
    int v = experiment.verticalDetector().detectionCount();
    ASSERT_GT(h + v, 3000);

    // sigma ~ 0.0075 for ~3300 photons
    EXPECT_NEAR(static_cast<double>(h) / (h + v), experiment.expectedHorizontalFraction(), 0.035);
    EXPECT_EQ(experiment.absorbedCount(), 0u) << "Every path of the default layout ends on a detector";
    EXPECT_NEAR(experiment.totalTrackedWeight(),
                static_cast<double>(experiment.launchedCount()), 1e-6);
}

TEST_F(BornRuleStatisticsTest, DiagonalPolarizationRatesBalance) {
    PhotonExperiment::Config config;
    config.emission_rate = 200.0;
    config.seed = 1234;
    PhotonExperiment experiment(config);

    for (int i = 0; i < 1200; ++i) {
        experiment.step(1.0 / 60.0);
    }
    // Rate averages fluctuate more than counts; only the sign is checked tightly
    EXPECT_LT(std::abs(experiment.normalizedOutcomeValue()), 0.4);

    int h = experiment.horizontalDetector().detectionCount();
    int v = experiment.verticalDetector().detectionCount();
    EXPECT_NEAR(static_cast<double>(h) / (h + v), 0.5, 0.04);
}
