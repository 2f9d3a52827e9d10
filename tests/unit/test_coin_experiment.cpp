/**
 * @file test_coin_experiment.cpp
 * @brief Unit tests for coin sets and coin experiment scenes
 */

#include <gtest/gtest.h>
#include "CoinExperiment.hpp"
#include "MeasurementErrors.hpp"
#include <petsc.h>
#include <memory>

using namespace QMSIM;

class CoinExperimentTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        bias = std::make_shared<BiasParameter>(0.5);
        random = std::make_shared<RandomSource>(31);
    }

    CoinExperimentScene::Config quantumConfig() const {
        CoinExperimentScene::Config config;
        config.system_type = SystemType::QUANTUM;
        config.initial_state = InitialCoinState::SUPERPOSED;
        config.coin_count = 100;
        config.seed = 11;
        return config;
    }

    int rank;
    std::shared_ptr<BiasParameter> bias;
    std::shared_ptr<RandomSource> random;
};

// ============================================================================
// CoinSet state machine
// ============================================================================

TEST_F(CoinExperimentTest, InitialStates) {
    CoinSet classical(SystemType::CLASSICAL, Outcome::A, 10, bias, random);
    EXPECT_EQ(classical.measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(classical.coins().counts().count_a, 10u);

    CoinSet quantum(SystemType::QUANTUM, Outcome::A, 10, bias, random);
    EXPECT_EQ(quantum.measurementState(), ExperimentMeasurementState::READY_TO_BE_MEASURED);
    EXPECT_EQ(quantum.coins().counts().total(), 0u);
    EXPECT_FALSE(quantum.coins().member(0).isDetermined());
}

TEST_F(CoinExperimentTest, ClassicalFlipLandsHidden) {
    CoinSet coins(SystemType::CLASSICAL, Outcome::A, 100, bias, random);

    coins.startPreparation();
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::PREPARING_TO_BE_MEASURED);
    EXPECT_DOUBLE_EQ(coins.preparationTimeRemaining(), 1.0);

    coins.step(0.5);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::PREPARING_TO_BE_MEASURED);

    coins.step(0.6);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::MEASURED_AND_HIDDEN);
    EXPECT_EQ(coins.coins().counts().total(), 100u) << "Classical values exist before reveal";

    coins.reveal();
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::REVEALED);

    coins.hide();
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::MEASURED_AND_HIDDEN);
}

TEST_F(CoinExperimentTest, QuantumFlipStaysUndetermined) {
    CoinSet coins(SystemType::QUANTUM, Outcome::A, 100, bias, random);

    coins.startPreparation();
    coins.step(1.0);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::READY_TO_BE_MEASURED);
    EXPECT_EQ(coins.coins().counts().total(), 0u);

    coins.reveal();
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(coins.coins().counts().total(), 100u);
}

TEST_F(CoinExperimentTest, RevealWhenPrepared) {
    CoinSet coins(SystemType::QUANTUM, Outcome::A, 10, bias, random);

    coins.startPreparation(true);
    coins.step(1.0);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(coins.coins().counts().total(), 10u);
}

TEST_F(CoinExperimentTest, InvalidTransitions) {
    CoinSet coins(SystemType::QUANTUM, Outcome::A, 10, bias, random);

    EXPECT_THROW(coins.hide(), InvalidStateError) << "Ready coins cannot be hidden";

    coins.startPreparation();
    EXPECT_THROW(coins.reveal(), InvalidStateError);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::PREPARING_TO_BE_MEASURED);
}

TEST_F(CoinExperimentTest, MeasureDuringPreparationCompletesIt) {
    CoinSet coins(SystemType::QUANTUM, Outcome::A, 100, bias, random);
    coins.startPreparation();

    const OutcomeCounts& counts = coins.measure();
    EXPECT_EQ(counts.total(), 100u);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_DOUBLE_EQ(coins.preparationTimeRemaining(), 0.0);
}

TEST_F(CoinExperimentTest, CoinQuantities) {
    EXPECT_THROW(CoinSet(SystemType::CLASSICAL, Outcome::A, 7, bias, random),
                 InvalidConfigurationError);

    CoinSet coins(SystemType::QUANTUM, Outcome::A, 10, bias, random);
    coins.setCoinCount(10000);
    EXPECT_EQ(coins.coinCount(), 10000u);
    EXPECT_EQ(coins.coins().counts().total(), 0u) << "Resized quantum set is still undetermined";
    EXPECT_THROW(coins.setCoinCount(50), InvalidConfigurationError);

    CoinSet single(SystemType::QUANTUM, Outcome::A, 1, bias, random);
    EXPECT_THROW(single.setCoinCount(10), InvalidConfigurationError);
}

TEST_F(CoinExperimentTest, ResetRestoresCount) {
    CoinSet coins(SystemType::CLASSICAL, Outcome::B, 10, bias, random);
    coins.setCoinCount(100);
    coins.startPreparation();
    coins.reset();

    EXPECT_EQ(coins.coinCount(), 10u);
    EXPECT_EQ(coins.measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(coins.coins().counts().count_b, 10u);
}

// ============================================================================
// Scene
// ============================================================================

TEST_F(CoinExperimentTest, SceneValidatesInitialState) {
    CoinExperimentScene::Config config;
    config.initial_state = InitialCoinState::UP;
    EXPECT_THROW(CoinExperimentScene scene(config), InvalidConfigurationError);

    CoinExperimentScene::Config quantum = quantumConfig();
    quantum.initial_state = InitialCoinState::HEADS;
    EXPECT_THROW(CoinExperimentScene scene(quantum), InvalidConfigurationError);
}

TEST_F(CoinExperimentTest, QuantumInitialStateDrivesBias) {
    CoinExperimentScene scene(quantumConfig());

    scene.setInitialState(InitialCoinState::UP);
    EXPECT_DOUBLE_EQ(scene.bias(), 1.0);
    scene.setInitialState(InitialCoinState::DOWN);
    EXPECT_DOUBLE_EQ(scene.bias(), 0.0);
    EXPECT_THROW(scene.setInitialState(InitialCoinState::TAILS), InvalidConfigurationError);
}

TEST_F(CoinExperimentTest, QuantumBiasDrivesInitialState) {
    CoinExperimentScene scene(quantumConfig());

    scene.setBias(1.0);
    EXPECT_EQ(scene.initialState(), InitialCoinState::UP);
    scene.setBias(0.0);
    EXPECT_EQ(scene.initialState(), InitialCoinState::DOWN);
    scene.setBias(0.3);
    EXPECT_EQ(scene.initialState(), InitialCoinState::SUPERPOSED);
    EXPECT_THROW(scene.setBias(1.5), InvalidConfigurationError);
}

TEST_F(CoinExperimentTest, SingleAndMultiShareBias) {
    CoinExperimentScene scene(quantumConfig());
    scene.setBias(0.8);

    EXPECT_DOUBLE_EQ(scene.singleCoin().coins().bias(), 0.8);
    EXPECT_DOUBLE_EQ(scene.coinSet().coins().bias(), 0.8);
}

TEST_F(CoinExperimentTest, LeavingPreparationShowsInitialFace) {
    CoinExperimentScene::Config config;
    config.initial_state = InitialCoinState::TAILS;
    config.coin_count = 10;
    CoinExperimentScene classical(config);

    classical.setPreparingExperiment(false);
    EXPECT_FALSE(classical.isPreparingExperiment());
    EXPECT_EQ(classical.coinSet().measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(classical.coinSet().coins().counts().count_b, 10u);

    CoinExperimentScene quantum(quantumConfig());
    quantum.setInitialState(InitialCoinState::UP);
    quantum.setPreparingExperiment(false);
    EXPECT_EQ(quantum.singleCoin().measurementState(),
              ExperimentMeasurementState::READY_TO_BE_MEASURED);
    const TwoOutcomeSystem& coin = quantum.singleCoin().coins().member(0);
    EXPECT_EQ(coin.measuredValue(), Outcome::A);
    EXPECT_FALSE(coin.isDetermined());
}

TEST_F(CoinExperimentTest, BiasedQuantumCoinsAllUp) {
    CoinExperimentScene scene(quantumConfig());
    scene.setInitialState(InitialCoinState::UP);

    const OutcomeCounts& counts = scene.coinSet().measure();
    EXPECT_EQ(counts.count_a, 100u);
    EXPECT_EQ(counts.count_b, 0u);
}

TEST_F(CoinExperimentTest, SceneStepDrivesBothSets) {
    CoinExperimentScene scene(quantumConfig());
    scene.singleCoin().startPreparation(true);
    scene.coinSet().startPreparation(true);

    for (int i = 0; i < 70; ++i) {
        scene.step(1.0 / 60.0);
    }
    EXPECT_EQ(scene.singleCoin().measurementState(), ExperimentMeasurementState::REVEALED);
    EXPECT_EQ(scene.coinSet().measurementState(), ExperimentMeasurementState::REVEALED);
}

TEST_F(CoinExperimentTest, SceneResetIsReproducible) {
    CoinExperimentScene scene(quantumConfig());
    OutcomeCounts first = scene.coinSet().measure();

    scene.setBias(0.9);
    scene.reset();
    EXPECT_DOUBLE_EQ(scene.bias(), 0.5);
    EXPECT_EQ(scene.initialState(), InitialCoinState::SUPERPOSED);

    OutcomeCounts second = scene.coinSet().measure();
    EXPECT_EQ(first.count_a, second.count_a);
    EXPECT_EQ(first.count_b, second.count_b);
}

TEST_F(CoinExperimentTest, ParseHelpers) {
    EXPECT_EQ(parseSystemType("Quantum"), SystemType::QUANTUM);
    EXPECT_EQ(parseSystemType("classical"), SystemType::CLASSICAL);
    EXPECT_THROW(parseSystemType("qubit"), InvalidConfigurationError);

    EXPECT_EQ(parseInitialCoinState("TAILS"), InitialCoinState::TAILS);
    EXPECT_EQ(parseInitialCoinState("superposed"), InitialCoinState::SUPERPOSED);
    EXPECT_THROW(parseInitialCoinState("edge"), InvalidConfigurationError);
}
