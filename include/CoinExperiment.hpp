/**
 * @file CoinExperiment.hpp
 * @brief Classical and quantum coin experiments
 *
 * A CoinSet is a TwoOutcomeEnsemble plus the measurement state machine of a
 * coin experiment:
 *
 *   READY_TO_BE_MEASURED --prepare--> PREPARING_TO_BE_MEASURED (1 s)
 *     classical: --> MEASURED_AND_HIDDEN --reveal--> REVEALED --hide--> ...
 *     quantum:   --> READY_TO_BE_MEASURED --reveal/measure--> REVEALED
 *
 * Classical coins land during preparation, so their values are fixed before
 * anyone looks. Quantum coins stay undetermined until they are revealed.
 * The CoinExperimentScene pairs a single coin with a multi-coin set that
 * share one bias and one random source.
 */

#ifndef COIN_EXPERIMENT_HPP
#define COIN_EXPERIMENT_HPP

#include "QMSIM.hpp"
#include "TwoOutcomeSystem.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace QMSIM {

/**
 * @brief Coin ensemble with a timed preparation phase
 */
class CoinSet {
public:
    CoinSet(SystemType system_type, Outcome initial_face, std::size_t coin_count,
            std::shared_ptr<BiasParameter> bias, std::shared_ptr<RandomSource> random);

    /// Start the preparation phase; completes after MEASUREMENT_PREPARATION_TIME of step()
    void startPreparation(bool reveal_when_prepared = false);

    /// Complete the preparation immediately
    void prepareNow();

    /// Show the values, sampling first if they are still undetermined
    void reveal();

    /// Hide revealed values (REVEALED only)
    void hide();

    /**
     * @brief Measure the set and return its counts
     *
     * While PREPARING_TO_BE_MEASURED the preparation is completed first, so a
     * measurement requested mid-flip behaves as if the flip had finished.
     */
    const OutcomeCounts& measure();

    /// Cancel any preparation and force every coin to a face
    void setMeasurementValuesImmediate(Outcome face);

    /// Multi-coin sets only accept MULTI_COIN_EXPERIMENT_QUANTITIES
    void setCoinCount(std::size_t count);

    /// Advance the preparation timer
    void step(double dt);

    void reset();

    SystemType systemType() const { return system_type_; }
    ExperimentMeasurementState measurementState() const { return state_; }
    double preparationTimeRemaining() const { return preparation_time_remaining_; }
    std::size_t coinCount() const { return coins_.size(); }

    const TwoOutcomeEnsemble& coins() const { return coins_; }
    TwoOutcomeEnsemble& coins() { return coins_; }

private:
    ExperimentMeasurementState initialMeasurementState() const;

    SystemType system_type_;
    Outcome initial_face_;
    std::size_t initial_count_;
    bool is_multi_coin_;

    TwoOutcomeEnsemble coins_;
    ExperimentMeasurementState state_;

    bool preparing_ = false;
    bool reveal_when_prepared_ = false;
    double preparation_time_remaining_ = 0.0;
};

/// Initial state choices offered for a coin scene
enum class InitialCoinState {
    HEADS,
    TAILS,
    UP,
    DOWN,
    SUPERPOSED
};

/**
 * @brief One coin experiment scene: single coin plus multi-coin set
 */
class CoinExperimentScene {
public:
    struct Config {
        SystemType system_type = SystemType::CLASSICAL;
        InitialCoinState initial_state = InitialCoinState::HEADS;
        double bias = 0.5;
        std::size_t coin_count = SimulationConstants::DEFAULT_MULTI_COIN_QUANTITY;
        std::uint64_t seed = RandomSource::DEFAULT_SEED;
    };

    explicit CoinExperimentScene(const Config& config);

    /**
     * @brief Switch between the preparation and measurement areas
     *
     * Leaving preparation (false) sets both sets to the chosen initial face.
     * Entering preparation (true) completes any pending preparation.
     */
    void setPreparingExperiment(bool preparing);
    bool isPreparingExperiment() const { return preparing_experiment_; }

    /**
     * @brief Select the initial state
     *
     * Classical scenes accept HEADS / TAILS. Quantum scenes accept UP / DOWN /
     * SUPERPOSED; UP and DOWN also move the bias to 1 and 0.
     */
    void setInitialState(InitialCoinState state);
    InitialCoinState initialState() const { return initial_state_; }

    /// Quantum scenes derive the initial state from the bias (1 -> up, 0 -> down)
    void setBias(double bias);
    double bias() const { return bias_->value(); }

    void step(double dt);
    void reset();

    SystemType systemType() const { return config_.system_type; }
    CoinSet& singleCoin() { return single_coin_; }
    const CoinSet& singleCoin() const { return single_coin_; }
    CoinSet& coinSet() { return multiple_coins_; }
    const CoinSet& coinSet() const { return multiple_coins_; }
    RandomSource& random() { return *random_; }

private:
    Outcome initialFace() const;
    void validateInitialState(InitialCoinState state) const;

    Config config_;
    std::shared_ptr<RandomSource> random_;
    std::shared_ptr<BiasParameter> bias_;

    InitialCoinState initial_state_;
    bool preparing_experiment_ = true;

    CoinSet single_coin_;
    CoinSet multiple_coins_;
};

SystemType parseSystemType(const std::string& text);
InitialCoinState parseInitialCoinState(const std::string& text);

} // namespace QMSIM

#endif // COIN_EXPERIMENT_HPP
