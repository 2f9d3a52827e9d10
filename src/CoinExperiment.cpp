#include "CoinExperiment.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

OutcomeLabels labelsFor(SystemType type) {
    return type == SystemType::CLASSICAL ? OutcomeLabels::classicalCoin()
                                         : OutcomeLabels::quantumCoin();
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isMultiCoinQuantity(std::size_t count) {
    return std::find(MULTI_COIN_EXPERIMENT_QUANTITIES.begin(),
                     MULTI_COIN_EXPERIMENT_QUANTITIES.end(),
                     count) != MULTI_COIN_EXPERIMENT_QUANTITIES.end();
}

} // anonymous namespace

// =============================================================================
// CoinSet
// =============================================================================

CoinSet::CoinSet(SystemType system_type, Outcome initial_face, std::size_t coin_count,
                 std::shared_ptr<BiasParameter> bias, std::shared_ptr<RandomSource> random)
    : system_type_(system_type), initial_face_(initial_face), initial_count_(coin_count),
      is_multi_coin_(coin_count > 1),
      coins_(labelsFor(system_type), initial_face, coin_count, std::move(bias), std::move(random)),
      state_(ExperimentMeasurementState::REVEALED) {
    if (is_multi_coin_ && !isMultiCoinQuantity(coin_count)) {
        throw InvalidConfigurationError("unsupported coin quantity " + std::to_string(coin_count));
    }
    state_ = initialMeasurementState();
    if (state_ == ExperimentMeasurementState::READY_TO_BE_MEASURED) {
        coins_.prepare();
    }
}

ExperimentMeasurementState CoinSet::initialMeasurementState() const {
    return system_type_ == SystemType::CLASSICAL ? ExperimentMeasurementState::REVEALED
                                                 : ExperimentMeasurementState::READY_TO_BE_MEASURED;
}

void CoinSet::startPreparation(bool reveal_when_prepared) {
    state_ = ExperimentMeasurementState::PREPARING_TO_BE_MEASURED;
    preparing_ = true;
    reveal_when_prepared_ = reveal_when_prepared;
    preparation_time_remaining_ = MEASUREMENT_PREPARATION_TIME;
}

void CoinSet::prepareNow() {
    preparing_ = false;
    preparation_time_remaining_ = 0.0;

    coins_.prepare();
    if (system_type_ == SystemType::CLASSICAL) {
        // The coins have landed; nobody has looked yet
        coins_.measureAll();
        state_ = ExperimentMeasurementState::MEASURED_AND_HIDDEN;
    } else {
        state_ = ExperimentMeasurementState::READY_TO_BE_MEASURED;
    }
}

void CoinSet::reveal() {
    switch (state_) {
        case ExperimentMeasurementState::PREPARING_TO_BE_MEASURED:
            throw InvalidStateError("coins cannot be revealed while being prepared");
        case ExperimentMeasurementState::READY_TO_BE_MEASURED:
            coins_.measureAll();
            break;
        case ExperimentMeasurementState::MEASURED_AND_HIDDEN:
        case ExperimentMeasurementState::REVEALED:
            break;
    }
    state_ = ExperimentMeasurementState::REVEALED;
}

void CoinSet::hide() {
    if (state_ != ExperimentMeasurementState::REVEALED) {
        throw InvalidStateError("only revealed coins can be hidden");
    }
    state_ = ExperimentMeasurementState::MEASURED_AND_HIDDEN;
}

const OutcomeCounts& CoinSet::measure() {
    if (state_ == ExperimentMeasurementState::PREPARING_TO_BE_MEASURED) {
        prepareNow();
    }
    if (state_ == ExperimentMeasurementState::READY_TO_BE_MEASURED) {
        coins_.measureAll();
        state_ = ExperimentMeasurementState::REVEALED;
    }
    return coins_.counts();
}

void CoinSet::setMeasurementValuesImmediate(Outcome face) {
    preparing_ = false;
    reveal_when_prepared_ = false;
    preparation_time_remaining_ = 0.0;

    coins_.prepare(face);
    if (system_type_ == SystemType::CLASSICAL) {
        state_ = ExperimentMeasurementState::REVEALED;
    } else {
        // Shown face stays as the last value; the state is a superposition again
        coins_.prepare();
        state_ = ExperimentMeasurementState::READY_TO_BE_MEASURED;
    }
}

void CoinSet::setCoinCount(std::size_t count) {
    if (!is_multi_coin_ || !isMultiCoinQuantity(count)) {
        throw InvalidConfigurationError("unsupported coin quantity " + std::to_string(count));
    }
    if (count == coins_.size()) return;

    coins_.resize(count);
    if (state_ == ExperimentMeasurementState::READY_TO_BE_MEASURED ||
        state_ == ExperimentMeasurementState::PREPARING_TO_BE_MEASURED) {
        coins_.prepare();
    }
}

void CoinSet::step(double dt) {
    if (!preparing_ || dt <= 0.0) return;

    preparation_time_remaining_ -= dt;
    if (preparation_time_remaining_ <= 0.0) {
        bool reveal_now = reveal_when_prepared_;
        reveal_when_prepared_ = false;
        prepareNow();
        if (reveal_now) {
            reveal();
        }
    }
}

void CoinSet::reset() {
    preparing_ = false;
    reveal_when_prepared_ = false;
    preparation_time_remaining_ = 0.0;

    if (coins_.size() != initial_count_) {
        coins_.resize(initial_count_);
    }
    coins_.reset();
    state_ = initialMeasurementState();
    if (state_ == ExperimentMeasurementState::READY_TO_BE_MEASURED) {
        coins_.prepare();
    }
}

// =============================================================================
// CoinExperimentScene
// =============================================================================

CoinExperimentScene::CoinExperimentScene(const Config& config)
    : config_(config),
      random_(std::make_shared<RandomSource>(config.seed)),
      bias_(std::make_shared<BiasParameter>(config.bias)),
      initial_state_(config.initial_state),
      single_coin_(config.system_type, initialFace(), 1, bias_, random_),
      multiple_coins_(config.system_type, initialFace(), config.coin_count, bias_, random_) {
    validateInitialState(config.initial_state);
}

void CoinExperimentScene::validateInitialState(InitialCoinState state) const {
    bool classical_state = state == InitialCoinState::HEADS || state == InitialCoinState::TAILS;
    if (config_.system_type == SystemType::CLASSICAL && !classical_state) {
        throw InvalidConfigurationError("classical coins start as heads or tails");
    }
    if (config_.system_type == SystemType::QUANTUM && classical_state) {
        throw InvalidConfigurationError("quantum coins start as up, down or superposed");
    }
}

Outcome CoinExperimentScene::initialFace() const {
    switch (initial_state_) {
        case InitialCoinState::HEADS:
        case InitialCoinState::UP:
        case InitialCoinState::SUPERPOSED:
            return Outcome::A;
        case InitialCoinState::TAILS:
        case InitialCoinState::DOWN:
            return Outcome::B;
    }
    return Outcome::A;
}

void CoinExperimentScene::setPreparingExperiment(bool preparing) {
    if (preparing == preparing_experiment_) return;
    preparing_experiment_ = preparing;

    if (preparing) {
        single_coin_.prepareNow();
        multiple_coins_.prepareNow();
    } else {
        Outcome face = initialFace();
        single_coin_.setMeasurementValuesImmediate(face);
        multiple_coins_.setMeasurementValuesImmediate(face);
    }
}

void CoinExperimentScene::setInitialState(InitialCoinState state) {
    validateInitialState(state);
    initial_state_ = state;

    if (config_.system_type == SystemType::QUANTUM && state != InitialCoinState::SUPERPOSED) {
        bias_->setValue(state == InitialCoinState::UP ? 1.0 : 0.0);
    }
}

void CoinExperimentScene::setBias(double bias) {
    bias_->setValue(bias);

    if (config_.system_type == SystemType::QUANTUM) {
        if (bias == 1.0) {
            initial_state_ = InitialCoinState::UP;
        } else if (bias == 0.0) {
            initial_state_ = InitialCoinState::DOWN;
        } else {
            initial_state_ = InitialCoinState::SUPERPOSED;
        }
    }
}

void CoinExperimentScene::step(double dt) {
    single_coin_.step(dt);
    multiple_coins_.step(dt);
}

void CoinExperimentScene::reset() {
    preparing_experiment_ = true;
    initial_state_ = config_.initial_state;
    bias_->setValue(config_.bias);
    random_->reseed(config_.seed);
    single_coin_.reset();
    multiple_coins_.reset();
}

// =============================================================================
// Parsing helpers
// =============================================================================

SystemType parseSystemType(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "classical") return SystemType::CLASSICAL;
    if (t == "quantum") return SystemType::QUANTUM;
    throw InvalidConfigurationError("unknown coin system type '" + text + "'");
}

InitialCoinState parseInitialCoinState(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "heads") return InitialCoinState::HEADS;
    if (t == "tails") return InitialCoinState::TAILS;
    if (t == "up") return InitialCoinState::UP;
    if (t == "down") return InitialCoinState::DOWN;
    if (t == "superposed") return InitialCoinState::SUPERPOSED;
    throw InvalidConfigurationError("unknown initial coin state '" + text + "'");
}

} // namespace QMSIM
