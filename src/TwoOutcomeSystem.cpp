#include "TwoOutcomeSystem.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace QMSIM {

// =============================================================================
// BiasParameter
// =============================================================================

BiasParameter::BiasParameter(double value) : value_(0.5) {
    setValue(value);
}

void BiasParameter::setValue(double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        std::ostringstream msg;
        msg << "bias " << value << " outside [0, 1]";
        throw InvalidConfigurationError(msg.str());
    }
    value_ = value;
}

// =============================================================================
// TwoOutcomeSystem
// =============================================================================

TwoOutcomeSystem::TwoOutcomeSystem(OutcomeLabels labels, Outcome initial_state,
                                   std::shared_ptr<BiasParameter> bias,
                                   std::shared_ptr<RandomSource> random)
    : labels_(std::move(labels)), initial_state_(initial_state),
      bias_(std::move(bias)), random_(std::move(random)),
      current_state_(initial_state == Outcome::A ? TwoOutcomeState::A : TwoOutcomeState::B),
      measured_value_(initial_state) {
    if (!bias_) {
        throw InvalidConfigurationError("two-outcome system requires a bias");
    }
    if (!random_) {
        throw InvalidConfigurationError("two-outcome system requires a random source");
    }
    if (labels_.first.empty() || labels_.second.empty() || labels_.first == labels_.second) {
        throw InvalidConfigurationError("two-outcome system requires two distinct labels");
    }
}

void TwoOutcomeSystem::prepare() {
    current_state_ = TwoOutcomeState::UNDETERMINED;
}

void TwoOutcomeSystem::prepare(Outcome forced) {
    current_state_ = forced == Outcome::A ? TwoOutcomeState::A : TwoOutcomeState::B;
    measured_value_ = forced;
}

Outcome TwoOutcomeSystem::measure() {
    if (current_state_ == TwoOutcomeState::UNDETERMINED) {
        measured_value_ = random_->nextBoolean(bias_->value()) ? Outcome::A : Outcome::B;
        current_state_ = measured_value_ == Outcome::A ? TwoOutcomeState::A : TwoOutcomeState::B;
    }
    return measured_value_;
}

void TwoOutcomeSystem::reset() {
    prepare(initial_state_);
}

// =============================================================================
// TwoOutcomeEnsemble
// =============================================================================

TwoOutcomeEnsemble::TwoOutcomeEnsemble(OutcomeLabels labels, Outcome initial_state,
                                       std::size_t size,
                                       std::shared_ptr<BiasParameter> bias,
                                       std::shared_ptr<RandomSource> random)
    : labels_(std::move(labels)), initial_state_(initial_state),
      bias_(std::move(bias)), random_(std::move(random)) {
    rebuild(size);
}

void TwoOutcomeEnsemble::rebuild(std::size_t size) {
    if (size < 1) {
        throw InvalidConfigurationError("ensemble size must be at least 1");
    }
    systems_.clear();
    systems_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        systems_.emplace_back(labels_, initial_state_, bias_, random_);
    }
    recount();
}

void TwoOutcomeEnsemble::prepare() {
    for (auto& system : systems_) {
        system.prepare();
    }
    recount();
}

void TwoOutcomeEnsemble::prepare(Outcome forced) {
    for (auto& system : systems_) {
        system.prepare(forced);
    }
    recount();
    notifyListeners();
}

const OutcomeCounts& TwoOutcomeEnsemble::measureAll() {
    for (auto& system : systems_) {
        system.measure();
    }
    recount();
    notifyListeners();
    return counts_;
}

void TwoOutcomeEnsemble::resize(std::size_t size) {
    rebuild(size);
    notifyListeners();
}

void TwoOutcomeEnsemble::reset() {
    for (auto& system : systems_) {
        system.reset();
    }
    recount();
    notifyListeners();
}

std::size_t TwoOutcomeEnsemble::addListener(Listener listener) {
    std::size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void TwoOutcomeEnsemble::removeListener(std::size_t id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const std::pair<std::size_t, Listener>& entry) {
                                        return entry.first == id;
                                    }),
                     listeners_.end());
}

const TwoOutcomeSystem& TwoOutcomeEnsemble::member(std::size_t index) const {
    if (index >= systems_.size()) {
        throw std::out_of_range("ensemble member index out of range");
    }
    return systems_[index];
}

void TwoOutcomeEnsemble::recount() {
    // Undetermined members are not counted
    counts_ = OutcomeCounts();
    for (const auto& system : systems_) {
        if (system.currentState() == TwoOutcomeState::A) {
            counts_.count_a++;
        } else if (system.currentState() == TwoOutcomeState::B) {
            counts_.count_b++;
        }
    }
}

void TwoOutcomeEnsemble::notifyListeners() {
    for (const auto& entry : listeners_) {
        entry.second(*this);
    }
}

} // namespace QMSIM
