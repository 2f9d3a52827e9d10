/**
 * @file TwoOutcomeSystem.hpp
 * @brief Biased binary systems with prepare / measure semantics
 *
 * A TwoOutcomeSystem holds one of two labelled values (heads/tails, up/down).
 * prepare() puts it in an undetermined state; measure() then draws a value
 * with probability `bias` for the first label and keeps it until the next
 * prepare(). A TwoOutcomeEnsemble holds N such systems sharing one bias and
 * one RandomSource, and keeps aggregate counts.
 */

#ifndef TWO_OUTCOME_SYSTEM_HPP
#define TWO_OUTCOME_SYSTEM_HPP

#include "RandomSource.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace QMSIM {

/// Concrete outcomes
enum class Outcome {
    A,
    B
};

/// Outcome or the undetermined state held between prepare() and measure()
enum class TwoOutcomeState {
    A,
    B,
    UNDETERMINED
};

/**
 * @brief Display labels of the two outcomes
 */
struct OutcomeLabels {
    std::string first;
    std::string second;

    const std::string& labelFor(Outcome outcome) const {
        return outcome == Outcome::A ? first : second;
    }

    static OutcomeLabels classicalCoin() { return {"heads", "tails"}; }
    static OutcomeLabels quantumCoin() { return {"up", "down"}; }
};

/**
 * @brief Probability of outcome A, shared by every system of an experiment
 */
class BiasParameter {
public:
    explicit BiasParameter(double value = 0.5);

    double value() const { return value_; }
    void setValue(double value);   ///< throws InvalidConfigurationError outside [0, 1]

private:
    double value_;
};

struct OutcomeCounts {
    std::size_t count_a = 0;
    std::size_t count_b = 0;

    std::size_t total() const { return count_a + count_b; }
    double fractionA() const {
        return total() == 0 ? 0.0 : static_cast<double>(count_a) / static_cast<double>(total());
    }
};

/**
 * @brief Single biased two-outcome system
 */
class TwoOutcomeSystem {
public:
    TwoOutcomeSystem(OutcomeLabels labels, Outcome initial_state,
                     std::shared_ptr<BiasParameter> bias,
                     std::shared_ptr<RandomSource> random);

    /// Enter the undetermined state
    void prepare();

    /// Force a known value (no sampling)
    void prepare(Outcome forced);

    /**
     * @brief Resolve the state and return the measured value
     *
     * From UNDETERMINED a uniform u is drawn and A is chosen when u < bias.
     * Measuring an already determined system returns the same value without
     * drawing.
     */
    Outcome measure();

    /// Back to the initial concrete state
    void reset();

    TwoOutcomeState currentState() const { return current_state_; }
    Outcome measuredValue() const { return measured_value_; }
    const std::string& measuredLabel() const { return labels_.labelFor(measured_value_); }
    bool isDetermined() const { return current_state_ != TwoOutcomeState::UNDETERMINED; }

    const OutcomeLabels& stateValues() const { return labels_; }
    double bias() const { return bias_->value(); }
    Outcome initialState() const { return initial_state_; }

private:
    OutcomeLabels labels_;
    Outcome initial_state_;
    std::shared_ptr<BiasParameter> bias_;
    std::shared_ptr<RandomSource> random_;

    TwoOutcomeState current_state_;
    Outcome measured_value_;
};

/**
 * @brief Ordered collection of N independent systems with shared bias
 *
 * Listeners registered with addListener() are called, in registration
 * order, after a mutation of the measured data has fully completed.
 */
class TwoOutcomeEnsemble {
public:
    using Listener = std::function<void(const TwoOutcomeEnsemble&)>;

    TwoOutcomeEnsemble(OutcomeLabels labels, Outcome initial_state, std::size_t size,
                       std::shared_ptr<BiasParameter> bias,
                       std::shared_ptr<RandomSource> random);

    /// All members undetermined
    void prepare();

    /// All members forced to one value
    void prepare(Outcome forced);

    /// Measure every member in order and recompute the counts
    const OutcomeCounts& measureAll();

    /// Change the number of members; all members return to the initial state
    void resize(std::size_t size);

    void reset();

    std::size_t addListener(Listener listener);
    void removeListener(std::size_t id);

    std::size_t size() const { return systems_.size(); }
    const TwoOutcomeSystem& member(std::size_t index) const;
    const std::vector<TwoOutcomeSystem>& members() const { return systems_; }
    const OutcomeCounts& counts() const { return counts_; }
    double bias() const { return bias_->value(); }
    const OutcomeLabels& stateValues() const { return labels_; }

private:
    void rebuild(std::size_t size);
    void recount();
    void notifyListeners();

    OutcomeLabels labels_;
    Outcome initial_state_;
    std::shared_ptr<BiasParameter> bias_;
    std::shared_ptr<RandomSource> random_;

    std::vector<TwoOutcomeSystem> systems_;
    OutcomeCounts counts_;

    std::vector<std::pair<std::size_t, Listener>> listeners_;
    std::size_t next_listener_id_ = 0;
};

} // namespace QMSIM

#endif // TWO_OUTCOME_SYSTEM_HPP
