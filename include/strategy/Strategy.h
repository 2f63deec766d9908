#ifndef GTO_BROKER_STRATEGY_STRATEGY_H_
#define GTO_BROKER_STRATEGY_STRATEGY_H_

#include "GameAction.h"
#include "Hand.h"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace gto_broker {
namespace strategy {

// Frequencies of a valid strategy sum to 1 within this tolerance.
constexpr double kFrequencySumTolerance = 1e-6;

// The mixed strategy of one hand at one decision node: a frequency in
// [0, 1] and an EV (big blinds) per available action.
class Strategy {
 public:
  // Args:
  //   hand: The hand this strategy belongs to.
  //   actions: Available actions, in solver order.
  //   frequencies: Parallel to actions, each in [0, 1], summing to 1.
  //   evs: Parallel to actions. May be NaN only where the frequency is 0.
  // Throws:
  //   std::invalid_argument if any of the rules above is broken.
  Strategy(core::Hand hand,
           std::vector<core::GameAction> actions,
           std::vector<double> frequencies,
           std::vector<double> evs);

  const core::Hand& GetHand() const { return hand_; }
  const std::vector<core::GameAction>& GetActions() const { return actions_; }
  const std::vector<double>& GetFrequencies() const { return frequencies_; }
  const std::vector<double>& GetEvs() const { return evs_; }

  // 0.0 for actions the strategy does not contain.
  double Frequency(const core::GameAction& action) const;

  // Throws NotFoundError if the action is not available.
  double Ev(const core::GameAction& action) const;

  // Most frequent action; the earliest one wins ties.
  const core::GameAction& PrimaryAction() const;

  // Frequency-weighted EV of playing this strategy.
  double ExpectedValue() const;

  double FrequencySum() const;

  // EV of each requested action, in request order.
  // Throws NotFoundError if any action is not available.
  std::vector<std::pair<core::GameAction, double>> CompareActions(
      const std::vector<core::GameAction>& actions) const;

  // Same strategy, reported for a different (suit-isomorphic) hand.
  Strategy WithHand(const core::Hand& hand) const;

  // Bet amounts and EVs multiplied by scale: the same strategy in a pot
  // scale times the size of the one it was solved for.
  Strategy Rescaled(double scale) const;

  json ToJson() const;
  static Strategy FromJson(const json& j);

 private:
  size_t IndexOf(const core::GameAction& action) const;

  core::Hand hand_;
  std::vector<core::GameAction> actions_;
  std::vector<double> frequencies_;
  std::vector<double> evs_;
};

} // namespace strategy
} // namespace gto_broker

#endif // GTO_BROKER_STRATEGY_STRATEGY_H_
