#ifndef GTO_BROKER_STRATEGY_SOLUTION_H_
#define GTO_BROKER_STRATEGY_SOLUTION_H_

#include "strategy/Strategy.h"
#include "canonical/SuitMapping.h"
#include "Hand.h"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace gto_broker {
namespace strategy {

// The full per-hand strategy table of one solved decision node, plus the
// solver's convergence figures. Never mutated after construction; shared
// between callers as std::shared_ptr<const Solution>.
class Solution {
 public:
  using Table = std::map<std::string, Strategy>;

  // Args:
  //   table: Hand string (Hand::ToString form) -> strategy.
  //   exploitability: Distance from equilibrium reported by the solver (>= 0).
  //   iterations: Iterations the solver ran (>= 0).
  // Throws:
  //   std::invalid_argument on an empty table, a key that does not match
  //   its strategy's hand, or out-of-range convergence figures.
  Solution(Table table, double exploitability, int iterations);

  const Table& GetTable() const { return table_; }
  double GetExploitability() const { return exploitability_; }
  int GetIterations() const { return iterations_; }
  size_t Size() const { return table_.size(); }

  // nullptr if the hand is not in the table.
  const Strategy* Find(const core::Hand& hand) const;

  // Throws NotFoundError if the hand is not in the table.
  const Strategy& GetStrategy(const core::Hand& hand) const;

  // Rewrites every hand from canonical suits back to real suits.
  Solution ToRealSuits(const canonical::SuitMapping& mapping) const;

  // Every strategy Rescaled by scale. Convergence figures are kept.
  Solution Rescaled(double scale) const;

  json ToJson() const;
  static Solution FromJson(const json& j);

 private:
  Table table_;
  double exploitability_;
  int iterations_;
};

using SolutionPtr = std::shared_ptr<const Solution>;

} // namespace strategy
} // namespace gto_broker

#endif // GTO_BROKER_STRATEGY_SOLUTION_H_
