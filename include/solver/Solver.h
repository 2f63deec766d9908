#ifndef GTO_BROKER_SOLVER_SOLVER_H_
#define GTO_BROKER_SOLVER_SOLVER_H_

#include "canonical/Canonicalizer.h"
#include "strategy/Solution.h"
#include "strategy/Strategy.h"
#include "tools/SolverConfig.h"
#include "GameAction.h"
#include "Hand.h"
#include "Situation.h"

#include <utility>
#include <vector>

namespace gto_broker {
namespace solver {

// Abstract base class for strategy backends. Callers see real cards only;
// canonicalization and the translation back happen here, and derived
// classes only decide where a canonical solution comes from.
class Solver {
 public:
  virtual ~Solver() = default;

  // The whole strategy table of the decision node, keyed by real hands.
  // Throws ConfigurationError for invalid situations, plus whatever the
  // backend raises.
  strategy::SolutionPtr Solve(const core::Situation& situation);

  // Throws NotFoundError if the solved table has no entry for the hand.
  strategy::Strategy GetStrategy(const core::Situation& situation, const core::Hand& hand);

  // Throws NotFoundError if the action is not available to the hand.
  double GetEv(const core::Situation& situation, const core::Hand& hand,
               const core::GameAction& action);

  std::vector<std::pair<core::GameAction, double>> CompareActions(
      const core::Situation& situation, const core::Hand& hand,
      const std::vector<core::GameAction>& actions);

  const canonical::Canonicalizer& GetCanonicalizer() const { return canonicalizer_; }

 protected:
  explicit Solver(config::BucketingPolicy policy) : canonicalizer_(policy) {}

  // Solution for the canonical form, in canonical suits. Never null.
  virtual strategy::SolutionPtr LookupCanonical(const canonical::CanonicalForm& form) = 0;

 private:
  Solver(const Solver&) = delete;
  Solver& operator=(const Solver&) = delete;
  Solver(Solver&&) = delete;
  Solver& operator=(Solver&&) = delete;

  canonical::Canonicalizer canonicalizer_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_SOLVER_H_
