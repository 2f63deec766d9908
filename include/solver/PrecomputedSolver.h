#ifndef GTO_BROKER_SOLVER_PRECOMPUTED_SOLVER_H_
#define GTO_BROKER_SOLVER_PRECOMPUTED_SOLVER_H_

#include "cache/SolutionCache.h"
#include "solver/Solver.h"
#include "tools/SolverConfig.h"

#include <memory>

namespace gto_broker {
namespace solver {

// Answers from precomputed (or previously cached) solutions only; never
// starts a solver run.
class PrecomputedSolver : public Solver {
 public:
  // Throws std::invalid_argument if cache is null.
  explicit PrecomputedSolver(std::shared_ptr<cache::SolutionCache> cache,
                             config::BucketingPolicy policy = {});

  const std::shared_ptr<cache::SolutionCache>& GetCache() const { return cache_; }

 protected:
  // Throws NotFoundError when the cache has no solution for the form.
  strategy::SolutionPtr LookupCanonical(const canonical::CanonicalForm& form) override;

 private:
  std::shared_ptr<cache::SolutionCache> cache_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_PRECOMPUTED_SOLVER_H_
