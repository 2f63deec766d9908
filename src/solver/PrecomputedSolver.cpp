#include "solver/PrecomputedSolver.h"
#include "Errors.h"

#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace solver {

PrecomputedSolver::PrecomputedSolver(std::shared_ptr<cache::SolutionCache> cache,
                                     config::BucketingPolicy policy)
    : Solver(policy), cache_(std::move(cache)) {
    if (!cache_) {
        throw std::invalid_argument("PrecomputedSolver needs a solution cache.");
    }
}

strategy::SolutionPtr PrecomputedSolver::LookupCanonical(const canonical::CanonicalForm& form) {
    strategy::SolutionPtr solution = cache_->Get(form.key.SituationPart());
    if (!solution) {
        throw NotFoundError("No precomputed solution for " + form.key.SituationPart());
    }
    return solution;
}

} // namespace solver
} // namespace gto_broker
