#include "solver/Solver.h"
#include "Errors.h"

#include <memory>

namespace gto_broker {
namespace solver {

strategy::SolutionPtr Solver::Solve(const core::Situation& situation) {
    canonical::CanonicalForm form = canonicalizer_.Canonicalize(situation);
    strategy::SolutionPtr canonical_solution = LookupCanonical(form);
    if (form.mapping.IsIdentity() && form.pot_scale == 1.0) {
        return canonical_solution;
    }
    return std::make_shared<const strategy::Solution>(
        canonical_solution->ToRealSuits(form.mapping).Rescaled(form.pot_scale));
}

strategy::Strategy Solver::GetStrategy(const core::Situation& situation, const core::Hand& hand) {
    canonical::CanonicalForm form = canonicalizer_.Canonicalize(situation, hand);
    strategy::SolutionPtr canonical_solution = LookupCanonical(form);
    const strategy::Strategy* strategy = canonical_solution->Find(*form.canonical_hand);
    if (strategy == nullptr) {
        throw NotFoundError("No strategy for " + hand.ToString() + " in the solution for " +
                            form.key.SituationPart());
    }
    return strategy->WithHand(hand).Rescaled(form.pot_scale);
}

double Solver::GetEv(const core::Situation& situation, const core::Hand& hand,
                     const core::GameAction& action) {
    return GetStrategy(situation, hand).Ev(action);
}

std::vector<std::pair<core::GameAction, double>> Solver::CompareActions(
        const core::Situation& situation, const core::Hand& hand,
        const std::vector<core::GameAction>& actions) {
    return GetStrategy(situation, hand).CompareActions(actions);
}

} // namespace solver
} // namespace gto_broker
