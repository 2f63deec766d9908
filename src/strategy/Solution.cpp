#include "strategy/Solution.h"
#include "Errors.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace strategy {

Solution::Solution(Table table, double exploitability, int iterations)
    : table_(std::move(table)),
      exploitability_(exploitability),
      iterations_(iterations) {
    if (table_.empty()) {
        throw std::invalid_argument("Solution table is empty.");
    }
    if (!std::isfinite(exploitability_) || exploitability_ < 0.0) {
        std::ostringstream oss;
        oss << "Exploitability must be a finite non-negative number, got " << exploitability_;
        throw std::invalid_argument(oss.str());
    }
    if (iterations_ < 0) {
        throw std::invalid_argument("Iteration count cannot be negative.");
    }
    for (const auto& [key, strategy] : table_) {
        if (key != strategy.GetHand().ToString()) {
            throw std::invalid_argument("Solution key " + key + " does not match hand " +
                                        strategy.GetHand().ToString());
        }
    }
}

const Strategy* Solution::Find(const core::Hand& hand) const {
    auto it = table_.find(hand.ToString());
    return it == table_.end() ? nullptr : &it->second;
}

const Strategy& Solution::GetStrategy(const core::Hand& hand) const {
    const Strategy* strategy = Find(hand);
    if (strategy == nullptr) {
        throw NotFoundError("No strategy for hand " + hand.ToString() + " in solution of " +
                            std::to_string(table_.size()) + " hands.");
    }
    return *strategy;
}

Solution Solution::ToRealSuits(const canonical::SuitMapping& mapping) const {
    if (mapping.IsIdentity()) {
        return *this;
    }
    Table relabeled;
    for (const auto& [key, strategy] : table_) {
        core::Hand real_hand = mapping.ToReal(strategy.GetHand());
        relabeled.emplace(real_hand.ToString(), strategy.WithHand(real_hand));
    }
    return Solution(std::move(relabeled), exploitability_, iterations_);
}

Solution Solution::Rescaled(double scale) const {
    if (scale == 1.0) {
        return *this;
    }
    Table rescaled;
    for (const auto& [key, strategy] : table_) {
        rescaled.emplace(key, strategy.Rescaled(scale));
    }
    return Solution(std::move(rescaled), exploitability_, iterations_);
}

// --- JSON ---

json Solution::ToJson() const {
    json j;
    j["exploitability"] = exploitability_;
    j["iterations"] = iterations_;
    json strategies = json::object();
    for (const auto& [key, strategy] : table_) {
        strategies[key] = strategy.ToJson();
    }
    j["strategies"] = strategies;
    return j;
}

Solution Solution::FromJson(const json& j) {
    Table table;
    for (const auto& [key, value] : j.at("strategies").items()) {
        Strategy strategy = Strategy::FromJson(value);
        table.emplace(key, std::move(strategy));
    }
    return Solution(std::move(table),
                    j.at("exploitability").get<double>(),
                    j.at("iterations").get<int>());
}

} // namespace strategy
} // namespace gto_broker
