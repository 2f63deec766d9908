#include "strategy/Strategy.h"
#include "Errors.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace strategy {

namespace {
constexpr size_t kNotFound = static_cast<size_t>(-1);
} // namespace

Strategy::Strategy(core::Hand hand,
                   std::vector<core::GameAction> actions,
                   std::vector<double> frequencies,
                   std::vector<double> evs)
    : hand_(std::move(hand)),
      actions_(std::move(actions)),
      frequencies_(std::move(frequencies)),
      evs_(std::move(evs)) {
    if (actions_.empty()) {
        throw std::invalid_argument("Strategy for " + hand_.ToString() + " has no actions.");
    }
    if (frequencies_.size() != actions_.size() || evs_.size() != actions_.size()) {
        std::ostringstream oss;
        oss << "Strategy for " << hand_.ToString() << " has " << actions_.size()
            << " actions but " << frequencies_.size() << " frequencies and "
            << evs_.size() << " EVs.";
        throw std::invalid_argument(oss.str());
    }
    for (size_t i = 0; i < actions_.size(); ++i) {
        double f = frequencies_[i];
        if (!std::isfinite(f) || f < 0.0 || f > 1.0 + kFrequencySumTolerance) {
            std::ostringstream oss;
            oss << "Frequency " << f << " of " << actions_[i].ToString() << " for "
                << hand_.ToString() << " is outside [0, 1].";
            throw std::invalid_argument(oss.str());
        }
        if (f > 0.0 && !std::isfinite(evs_[i])) {
            std::ostringstream oss;
            oss << "Action " << actions_[i].ToString() << " for " << hand_.ToString()
                << " is played with frequency " << f << " but has no finite EV.";
            throw std::invalid_argument(oss.str());
        }
    }
    double sum = FrequencySum();
    if (std::fabs(sum - 1.0) > kFrequencySumTolerance) {
        std::ostringstream oss;
        oss << "Frequencies for " << hand_.ToString() << " sum to " << sum << ", expected 1.";
        throw std::invalid_argument(oss.str());
    }
}

size_t Strategy::IndexOf(const core::GameAction& action) const {
    for (size_t i = 0; i < actions_.size(); ++i) {
        if (actions_[i] == action) return i;
    }
    return kNotFound;
}

double Strategy::Frequency(const core::GameAction& action) const {
    size_t index = IndexOf(action);
    return index == kNotFound ? 0.0 : frequencies_[index];
}

double Strategy::Ev(const core::GameAction& action) const {
    size_t index = IndexOf(action);
    if (index == kNotFound) {
        throw NotFoundError("Action " + action.ToString() + " is not available for " +
                            hand_.ToString());
    }
    return evs_[index];
}

const core::GameAction& Strategy::PrimaryAction() const {
    size_t best = 0;
    for (size_t i = 1; i < frequencies_.size(); ++i) {
        if (frequencies_[i] > frequencies_[best]) best = i;
    }
    return actions_[best];
}

double Strategy::ExpectedValue() const {
    double ev = 0.0;
    for (size_t i = 0; i < actions_.size(); ++i) {
        if (frequencies_[i] > 0.0) ev += frequencies_[i] * evs_[i];
    }
    return ev;
}

double Strategy::FrequencySum() const {
    double sum = 0.0;
    for (double f : frequencies_) sum += f;
    return sum;
}

std::vector<std::pair<core::GameAction, double>> Strategy::CompareActions(
        const std::vector<core::GameAction>& actions) const {
    std::vector<std::pair<core::GameAction, double>> result;
    result.reserve(actions.size());
    for (const auto& action : actions) {
        result.emplace_back(action, Ev(action));
    }
    return result;
}

Strategy Strategy::WithHand(const core::Hand& hand) const {
    return Strategy(hand, actions_, frequencies_, evs_);
}

Strategy Strategy::Rescaled(double scale) const {
    std::vector<core::GameAction> actions;
    actions.reserve(actions_.size());
    for (const auto& action : actions_) {
        if (action.HasAmount()) {
            actions.emplace_back(action.GetAction(), action.GetAmount() * scale);
        } else {
            actions.push_back(action);
        }
    }
    std::vector<double> evs = evs_;
    for (double& ev : evs) ev *= scale;
    return Strategy(hand_, std::move(actions), frequencies_, std::move(evs));
}

// --- JSON ---

json Strategy::ToJson() const {
    json j;
    j["hand"] = hand_.ToString();
    json actions = json::array();
    json evs = json::array();
    for (size_t i = 0; i < actions_.size(); ++i) {
        actions.push_back(actions_[i].ToString());
        // NaN is not representable in JSON.
        if (std::isfinite(evs_[i])) {
            evs.push_back(evs_[i]);
        } else {
            evs.push_back(nullptr);
        }
    }
    j["actions"] = actions;
    j["frequencies"] = frequencies_;
    j["evs"] = evs;
    return j;
}

Strategy Strategy::FromJson(const json& j) {
    core::Hand hand = core::Hand::FromString(j.at("hand").get<std::string>());
    std::vector<core::GameAction> actions;
    for (const auto& a : j.at("actions")) {
        actions.push_back(core::GameAction::FromString(a.get<std::string>()));
    }
    std::vector<double> frequencies = j.at("frequencies").get<std::vector<double>>();
    std::vector<double> evs;
    for (const auto& e : j.at("evs")) {
        evs.push_back(e.is_null() ? std::numeric_limits<double>::quiet_NaN() : e.get<double>());
    }
    return Strategy(std::move(hand), std::move(actions), std::move(frequencies), std::move(evs));
}

} // namespace strategy
} // namespace gto_broker
