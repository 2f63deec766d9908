#include "GameAction.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace gto_broker {
namespace core {

namespace {

// Two amounts closer than this are the same bet size.
constexpr double kAmountEpsilon = 1e-9;

std::string Trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string ToLower(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

} // namespace

GameAction::GameAction(PokerAction action, double amount)
    : action_(action), amount_(amount) {
    bool requires_amount = (action_ == PokerAction::kBet ||
                            action_ == PokerAction::kRaise);
    bool allows_amount = requires_amount || action_ == PokerAction::kAllIn;
    bool has_amount = (amount != kNoAmount);

    if (requires_amount && !has_amount) {
        std::ostringstream oss;
        oss << "Action " << ActionToString(action_)
            << " requires an amount, but none was provided.";
        throw std::invalid_argument(oss.str());
    }
    if (!allows_amount && has_amount) {
        std::ostringstream oss;
        oss << "Action " << ActionToString(action_)
            << " should not have an amount, but amount=" << amount
            << " was provided.";
        throw std::invalid_argument(oss.str());
    }
    if (has_amount && (!std::isfinite(amount) || amount < 0)) {
        std::ostringstream oss;
        oss << "Amount for " << ActionToString(action_)
            << " must be a finite non-negative number: " << amount;
        throw std::invalid_argument(oss.str());
    }
}

bool GameAction::IsAggressive() const {
    return action_ == PokerAction::kBet || action_ == PokerAction::kRaise ||
           action_ == PokerAction::kAllIn;
}

std::string GameAction::ActionToString(PokerAction action) {
    switch (action) {
        case PokerAction::kFold:  return "fold";
        case PokerAction::kCheck: return "check";
        case PokerAction::kCall:  return "call";
        case PokerAction::kBet:   return "bet";
        case PokerAction::kRaise: return "raise";
        case PokerAction::kAllIn: return "allin";
    }
    return "unknown";
}

std::string GameAction::ToString() const {
    std::string action_str = ActionToString(action_);
    if (!HasAmount()) {
        return action_str;
    }
    std::ostringstream oss;
    oss << action_str << " " << amount_;
    return oss.str();
}

char GameAction::Letter() const {
    switch (action_) {
        case PokerAction::kFold:  return 'f';
        case PokerAction::kCheck: return 'x';
        case PokerAction::kCall:  return 'c';
        case PokerAction::kBet:   return 'b';
        case PokerAction::kRaise: return 'r';
        case PokerAction::kAllIn: return 'a';
    }
    return '?';
}

GameAction GameAction::FromString(std::string_view text) {
    std::string trimmed = ToLower(Trim(text));
    std::string name = trimmed;
    double amount = kNoAmount;

    size_t space = trimmed.find(' ');
    if (space != std::string::npos) {
        name = trimmed.substr(0, space);
        std::string amount_str = Trim(std::string_view(trimmed).substr(space + 1));
        try {
            size_t consumed = 0;
            amount = std::stod(amount_str, &consumed);
            if (consumed != amount_str.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid action amount in \"" + std::string(text) + "\"");
        }
    }

    if (name == "fold")  return GameAction(PokerAction::kFold, amount);
    if (name == "check") return GameAction(PokerAction::kCheck, amount);
    if (name == "call")  return GameAction(PokerAction::kCall, amount);
    if (name == "bet")   return GameAction(PokerAction::kBet, amount);
    if (name == "raise") return GameAction(PokerAction::kRaise, amount);
    if (name == "allin" || name == "all-in") return GameAction(PokerAction::kAllIn, amount);
    throw std::invalid_argument("Unknown action \"" + std::string(text) + "\"");
}

bool GameAction::operator==(const GameAction& other) const {
    return action_ == other.action_ &&
           std::fabs(amount_ - other.amount_) < kAmountEpsilon;
}

bool GameAction::operator<(const GameAction& other) const {
    if (action_ != other.action_) {
        return static_cast<int>(action_) < static_cast<int>(other.action_);
    }
    if (std::fabs(amount_ - other.amount_) < kAmountEpsilon) {
        return false;
    }
    return amount_ < other.amount_;
}

} // namespace core
} // namespace gto_broker
