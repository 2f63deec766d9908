#include "Hand.h"

#include <sstream>
#include <stdexcept>

namespace gto_broker {
namespace core {

namespace {
Card Higher(const Card& a, const Card& b) { return a < b ? b : a; }
Card Lower(const Card& a, const Card& b) { return a < b ? a : b; }
} // namespace

Hand::Hand(Card first, Card second)
    : high_(Higher(first, second)), low_(Lower(first, second)) {
    if (first == second) {
        std::ostringstream oss;
        oss << "Hole cards cannot be identical: " << first.ToString();
        throw std::invalid_argument(oss.str());
    }
}

Hand Hand::FromString(std::string_view hand_str) {
    if (hand_str.size() != 4) {
        std::ostringstream oss;
        oss << "Invalid hand string \"" << hand_str << "\". Expected format like 'AsKd'.";
        throw std::invalid_argument(oss.str());
    }
    return Hand(Card(hand_str.substr(0, 2)), Card(hand_str.substr(2, 2)));
}

uint64_t Hand::GetBoardMask() const {
    return Card::CardToUint64(high_) | Card::CardToUint64(low_);
}

std::string Hand::ToString() const {
    return high_.ToString() + low_.ToString();
}

bool Hand::operator==(const Hand& other) const {
    return high_ == other.high_ && low_ == other.low_;
}

bool Hand::operator!=(const Hand& other) const {
    return !(*this == other);
}

bool Hand::operator<(const Hand& other) const {
    if (high_ != other.high_) {
        return high_ < other.high_;
    }
    return low_ < other.low_;
}

} // namespace core
} // namespace gto_broker
