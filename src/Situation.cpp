#include "Situation.h"
#include "Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace core {

namespace {

std::string ToUpper(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

const std::vector<Position>& AllPositions() {
    static const std::vector<Position> kPositions = {
        Position::kUTG, Position::kUTG1, Position::kUTG2, Position::kMP,
        Position::kMP1, Position::kHJ,   Position::kCO,   Position::kBTN,
        Position::kSB,  Position::kBB};
    return kPositions;
}

} // namespace

// --- Street helpers ---

std::string StreetToString(Street street) {
    switch (street) {
        case Street::kPreflop: return "preflop";
        case Street::kFlop:    return "flop";
        case Street::kTurn:    return "turn";
        case Street::kRiver:   return "river";
    }
    return "unknown";
}

Street StreetFromString(std::string_view text) {
    std::string upper = ToUpper(text);
    if (upper == "PREFLOP") return Street::kPreflop;
    if (upper == "FLOP")    return Street::kFlop;
    if (upper == "TURN")    return Street::kTurn;
    if (upper == "RIVER")   return Street::kRiver;
    throw std::invalid_argument("Unknown street \"" + std::string(text) + "\"");
}

size_t ExpectedBoardSize(Street street) {
    switch (street) {
        case Street::kPreflop: return 0;
        case Street::kFlop:    return 3;
        case Street::kTurn:    return 4;
        case Street::kRiver:   return 5;
    }
    return 0;
}

// --- Position helpers ---

std::string PositionToString(Position position) {
    switch (position) {
        case Position::kUTG:  return "UTG";
        case Position::kUTG1: return "UTG+1";
        case Position::kUTG2: return "UTG+2";
        case Position::kMP:   return "MP";
        case Position::kMP1:  return "MP+1";
        case Position::kHJ:   return "HJ";
        case Position::kCO:   return "CO";
        case Position::kBTN:  return "BTN";
        case Position::kSB:   return "SB";
        case Position::kBB:   return "BB";
    }
    return "unknown";
}

Position PositionFromString(std::string_view text) {
    std::string upper = ToUpper(text);
    for (Position position : AllPositions()) {
        if (PositionToString(position) == upper) {
            return position;
        }
    }
    throw std::invalid_argument("Unknown position \"" + std::string(text) + "\"");
}

int PostflopActingOrder(Position position) {
    switch (position) {
        case Position::kSB: return 0;
        case Position::kBB: return 1;
        default:
            // UTG (0) .. BTN (7) act after the blinds.
            return static_cast<int>(position) + 2;
    }
}

// --- Situation ---

Situation::Situation(Street street,
                     std::vector<Card> board,
                     double pot_bb,
                     double effective_stack_bb,
                     Position acting_position,
                     std::vector<Position> opponent_positions,
                     std::vector<HistoryEntry> history)
    : street_(street),
      board_(std::move(board)),
      pot_bb_(pot_bb),
      effective_stack_bb_(effective_stack_bb),
      acting_position_(acting_position),
      opponent_positions_(std::move(opponent_positions)),
      history_(std::move(history)) {}

std::vector<GameAction> Situation::CurrentStreetLine() const {
    std::vector<GameAction> line;
    for (const auto& entry : history_) {
        if (entry.street == street_) {
            line.push_back(entry.action);
        }
    }
    return line;
}

void Situation::Validate() const {
    size_t expected = ExpectedBoardSize(street_);
    if (board_.size() != expected) {
        std::ostringstream oss;
        oss << "Board has " << board_.size() << " cards but street "
            << StreetToString(street_) << " requires " << expected << ".";
        throw ConfigurationError("board", oss.str());
    }

    uint64_t seen = 0;
    for (const auto& card : board_) {
        uint64_t bit = Card::CardToUint64(card);
        if (seen & bit) {
            throw ConfigurationError("board", "Duplicate board card: " + card.ToString());
        }
        seen |= bit;
    }

    if (!std::isfinite(pot_bb_) || pot_bb_ <= 0.0) {
        std::ostringstream oss;
        oss << "Pot must be positive, got " << pot_bb_;
        throw ConfigurationError("pot", oss.str());
    }
    if (!std::isfinite(effective_stack_bb_) || effective_stack_bb_ <= 0.0) {
        std::ostringstream oss;
        oss << "Effective stack must be positive, got " << effective_stack_bb_;
        throw ConfigurationError("effective_stack", oss.str());
    }

    std::vector<Position> seats = opponent_positions_;
    seats.push_back(acting_position_);
    std::sort(seats.begin(), seats.end());
    if (std::adjacent_find(seats.begin(), seats.end()) != seats.end()) {
        throw ConfigurationError("opponents",
                                 "Opponent positions must be distinct and differ from the acting position.");
    }

    for (const auto& entry : history_) {
        if (static_cast<int>(entry.street) > static_cast<int>(street_)) {
            throw ConfigurationError("history",
                                     "History contains an action from a later street: " +
                                     StreetToString(entry.street));
        }
    }

    // Heads-up postflop: the out-of-position player opens every street and
    // the two players alternate, so the line length fixes who is to act.
    if (street_ == Street::kPreflop || opponent_positions_.size() != 1) {
        return;
    }
    Position opponent = opponent_positions_.front();
    bool hero_oop = PostflopActingOrder(acting_position_) < PostflopActingOrder(opponent);
    Position oop = hero_oop ? acting_position_ : opponent;
    Position ip = hero_oop ? opponent : acting_position_;
    size_t index = 0;
    for (const auto& entry : history_) {
        if (entry.street != street_) {
            continue;
        }
        Position expected_actor = index % 2 == 0 ? oop : ip;
        if (entry.actor != expected_actor) {
            std::ostringstream oss;
            oss << "Action " << index + 1 << " on the " << StreetToString(street_) << " belongs to "
                << PositionToString(expected_actor) << ", not " << PositionToString(entry.actor) << ".";
            throw ConfigurationError("history", oss.str());
        }
        ++index;
    }
    bool oop_to_act = index % 2 == 0;
    if (oop_to_act != hero_oop) {
        std::ostringstream oss;
        oss << PositionToString(acting_position_) << " is not to act after " << index
            << " action(s) on the " << StreetToString(street_) << "; "
            << PositionToString(oop_to_act ? oop : ip) << " is.";
        throw ConfigurationError("acting_position", oss.str());
    }
}

void Situation::ValidateWithHand(const Hand& hand) const {
    Validate();
    uint64_t board_mask = Card::CardsToUint64(board_);
    if (board_mask & hand.GetBoardMask()) {
        throw ConfigurationError("hand",
                                 "Hand " + hand.ToString() + " overlaps the board " +
                                 Card::JoinCards(board_, ","));
    }
}

std::string Situation::ToString() const {
    std::ostringstream oss;
    oss << StreetToString(street_) << " board=[" << Card::JoinCards(board_, ",") << "]"
        << " pot=" << pot_bb_ << "bb stack=" << effective_stack_bb_ << "bb"
        << " hero=" << PositionToString(acting_position_);
    if (!opponent_positions_.empty()) {
        oss << " vs";
        for (Position p : opponent_positions_) oss << " " << PositionToString(p);
    }
    if (!history_.empty()) {
        oss << " line=";
        for (size_t i = 0; i < history_.size(); ++i) {
            if (i > 0) oss << ",";
            oss << PositionToString(history_[i].actor) << ":" << history_[i].action.ToString();
        }
    }
    return oss.str();
}

} // namespace core
} // namespace gto_broker
