#ifndef GTO_BROKER_CORE_SITUATION_H_
#define GTO_BROKER_CORE_SITUATION_H_

#include "Card.h"
#include "GameAction.h"
#include "Hand.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gto_broker {
namespace core {

// Betting rounds in Hold'em.
enum class Street { kPreflop = 0, kFlop = 1, kTurn = 2, kRiver = 3 };

// Table seats, listed in preflop acting order.
enum class Position { kUTG, kUTG1, kUTG2, kMP, kMP1, kHJ, kCO, kBTN, kSB, kBB };

std::string StreetToString(Street street);
Street StreetFromString(std::string_view text);
// Board size a street requires: 0, 3, 4 or 5.
size_t ExpectedBoardSize(Street street);

std::string PositionToString(Position position);
Position PositionFromString(std::string_view text);
// 0 for SB, 1 for BB, ... , highest for BTN.
int PostflopActingOrder(Position position);

// One action in the hand history.
struct HistoryEntry {
  HistoryEntry(Street street, Position actor, GameAction action)
      : street(street), actor(actor), action(action) {}

  Street street;
  Position actor;
  GameAction action;
};

// An immutable description of a decision point.
//
// pot_bb and effective_stack_bb are measured at the START of the current
// street; actions already taken on the current street are in history and
// select the decision node inside a solved street tree.
class Situation {
 public:
  Situation(Street street,
            std::vector<Card> board,
            double pot_bb,
            double effective_stack_bb,
            Position acting_position,
            std::vector<Position> opponent_positions = {},
            std::vector<HistoryEntry> history = {});

  Street GetStreet() const { return street_; }
  const std::vector<Card>& GetBoard() const { return board_; }
  double GetPotBb() const { return pot_bb_; }
  double GetEffectiveStackBb() const { return effective_stack_bb_; }
  Position GetActingPosition() const { return acting_position_; }
  const std::vector<Position>& GetOpponentPositions() const { return opponent_positions_; }
  const std::vector<HistoryEntry>& GetHistory() const { return history_; }

  // Actions taken so far on the current street, in order.
  std::vector<GameAction> CurrentStreetLine() const;

  // Throws ConfigurationError when the situation is structurally invalid:
  // board size does not match the street, duplicate board cards,
  // non-positive or non-finite pot/stack, bad opponent list, history
  // entries from a later street. Heads-up postflop it also checks that the
  // current-street actions alternate starting with the out-of-position
  // player and that the acting position is the one to act next.
  void Validate() const;

  // Validate() plus the hand/board overlap check.
  void ValidateWithHand(const Hand& hand) const;

  std::string ToString() const;

 private:
  Street street_;
  std::vector<Card> board_;
  double pot_bb_;
  double effective_stack_bb_;
  Position acting_position_;
  std::vector<Position> opponent_positions_;
  std::vector<HistoryEntry> history_;
};

} // namespace core
} // namespace gto_broker

#endif // GTO_BROKER_CORE_SITUATION_H_
