#ifndef GTO_BROKER_CORE_GAME_ACTION_H_
#define GTO_BROKER_CORE_GAME_ACTION_H_

#include <string>
#include <string_view>

namespace gto_broker {
namespace core {

// The decisions a player can make at an action node.
enum class PokerAction { kFold, kCheck, kCall, kBet, kRaise, kAllIn };

// A poker action with its amount in big blinds, if it has one.
class GameAction {
 public:
  static constexpr double kNoAmount = -1.0;

  // Args:
  //   action: The type of poker action.
  //   amount: Chips put in, in big blinds. Required for BET/RAISE,
  //           optional for ALLIN, forbidden for FOLD/CHECK/CALL.
  // Throws:
  //   std::invalid_argument if the amount rules above are violated.
  explicit GameAction(PokerAction action, double amount = kNoAmount);

  PokerAction GetAction() const { return action_; }
  double GetAmount() const { return amount_; }
  bool HasAmount() const { return amount_ != kNoAmount; }
  bool IsAggressive() const;

  // Lower-case form used in strategies and logs: "check", "bet 2.5".
  std::string ToString() const;

  // One-letter code used in canonical keys: f x c b r a.
  char Letter() const;

  // Parses "check", "bet 2.5" and the solver's labels ("CHECK",
  // "BET 2.000000", "ALLIN"). Case-insensitive.
  // Throws std::invalid_argument on unknown actions.
  static GameAction FromString(std::string_view text);

  static std::string ActionToString(PokerAction action);

  bool operator==(const GameAction& other) const;
  bool operator!=(const GameAction& other) const { return !(*this == other); }
  bool operator<(const GameAction& other) const;

 private:
  PokerAction action_;
  double amount_;
};

} // namespace core
} // namespace gto_broker

#endif // GTO_BROKER_CORE_GAME_ACTION_H_
