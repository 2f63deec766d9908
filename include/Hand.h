#ifndef GTO_BROKER_CORE_HAND_H_
#define GTO_BROKER_CORE_HAND_H_

#include "Card.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace gto_broker {
namespace core {

// A player's two hole cards. Cards are stored in a canonical order
// (higher card integer first), so "KdAs" and "AsKd" are the same Hand.
class Hand {
 public:
  // Throws:
  //   std::invalid_argument if both cards are identical.
  Hand(Card first, Card second);

  // Parses a 4-character string such as "AsKd" (either card order).
  // Throws std::invalid_argument on malformed input.
  static Hand FromString(std::string_view hand_str);

  // --- Accessors ---
  const Card& HighCard() const { return high_; }
  const Card& LowCard() const { return low_; }
  uint64_t GetBoardMask() const;
  bool IsPair() const { return high_.Rank() == low_.Rank(); }
  bool IsSuited() const { return high_.Suit() == low_.Suit(); }

  // "AsKd": high card first.
  std::string ToString() const;

  bool operator==(const Hand& other) const;
  bool operator!=(const Hand& other) const;
  bool operator<(const Hand& other) const;

 private:
  Card high_;
  Card low_;
};

} // namespace core
} // namespace gto_broker

#endif // GTO_BROKER_CORE_HAND_H_
