#ifndef GTO_BROKER_CORE_CARD_H_
#define GTO_BROKER_CORE_CARD_H_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gto_broker {
namespace core {

// Constants related to a standard 52-card deck.
constexpr int kNumCardsInDeck = 52;
constexpr int kNumSuits = 4;
constexpr int kNumRanks = 13;

// A single playing card, stored as rank * kNumSuits + suit (0-51).
// Ranks run 2..A (0..12), suits c, d, h, s (0..3).
class Card {
 public:
  explicit Card(int card_int);
  explicit Card(std::string_view card_str);

  // --- Accessors ---
  int CardInt() const { return card_int_; }
  int Rank() const { return card_int_ / kNumSuits; }
  int Suit() const { return card_int_ % kNumSuits; }
  std::string ToString() const;

  // Same rank, different suit index.
  Card WithSuit(int suit_index) const;

  bool operator==(const Card& other) const { return card_int_ == other.card_int_; }
  bool operator!=(const Card& other) const { return card_int_ != other.card_int_; }
  bool operator<(const Card& other) const { return card_int_ < other.card_int_; }

  // --- Static Conversion Utilities ---
  static std::optional<int> StringToInt(std::string_view card_str);
  static std::string IntToString(int card_int);

  // Parses a run of cards, either packed ("QsJh2d") or separated by
  // commas and/or spaces ("Qs,Jh,2d"). Throws std::invalid_argument.
  static std::vector<Card> ParseCards(std::string_view cards_str);
  static std::string JoinCards(const std::vector<Card>& cards,
                               std::string_view separator = "");

  // --- Static Bitmask Utilities ---
  static uint64_t CardsToUint64(const std::vector<Card>& cards);
  static uint64_t CardToUint64(const Card& card);

  // --- Static Rank/Suit Helpers ---
  static char SuitIndexToChar(int suit_index);
  static char RankIndexToChar(int rank_index);
  static int SuitCharToIndex(char suit_char);
  static int RankCharToIndex(char rank_char);
  static const std::array<char, kNumSuits>& GetAllSuitChars();

  static bool IsValidCardInt(int card_int);

 private:
  int card_int_;
};

} // namespace core
} // namespace gto_broker

#endif // GTO_BROKER_CORE_CARD_H_
