#include "Card.h"

#include <cctype>    // For std::tolower, std::toupper
#include <sstream>   // For error message formatting
#include <stdexcept>

namespace gto_broker {
namespace core {

// --- Constants for Ranks and Suits ---
const std::array<char, kNumRanks> kRankChars = {
    '2', '3', '4', '5', '6', '7', '8', '9', 'T', 'J', 'Q', 'K', 'A'
};
const std::array<char, kNumSuits> kSuitChars = {'c', 'd', 'h', 's'};

const std::array<char, kNumSuits>& Card::GetAllSuitChars() {
    return kSuitChars;
}

// --- Helper Functions ---

bool Card::IsValidCardInt(int card_int) {
    return card_int >= 0 && card_int < kNumCardsInDeck;
}

char Card::SuitIndexToChar(int suit_index) {
    if (suit_index >= 0 && suit_index < kNumSuits) {
        return kSuitChars[suit_index];
    }
    return '?';
}

char Card::RankIndexToChar(int rank_index) {
    if (rank_index >= 0 && rank_index < kNumRanks) {
        return kRankChars[rank_index];
    }
    return '?';
}

int Card::SuitCharToIndex(char suit_char) {
    char lower_suit = static_cast<char>(std::tolower(static_cast<unsigned char>(suit_char)));
    for (int i = 0; i < kNumSuits; ++i) {
        if (lower_suit == kSuitChars[i]) {
            return i;
        }
    }
    return -1;
}

int Card::RankCharToIndex(char rank_char) {
    char upper_rank = static_cast<char>(std::toupper(static_cast<unsigned char>(rank_char)));
    for (int i = 0; i < kNumRanks; ++i) {
        if (upper_rank == kRankChars[i]) {
            return i;
        }
    }
    return -1;
}

// --- Constructors ---

Card::Card(int card_int) : card_int_(card_int) {
    if (!IsValidCardInt(card_int)) {
        std::ostringstream oss;
        oss << "Invalid card integer: " << card_int << ". Must be 0-"
            << (kNumCardsInDeck - 1) << ".";
        throw std::out_of_range(oss.str());
    }
}

Card::Card(std::string_view card_str) : card_int_(-1) {
    std::optional<int> parsed = StringToInt(card_str);
    if (!parsed.has_value()) {
        std::ostringstream oss;
        oss << "Invalid card string format: \"" << card_str
            << "\". Expected format like 'As', 'Td', '2c'.";
        throw std::invalid_argument(oss.str());
    }
    card_int_ = parsed.value();
}

std::string Card::ToString() const {
    return IntToString(card_int_);
}

Card Card::WithSuit(int suit_index) const {
    if (suit_index < 0 || suit_index >= kNumSuits) {
        throw std::out_of_range("Invalid suit index: " + std::to_string(suit_index));
    }
    return Card(Rank() * kNumSuits + suit_index);
}

// --- Static Conversion Utilities ---

std::optional<int> Card::StringToInt(std::string_view card_str) {
    if (card_str.length() != 2) {
        return std::nullopt;
    }
    int rank_index = RankCharToIndex(card_str[0]);
    int suit_index = SuitCharToIndex(card_str[1]);
    if (rank_index == -1 || suit_index == -1) {
        return std::nullopt;
    }
    return rank_index * kNumSuits + suit_index;
}

std::string Card::IntToString(int card_int) {
    if (!IsValidCardInt(card_int)) {
        return "Invalid";
    }
    std::string s;
    s += RankIndexToChar(card_int / kNumSuits);
    s += SuitIndexToChar(card_int % kNumSuits);
    return s;
}

std::vector<Card> Card::ParseCards(std::string_view cards_str) {
    std::string packed;
    packed.reserve(cards_str.size());
    for (char c : cards_str) {
        if (c == ',' || c == ' ') continue;
        packed += c;
    }
    if (packed.size() % 2 != 0) {
        std::ostringstream oss;
        oss << "Invalid card list \"" << cards_str << "\": odd number of characters.";
        throw std::invalid_argument(oss.str());
    }
    std::vector<Card> cards;
    cards.reserve(packed.size() / 2);
    for (size_t i = 0; i < packed.size(); i += 2) {
        cards.emplace_back(std::string_view(packed).substr(i, 2));
    }
    return cards;
}

std::string Card::JoinCards(const std::vector<Card>& cards, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += separator;
        out += cards[i].ToString();
    }
    return out;
}

// --- Static Bitmask Utilities ---

uint64_t Card::CardsToUint64(const std::vector<Card>& cards) {
    uint64_t board_mask = 0;
    for (const auto& card : cards) {
        board_mask |= CardToUint64(card);
    }
    return board_mask;
}

uint64_t Card::CardToUint64(const Card& card) {
    return static_cast<uint64_t>(1) << card.CardInt();
}

} // namespace core
} // namespace gto_broker
