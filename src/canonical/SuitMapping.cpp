#include "canonical/SuitMapping.h"

#include <sstream>
#include <stdexcept>

namespace gto_broker {
namespace canonical {

SuitMapping::SuitMapping() {
    for (int s = 0; s < core::kNumSuits; ++s) {
        real_to_canonical_[s] = s;
        canonical_to_real_[s] = s;
    }
}

SuitMapping::SuitMapping(const std::array<int, core::kNumSuits>& real_to_canonical)
    : real_to_canonical_(real_to_canonical) {
    canonical_to_real_.fill(-1);
    for (int real = 0; real < core::kNumSuits; ++real) {
        int canon = real_to_canonical_[real];
        if (canon < 0 || canon >= core::kNumSuits || canonical_to_real_[canon] != -1) {
            throw std::invalid_argument("Suit mapping is not a permutation of the four suits.");
        }
        canonical_to_real_[canon] = real;
    }
}

SuitMapping SuitMapping::FromFirstOccurrence(const std::vector<core::Card>& scan_order) {
    std::array<int, core::kNumSuits> mapping;
    mapping.fill(-1);
    int next_canonical = 0;

    for (const auto& card : scan_order) {
        int real = card.Suit();
        if (mapping[real] == -1) {
            mapping[real] = next_canonical++;
        }
    }
    // Unseen suits: lowest real index takes the lowest remaining canonical suit.
    for (int real = 0; real < core::kNumSuits; ++real) {
        if (mapping[real] == -1) {
            mapping[real] = next_canonical++;
        }
    }
    return SuitMapping(mapping);
}

int SuitMapping::CanonicalSuit(int real_suit) const {
    if (real_suit < 0 || real_suit >= core::kNumSuits) {
        throw std::out_of_range("Invalid suit index: " + std::to_string(real_suit));
    }
    return real_to_canonical_[real_suit];
}

int SuitMapping::RealSuit(int canonical_suit) const {
    if (canonical_suit < 0 || canonical_suit >= core::kNumSuits) {
        throw std::out_of_range("Invalid suit index: " + std::to_string(canonical_suit));
    }
    return canonical_to_real_[canonical_suit];
}

core::Card SuitMapping::ToCanonical(const core::Card& card) const {
    return card.WithSuit(real_to_canonical_[card.Suit()]);
}

core::Card SuitMapping::ToReal(const core::Card& card) const {
    return card.WithSuit(canonical_to_real_[card.Suit()]);
}

core::Hand SuitMapping::ToCanonical(const core::Hand& hand) const {
    return core::Hand(ToCanonical(hand.HighCard()), ToCanonical(hand.LowCard()));
}

core::Hand SuitMapping::ToReal(const core::Hand& hand) const {
    return core::Hand(ToReal(hand.HighCard()), ToReal(hand.LowCard()));
}

std::vector<core::Card> SuitMapping::ToCanonical(const std::vector<core::Card>& cards) const {
    std::vector<core::Card> out;
    out.reserve(cards.size());
    for (const auto& card : cards) {
        out.push_back(ToCanonical(card));
    }
    return out;
}

SuitMapping SuitMapping::Inverse() const {
    return SuitMapping(canonical_to_real_);
}

bool SuitMapping::IsIdentity() const {
    for (int s = 0; s < core::kNumSuits; ++s) {
        if (real_to_canonical_[s] != s) return false;
    }
    return true;
}

std::string SuitMapping::ToString() const {
    std::ostringstream oss;
    for (int s = 0; s < core::kNumSuits; ++s) {
        if (s > 0) oss << " ";
        oss << core::Card::SuitIndexToChar(s) << ">"
            << core::Card::SuitIndexToChar(real_to_canonical_[s]);
    }
    return oss.str();
}

bool SuitMapping::operator==(const SuitMapping& other) const {
    return real_to_canonical_ == other.real_to_canonical_;
}

} // namespace canonical
} // namespace gto_broker
