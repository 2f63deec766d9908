#ifndef GTO_BROKER_CANONICAL_SUIT_MAPPING_H_
#define GTO_BROKER_CANONICAL_SUIT_MAPPING_H_

#include "Card.h"
#include "Hand.h"

#include <array>
#include <string>
#include <vector>

namespace gto_broker {
namespace canonical {

// A bijection from real suit indices to canonical suit indices.
//
// Built by scanning cards in a fixed order and giving each newly seen real
// suit the next unused canonical suit (c, d, h, s). Real suits never seen
// take the remaining canonical suits in ascending order, so a mapping is
// always a full permutation of the four suits.
class SuitMapping {
 public:
  // Identity mapping.
  SuitMapping();

  // Args:
  //   real_to_canonical: element i is the canonical suit of real suit i.
  // Throws:
  //   std::invalid_argument if the array is not a permutation of 0..3.
  explicit SuitMapping(const std::array<int, core::kNumSuits>& real_to_canonical);

  static SuitMapping Identity() { return SuitMapping(); }
  static SuitMapping FromFirstOccurrence(const std::vector<core::Card>& scan_order);

  int CanonicalSuit(int real_suit) const;
  int RealSuit(int canonical_suit) const;

  core::Card ToCanonical(const core::Card& card) const;
  core::Card ToReal(const core::Card& card) const;
  core::Hand ToCanonical(const core::Hand& hand) const;
  core::Hand ToReal(const core::Hand& hand) const;
  std::vector<core::Card> ToCanonical(const std::vector<core::Card>& cards) const;

  SuitMapping Inverse() const;
  bool IsIdentity() const;

  // "c>d d>c h>h s>s"
  std::string ToString() const;

  bool operator==(const SuitMapping& other) const;
  bool operator!=(const SuitMapping& other) const { return !(*this == other); }

 private:
  std::array<int, core::kNumSuits> real_to_canonical_;
  std::array<int, core::kNumSuits> canonical_to_real_;
};

} // namespace canonical
} // namespace gto_broker

#endif // GTO_BROKER_CANONICAL_SUIT_MAPPING_H_
