#ifndef GTO_BROKER_CANONICAL_CANONICALIZER_H_
#define GTO_BROKER_CANONICAL_CANONICALIZER_H_

#include "canonical/SuitMapping.h"
#include "tools/SolverConfig.h" // For BucketingPolicy
#include "Situation.h"
#include "GameAction.h"
#include "Hand.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gto_broker {
namespace canonical {

// Cache identity of a request. The situation part names one solver
// computation (and is the cache key); the hand part is the canonical hand.
// Both are filename-safe.
class CanonicalKey {
 public:
  CanonicalKey(std::string situation_part, std::string hand_part = "");

  const std::string& SituationPart() const { return situation_part_; }
  const std::string& HandPart() const { return hand_part_; }
  bool HasHand() const { return !hand_part_.empty(); }

  // situation part, plus "_<hand>" when there is a hand.
  std::string ToString() const;

  bool operator==(const CanonicalKey& other) const;
  bool operator!=(const CanonicalKey& other) const { return !(*this == other); }
  bool operator<(const CanonicalKey& other) const;

 private:
  std::string situation_part_;
  std::string hand_part_;
};

// The situation as the solver sees it: canonical suits, bucketed pot and
// stack, and the current-street line rescaled to the bucketed pot.
struct CanonicalSituation {
  core::Street street = core::Street::kPreflop;
  // Flop (rank descending), then turn, then river.
  std::vector<core::Card> board;
  double pot_bb = 0.0;
  double effective_stack_bb = 0.0;
  std::string position_label;
  std::vector<core::GameAction> street_line;
};

struct CanonicalForm {
  CanonicalKey key;
  SuitMapping mapping;
  CanonicalSituation situation;
  std::optional<core::Hand> canonical_hand;
  // Real pot over bucketed pot. Amounts and EVs of the canonical solution
  // are multiplied by this on the way back to the caller.
  double pot_scale = 1.0;
};

// Maps a situation (and optionally a hand) to its canonical form.
//
// Key layout:
//   v1_<street>_<board|->_S<stack>_P<pot>_<position>_<line|->[_<hand>]
// e.g. "v1_flop_KcQd2c_S100_P5_OOP_rc.xb33_AdJh".
//
// Applying any permutation of the four suits to the situation and hand
// yields the same key, as does reordering the flop or the hole cards.
class Canonicalizer {
 public:
  // Throws ConfigurationError if the policy has non-positive steps.
  explicit Canonicalizer(config::BucketingPolicy policy = {});

  // Throws ConfigurationError if the situation is structurally invalid or
  // the hand overlaps the board.
  CanonicalForm Canonicalize(const core::Situation& situation, const core::Hand& hand) const;
  CanonicalForm Canonicalize(const core::Situation& situation) const;

  const config::BucketingPolicy& GetPolicy() const { return policy_; }

  // Bucket representative of the effective stack.
  double BucketStack(double effective_stack_bb) const;
  // Bucket representative of the pot, given the stack representative.
  double BucketPot(double pot_bb, double effective_stack_bb, double stack_representative) const;

  // "B0".."B7", "SB", "BB" without opponents, "IP"/"OOP" heads-up,
  // "M<k>of<n>" multiway.
  static std::string RelativePosition(core::Position hero,
                                      const std::vector<core::Position>& opponents);

 private:
  CanonicalForm CanonicalizeImpl(const core::Situation& situation,
                                 const std::optional<core::Hand>& hand) const;

  config::BucketingPolicy policy_;
};

} // namespace canonical
} // namespace gto_broker

#endif // GTO_BROKER_CANONICAL_CANONICALIZER_H_
