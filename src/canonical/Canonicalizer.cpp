#include "canonical/Canonicalizer.h"
#include "Errors.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility> // For std::move

namespace gto_broker {
namespace canonical {

namespace {

constexpr const char* kKeyVersion = "v1";

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

// Every ordering of `cards` in which ranks never increase. Cards of equal
// rank can appear in any order, so there is more than one ordering only
// when ranks tie (paired flops, pocket pairs).
std::vector<std::vector<core::Card>> RankDescendingOrderings(std::vector<core::Card> cards) {
    std::sort(cards.begin(), cards.end());
    std::vector<std::vector<core::Card>> orderings;
    do {
        bool descending = true;
        for (size_t i = 1; i < cards.size(); ++i) {
            if (cards[i].Rank() > cards[i - 1].Rank()) {
                descending = false;
                break;
            }
        }
        if (descending) {
            orderings.push_back(cards);
        }
    } while (std::next_permutation(cards.begin(), cards.end()));
    return orderings;
}

// Prior streets as bare letters, the current street with bet sizes in
// percent of the street-start pot. Streets are separated by '.'.
std::string EncodeLine(const core::Situation& situation) {
    const auto& history = situation.GetHistory();
    if (history.empty()) {
        return "-";
    }
    int current = static_cast<int>(situation.GetStreet());
    std::vector<std::string> segments(current + 1);
    for (const auto& entry : history) {
        std::string& segment = segments[static_cast<int>(entry.street)];
        segment += entry.action.Letter();
        if (entry.street == situation.GetStreet() && entry.action.IsAggressive() &&
            entry.action.HasAmount()) {
            long long pct = std::llround(entry.action.GetAmount() / situation.GetPotBb() * 100.0);
            segment += std::to_string(pct);
        }
    }
    std::string line;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) line += '.';
        line += segments[i];
    }
    return line;
}

// Current-street actions with amounts moved onto the bucketed pot, so the
// decision node is found in the tree the solver actually built.
std::vector<core::GameAction> RescaleLine(const core::Situation& situation, double pot_representative) {
    std::vector<core::GameAction> line;
    for (const auto& action : situation.CurrentStreetLine()) {
        if (!action.HasAmount()) {
            line.push_back(action);
            continue;
        }
        long long pct = std::llround(action.GetAmount() / situation.GetPotBb() * 100.0);
        line.emplace_back(action.GetAction(), static_cast<double>(pct) / 100.0 * pot_representative);
    }
    return line;
}

} // namespace

// --- CanonicalKey ---

CanonicalKey::CanonicalKey(std::string situation_part, std::string hand_part)
    : situation_part_(std::move(situation_part)), hand_part_(std::move(hand_part)) {}

std::string CanonicalKey::ToString() const {
    if (hand_part_.empty()) {
        return situation_part_;
    }
    return situation_part_ + "_" + hand_part_;
}

bool CanonicalKey::operator==(const CanonicalKey& other) const {
    return situation_part_ == other.situation_part_ && hand_part_ == other.hand_part_;
}

bool CanonicalKey::operator<(const CanonicalKey& other) const {
    if (situation_part_ != other.situation_part_) {
        return situation_part_ < other.situation_part_;
    }
    return hand_part_ < other.hand_part_;
}

// --- Canonicalizer ---

Canonicalizer::Canonicalizer(config::BucketingPolicy policy) : policy_(policy) {
    if (!std::isfinite(policy_.stack_bucket_bb) || policy_.stack_bucket_bb <= 0.0) {
        throw ConfigurationError("bucketing.stack_bucket_bb", "Stack bucket width must be positive.");
    }
    if (!std::isfinite(policy_.pot_ratio_step) || policy_.pot_ratio_step <= 0.0) {
        throw ConfigurationError("bucketing.pot_ratio_step", "Pot ratio step must be positive.");
    }
}

double Canonicalizer::BucketStack(double effective_stack_bb) const {
    long long units = std::max(1LL, std::llround(effective_stack_bb / policy_.stack_bucket_bb));
    return static_cast<double>(units) * policy_.stack_bucket_bb;
}

double Canonicalizer::BucketPot(double pot_bb, double effective_stack_bb,
                                double stack_representative) const {
    double ratio = pot_bb / effective_stack_bb;
    long long units = std::max(1LL, std::llround(ratio / policy_.pot_ratio_step));
    return static_cast<double>(units) * policy_.pot_ratio_step * stack_representative;
}

std::string Canonicalizer::RelativePosition(core::Position hero,
                                            const std::vector<core::Position>& opponents) {
    if (opponents.empty()) {
        switch (hero) {
            case core::Position::kSB: return "SB";
            case core::Position::kBB: return "BB";
            default:
                return "B" + std::to_string(static_cast<int>(core::Position::kBTN) -
                                            static_cast<int>(hero));
        }
    }
    int hero_order = core::PostflopActingOrder(hero);
    int acting_before_hero = 0;
    for (core::Position opponent : opponents) {
        if (core::PostflopActingOrder(opponent) < hero_order) ++acting_before_hero;
    }
    if (opponents.size() == 1) {
        return acting_before_hero == 1 ? "IP" : "OOP";
    }
    return "M" + std::to_string(acting_before_hero + 1) + "of" +
           std::to_string(opponents.size() + 1);
}

CanonicalForm Canonicalizer::Canonicalize(const core::Situation& situation,
                                          const core::Hand& hand) const {
    situation.ValidateWithHand(hand);
    return CanonicalizeImpl(situation, hand);
}

CanonicalForm Canonicalizer::Canonicalize(const core::Situation& situation) const {
    situation.Validate();
    return CanonicalizeImpl(situation, std::nullopt);
}

CanonicalForm Canonicalizer::CanonicalizeImpl(const core::Situation& situation,
                                              const std::optional<core::Hand>& hand) const {
    const auto& board = situation.GetBoard();
    std::vector<core::Card> flop;
    std::vector<core::Card> later_streets;
    for (size_t i = 0; i < board.size(); ++i) {
        (i < 3 ? flop : later_streets).push_back(board[i]);
    }

    std::vector<std::vector<core::Card>> hand_orderings = {{}};
    if (hand.has_value()) {
        hand_orderings = RankDescendingOrderings({hand->HighCard(), hand->LowCard()});
    }

    double stack_rep = BucketStack(situation.GetEffectiveStackBb());
    double pot_rep = BucketPot(situation.GetPotBb(), situation.GetEffectiveStackBb(), stack_rep);
    std::string position = RelativePosition(situation.GetActingPosition(),
                                            situation.GetOpponentPositions());
    std::string line = EncodeLine(situation);

    std::optional<CanonicalForm> best;
    for (const auto& flop_order : RankDescendingOrderings(flop)) {
        for (const auto& hand_order : hand_orderings) {
            std::vector<core::Card> ordered_board = flop_order;
            ordered_board.insert(ordered_board.end(), later_streets.begin(), later_streets.end());
            std::vector<core::Card> scan = ordered_board;
            scan.insert(scan.end(), hand_order.begin(), hand_order.end());

            SuitMapping mapping = SuitMapping::FromFirstOccurrence(scan);
            std::vector<core::Card> canonical_board = mapping.ToCanonical(ordered_board);

            std::ostringstream oss;
            oss << kKeyVersion << "_" << core::StreetToString(situation.GetStreet()) << "_"
                << (canonical_board.empty() ? "-" : core::Card::JoinCards(canonical_board))
                << "_S" << FormatNumber(stack_rep) << "_P" << FormatNumber(pot_rep)
                << "_" << position << "_" << line;

            std::optional<core::Hand> canonical_hand;
            std::string hand_part;
            if (hand.has_value()) {
                canonical_hand = mapping.ToCanonical(*hand);
                hand_part = canonical_hand->ToString();
            }
            CanonicalKey key(oss.str(), hand_part);
            if (best.has_value() && !(key.ToString() < best->key.ToString())) {
                continue;
            }

            CanonicalSituation canonical_situation;
            canonical_situation.street = situation.GetStreet();
            canonical_situation.board = std::move(canonical_board);
            canonical_situation.pot_bb = pot_rep;
            canonical_situation.effective_stack_bb = stack_rep;
            canonical_situation.position_label = position;
            canonical_situation.street_line = RescaleLine(situation, pot_rep);
            best = CanonicalForm{std::move(key), mapping, std::move(canonical_situation),
                                 canonical_hand, situation.GetPotBb() / pot_rep};
        }
    }
    return *best;
}

} // namespace canonical
} // namespace gto_broker
