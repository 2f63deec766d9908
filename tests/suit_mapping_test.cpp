#include "gtest/gtest.h"
#include "canonical/SuitMapping.h"

#include <array>
#include <stdexcept>

using namespace gto_broker::canonical;
using namespace gto_broker::core;

class SuitMappingTest : public ::testing::Test {};

TEST_F(SuitMappingTest, DefaultIsIdentity) {
  SuitMapping mapping;
  EXPECT_TRUE(mapping.IsIdentity());
  EXPECT_EQ(mapping, SuitMapping::Identity());
  EXPECT_EQ(mapping.ToCanonical(Card("Qh")).ToString(), "Qh");
  EXPECT_EQ(mapping.ToString(), "c>c d>d h>h s>s");
}

TEST_F(SuitMappingTest, RejectsNonPermutation) {
  EXPECT_THROW(SuitMapping(std::array<int, 4>{0, 0, 1, 2}), std::invalid_argument);
  EXPECT_THROW(SuitMapping(std::array<int, 4>{0, 1, 2, 4}), std::invalid_argument);
  EXPECT_THROW(SuitMapping(std::array<int, 4>{-1, 1, 2, 3}), std::invalid_argument);
}

TEST_F(SuitMappingTest, FirstOccurrenceOrder) {
  // h first, then s, then d; c never seen.
  SuitMapping mapping = SuitMapping::FromFirstOccurrence(Card::ParseCards("KhQs2hAd"));
  EXPECT_EQ(mapping.CanonicalSuit(2), 0); // h -> c
  EXPECT_EQ(mapping.CanonicalSuit(3), 1); // s -> d
  EXPECT_EQ(mapping.CanonicalSuit(1), 2); // d -> h
  EXPECT_EQ(mapping.CanonicalSuit(0), 3); // c -> s
  EXPECT_EQ(Card::JoinCards(mapping.ToCanonical(Card::ParseCards("KhQs2h"))), "KcQd2c");
}

TEST_F(SuitMappingTest, UnseenSuitsFillInAscendingOrder) {
  SuitMapping mapping = SuitMapping::FromFirstOccurrence(Card::ParseCards("As"));
  EXPECT_EQ(mapping.CanonicalSuit(3), 0);
  EXPECT_EQ(mapping.CanonicalSuit(0), 1);
  EXPECT_EQ(mapping.CanonicalSuit(1), 2);
  EXPECT_EQ(mapping.CanonicalSuit(2), 3);
  EXPECT_TRUE(SuitMapping::FromFirstOccurrence({}).IsIdentity());
}

TEST_F(SuitMappingTest, ToRealInvertsToCanonical) {
  SuitMapping mapping = SuitMapping::FromFirstOccurrence(Card::ParseCards("QsJh2h"));
  for (int i = 0; i < kNumCardsInDeck; ++i) {
    Card card(i);
    EXPECT_EQ(mapping.ToReal(mapping.ToCanonical(card)), card);
    EXPECT_EQ(mapping.Inverse().ToCanonical(card), mapping.ToReal(card));
  }
}

TEST_F(SuitMappingTest, HandRelabelingKeepsHighCardFirst) {
  // c <-> d swap: AcKd becomes AdKc.
  SuitMapping swap(std::array<int, 4>{1, 0, 2, 3});
  Hand real = swap.ToReal(Hand::FromString("AcKd"));
  EXPECT_EQ(real.ToString(), "AdKc");
  // Pocket pair whose suits swap order.
  EXPECT_EQ(swap.ToCanonical(Hand::FromString("QdQc")).ToString(), "QdQc");
}

TEST_F(SuitMappingTest, OutOfRangeSuit) {
  SuitMapping mapping;
  EXPECT_THROW(mapping.CanonicalSuit(4), std::out_of_range);
  EXPECT_THROW(mapping.RealSuit(-1), std::out_of_range);
}
