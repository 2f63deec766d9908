#include "gtest/gtest.h"
#include "strategy/Strategy.h"
#include "strategy/Solution.h"
#include "canonical/SuitMapping.h"
#include "Errors.h"
#include "test_doubles.h"

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace gto_broker;
using namespace gto_broker::core;
using namespace gto_broker::strategy;

class StrategyTest : public ::testing::Test {
 protected:
  GameAction check_{PokerAction::kCheck};
  GameAction bet_small_{PokerAction::kBet, 2.0};
  GameAction bet_big_{PokerAction::kBet, 4.5};
  Hand hand_ = Hand::FromString("AcKd");

  Strategy Mixed() const {
    return Strategy(hand_, {check_, bet_small_, bet_big_}, {0.2, 0.5, 0.3}, {1.0, 2.0, 1.5});
  }
};

TEST_F(StrategyTest, Accessors) {
  Strategy s = Mixed();
  EXPECT_DOUBLE_EQ(s.Frequency(bet_small_), 0.5);
  EXPECT_DOUBLE_EQ(s.Frequency(GameAction(PokerAction::kFold)), 0.0);
  EXPECT_DOUBLE_EQ(s.Ev(bet_big_), 1.5);
  EXPECT_EQ(s.PrimaryAction(), bet_small_);
  EXPECT_NEAR(s.ExpectedValue(), 0.2 * 1.0 + 0.5 * 2.0 + 0.3 * 1.5, 1e-12);
  EXPECT_NEAR(s.FrequencySum(), 1.0, 1e-12);
}

TEST_F(StrategyTest, EvOfUnavailableActionIsNotFound) {
  EXPECT_THROW(Mixed().Ev(GameAction(PokerAction::kRaise, 9.0)), NotFoundError);
}

TEST_F(StrategyTest, CompareActions) {
  auto comparison = Mixed().CompareActions({bet_big_, check_});
  ASSERT_EQ(comparison.size(), 2u);
  EXPECT_EQ(comparison[0].first, bet_big_);
  EXPECT_DOUBLE_EQ(comparison[0].second, 1.5);
  EXPECT_DOUBLE_EQ(comparison[1].second, 1.0);
  EXPECT_THROW(Mixed().CompareActions({GameAction(PokerAction::kFold)}), NotFoundError);
}

TEST_F(StrategyTest, ConstructorInvariants) {
  // Frequencies must sum to one.
  EXPECT_THROW(Strategy(hand_, {check_, bet_small_}, {0.5, 0.4}, {1.0, 1.0}),
               std::invalid_argument);
  // Lengths must match.
  EXPECT_THROW(Strategy(hand_, {check_, bet_small_}, {1.0}, {1.0, 1.0}), std::invalid_argument);
  EXPECT_THROW(Strategy(hand_, {}, {}, {}), std::invalid_argument);
  // Negative frequency.
  EXPECT_THROW(Strategy(hand_, {check_, bet_small_}, {1.5, -0.5}, {1.0, 1.0}),
               std::invalid_argument);
  // Played action without an EV.
  double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(Strategy(hand_, {check_, bet_small_}, {0.5, 0.5}, {1.0, nan}),
               std::invalid_argument);
  // Never-played action may lack one.
  EXPECT_NO_THROW(Strategy(hand_, {check_, bet_small_}, {1.0, 0.0}, {1.0, nan}));
}

TEST_F(StrategyTest, JsonRoundTripKeepsMissingEvs) {
  double nan = std::numeric_limits<double>::quiet_NaN();
  Strategy s(hand_, {check_, bet_small_}, {1.0, 0.0}, {1.25, nan});
  json j = s.ToJson();
  EXPECT_EQ(j["hand"], "AcKd");
  EXPECT_EQ(j["actions"][1], "bet 2");
  EXPECT_TRUE(j["evs"][1].is_null());

  Strategy back = Strategy::FromJson(j);
  EXPECT_EQ(back.GetHand(), hand_);
  EXPECT_EQ(back.GetActions(), s.GetActions());
  EXPECT_DOUBLE_EQ(back.Ev(check_), 1.25);
  EXPECT_TRUE(std::isnan(back.Ev(bet_small_)));
}

class SolutionTest : public ::testing::Test {
 protected:
  strategy::SolutionPtr solution_ = testing_support::SmallSolution(0.4);
};

TEST_F(SolutionTest, LookupByHand) {
  EXPECT_EQ(solution_->Size(), 2u);
  EXPECT_NE(solution_->Find(Hand::FromString("KdAc")), nullptr);
  EXPECT_EQ(solution_->Find(Hand::FromString("AhKh")), nullptr);
  EXPECT_DOUBLE_EQ(solution_->GetStrategy(Hand::FromString("AcKd"))
                       .Frequency(GameAction(PokerAction::kBet, 2.0)),
                   0.75);
  EXPECT_THROW(solution_->GetStrategy(Hand::FromString("AhKh")), NotFoundError);
}

TEST_F(SolutionTest, RejectsInconsistentTables) {
  EXPECT_THROW(Solution({}, 0.1, 10), std::invalid_argument);
  Solution::Table mislabeled;
  Hand ak = Hand::FromString("AcKd");
  mislabeled.emplace("QhQs", Strategy(ak, {GameAction(PokerAction::kCheck)}, {1.0}, {0.0}));
  EXPECT_THROW(Solution(mislabeled, 0.1, 10), std::invalid_argument);
  Solution::Table ok;
  ok.emplace("AcKd", Strategy(ak, {GameAction(PokerAction::kCheck)}, {1.0}, {0.0}));
  EXPECT_THROW(Solution(ok, -1.0, 10), std::invalid_argument);
  EXPECT_THROW(Solution(ok, 0.1, -1), std::invalid_argument);
}

TEST_F(SolutionTest, ToRealSuitsRelabelsEveryHand) {
  // Canonical c is real d and the other way round.
  canonical::SuitMapping mapping(std::array<int, 4>{1, 0, 2, 3});
  Solution real = solution_->ToRealSuits(mapping);
  EXPECT_EQ(real.Size(), 2u);
  ASSERT_NE(real.Find(Hand::FromString("AdKc")), nullptr);
  EXPECT_EQ(real.Find(Hand::FromString("AcKd")), nullptr);
  EXPECT_EQ(real.GetStrategy(Hand::FromString("AdKc")).GetHand().ToString(), "AdKc");
  EXPECT_DOUBLE_EQ(real.GetStrategy(Hand::FromString("AdKc"))
                       .Frequency(GameAction(PokerAction::kBet, 2.0)),
                   0.75);
  // Hearts and spades were not touched.
  EXPECT_NE(real.Find(Hand::FromString("QsQh")), nullptr);
  EXPECT_DOUBLE_EQ(real.GetExploitability(), 0.4);
  EXPECT_EQ(real.GetIterations(), 100);
}

TEST_F(SolutionTest, JsonRoundTrip) {
  json j = solution_->ToJson();
  EXPECT_DOUBLE_EQ(j["exploitability"].get<double>(), 0.4);
  EXPECT_EQ(j["iterations"], 100);
  EXPECT_TRUE(j["strategies"].contains("AcKd"));
  Solution back = Solution::FromJson(j);
  EXPECT_EQ(back.Size(), solution_->Size());
  EXPECT_DOUBLE_EQ(back.GetStrategy(Hand::FromString("QsQh")).Ev(GameAction(PokerAction::kCheck)),
                   3.0);
}

TEST_F(StrategyTest, RescaledMovesAmountsAndEvs) {
  Strategy scaled = Mixed().Rescaled(2.0);
  EXPECT_EQ(scaled.GetHand(), hand_);
  EXPECT_EQ(scaled.GetActions()[0], check_);
  EXPECT_EQ(scaled.GetActions()[1], GameAction(PokerAction::kBet, 4.0));
  EXPECT_EQ(scaled.GetActions()[2], GameAction(PokerAction::kBet, 9.0));
  EXPECT_EQ(scaled.GetFrequencies(), Mixed().GetFrequencies());
  EXPECT_DOUBLE_EQ(scaled.Ev(check_), 2.0);
  EXPECT_DOUBLE_EQ(scaled.Ev(GameAction(PokerAction::kBet, 9.0)), 3.0);

  Solution::Table table;
  table.emplace(hand_.ToString(), Mixed());
  Solution solution(std::move(table), 0.1, 50);
  Solution rescaled = solution.Rescaled(0.5);
  EXPECT_DOUBLE_EQ(rescaled.GetStrategy(hand_).Frequency(GameAction(PokerAction::kBet, 1.0)), 0.5);
  EXPECT_DOUBLE_EQ(rescaled.GetExploitability(), 0.1);
  EXPECT_EQ(rescaled.GetIterations(), 50);
}
