#include "gtest/gtest.h"
#include "Situation.h"
#include "Errors.h"

#include <stdexcept>
#include <vector>

using namespace gto_broker;
using namespace gto_broker::core;

class SituationTest : public ::testing::Test {
 protected:
  Situation Flop(std::vector<Card> board, double pot = 6.0, double stack = 100.0) {
    return Situation(Street::kFlop, std::move(board), pot, stack, Position::kBB, {Position::kBTN});
  }

  // Field named by the ConfigurationError the callable throws.
  template <typename Fn>
  std::string FailingField(Fn fn) {
    try {
      fn();
    } catch (const ConfigurationError& e) {
      return e.Field();
    }
    return "";
  }
};

TEST_F(SituationTest, StreetAndPositionNames) {
  EXPECT_EQ(StreetFromString("Turn"), Street::kTurn);
  EXPECT_EQ(StreetToString(Street::kRiver), "river");
  EXPECT_EQ(ExpectedBoardSize(Street::kPreflop), 0u);
  EXPECT_EQ(ExpectedBoardSize(Street::kTurn), 4u);
  EXPECT_EQ(PositionFromString("utg+1"), Position::kUTG1);
  EXPECT_EQ(PositionToString(Position::kCO), "CO");
  EXPECT_THROW(StreetFromString("showdown"), std::invalid_argument);
  EXPECT_THROW(PositionFromString("dealer"), std::invalid_argument);
}

TEST_F(SituationTest, PostflopActingOrder) {
  EXPECT_LT(PostflopActingOrder(Position::kSB), PostflopActingOrder(Position::kBB));
  EXPECT_LT(PostflopActingOrder(Position::kBB), PostflopActingOrder(Position::kUTG));
  EXPECT_LT(PostflopActingOrder(Position::kCO), PostflopActingOrder(Position::kBTN));
}

TEST_F(SituationTest, ValidSituationPasses) {
  Situation situation = Flop(Card::ParseCards("QsJh2h"));
  EXPECT_NO_THROW(situation.Validate());
  EXPECT_NO_THROW(situation.ValidateWithHand(Hand::FromString("AsKd")));
}

TEST_F(SituationTest, BoardSizeMustMatchStreet) {
  EXPECT_EQ(FailingField([&] { Flop(Card::ParseCards("QsJh")).Validate(); }), "board");
  Situation preflop(Street::kPreflop, Card::ParseCards("QsJh2h"), 1.5, 100.0, Position::kBTN);
  EXPECT_EQ(FailingField([&] { preflop.Validate(); }), "board");
}

TEST_F(SituationTest, DuplicateBoardCards) {
  EXPECT_EQ(FailingField([&] { Flop(Card::ParseCards("QsQs2h")).Validate(); }), "board");
}

TEST_F(SituationTest, PotAndStackMustBePositive) {
  EXPECT_EQ(FailingField([&] { Flop(Card::ParseCards("QsJh2h"), 0.0).Validate(); }), "pot");
  EXPECT_EQ(FailingField([&] { Flop(Card::ParseCards("QsJh2h"), 6.0, 0.0).Validate(); }),
            "effective_stack");
  EXPECT_EQ(FailingField([&] { Flop(Card::ParseCards("QsJh2h"), -1.0).Validate(); }), "pot");
}

TEST_F(SituationTest, HandMustNotOverlapBoard) {
  Situation situation = Flop(Card::ParseCards("QsJh2h"));
  EXPECT_EQ(FailingField([&] { situation.ValidateWithHand(Hand::FromString("QsQd")); }), "hand");
}

TEST_F(SituationTest, OpponentsMustBeDistinct) {
  Situation same_seat(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBB,
                      {Position::kBB});
  EXPECT_EQ(FailingField([&] { same_seat.Validate(); }), "opponents");
}

TEST_F(SituationTest, HistoryCannotRunAhead) {
  std::vector<HistoryEntry> history = {
      HistoryEntry(Street::kTurn, Position::kBB, GameAction(PokerAction::kCheck))};
  Situation situation(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBTN,
                      {Position::kBB}, history);
  EXPECT_EQ(FailingField([&] { situation.Validate(); }), "history");
}

TEST_F(SituationTest, CurrentStreetLine) {
  std::vector<HistoryEntry> history = {
      HistoryEntry(Street::kPreflop, Position::kBTN, GameAction(PokerAction::kRaise, 2.5)),
      HistoryEntry(Street::kPreflop, Position::kBB, GameAction(PokerAction::kCall)),
      HistoryEntry(Street::kFlop, Position::kBB, GameAction(PokerAction::kCheck)),
      HistoryEntry(Street::kFlop, Position::kBTN, GameAction(PokerAction::kBet, 2.0))};
  Situation situation(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBB,
                      {Position::kBTN}, history);
  std::vector<GameAction> line = situation.CurrentStreetLine();
  ASSERT_EQ(line.size(), 2u);
  EXPECT_EQ(line[0], GameAction(PokerAction::kCheck));
  EXPECT_EQ(line[1], GameAction(PokerAction::kBet, 2.0));
}

TEST_F(SituationTest, HeadsUpHeroMustBeNextToAct) {
  Situation ip_opens(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBTN,
                     {Position::kBB});
  EXPECT_EQ(FailingField([&] { ip_opens.Validate(); }), "acting_position");

  std::vector<HistoryEntry> check = {
      HistoryEntry(Street::kFlop, Position::kBB, GameAction(PokerAction::kCheck))};
  Situation ip_after_check(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBTN,
                           {Position::kBB}, check);
  EXPECT_NO_THROW(ip_after_check.Validate());
  Situation oop_after_own_check(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0,
                                Position::kBB, {Position::kBTN}, check);
  EXPECT_EQ(FailingField([&] { oop_after_own_check.Validate(); }), "acting_position");
}

TEST_F(SituationTest, StreetOpensWithOutOfPositionPlayer) {
  std::vector<HistoryEntry> history = {
      HistoryEntry(Street::kFlop, Position::kBTN, GameAction(PokerAction::kBet, 2.0))};
  Situation situation(Street::kFlop, Card::ParseCards("QsJh2h"), 6.0, 100.0, Position::kBB,
                      {Position::kBTN}, history);
  EXPECT_EQ(FailingField([&] { situation.Validate(); }), "history");
}

TEST_F(SituationTest, TurnOrderNotCheckedPreflopOrMultiway) {
  Situation preflop(Street::kPreflop, {}, 1.5, 100.0, Position::kBTN, {Position::kBB});
  EXPECT_NO_THROW(preflop.Validate());
  Situation multiway(Street::kFlop, Card::ParseCards("QsJh2h"), 9.0, 100.0, Position::kBTN,
                     {Position::kBB, Position::kCO});
  EXPECT_NO_THROW(multiway.Validate());
}
