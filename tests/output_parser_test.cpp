#include "gtest/gtest.h"
#include "solver/OutputParser.h"
#include "Errors.h"
#include "test_doubles.h"

#include <array>
#include <string>
#include <vector>

using namespace gto_broker;
using namespace gto_broker::solver;
using namespace gto_broker::core;
using gto_broker::testing_support::SolverNode;
using gto_broker::testing_support::SolverRun;
using gto_broker::testing_support::SolverStdout;

class OutputParserTest : public ::testing::Test {
 protected:
  // Root: OOP checks or bets; after a check IP checks or bets one of two sizes.
  json Dump() const {
    json root = SolverNode({"CHECK", "BET 2.000000"},
                           {{"AcKd", {0.25, 0.75}}, {"QhQs", {1.0, 0.0}}});
    json after_check = SolverNode({"CHECK", "BET 1.650000", "BET 3.750000"},
                                  {{"AcKd", {0.1, 0.2, 0.7}}});
    json facing_small = SolverNode({"FOLD", "CALL", "RAISE 8.000000"},
                                   {{"AcKd", {0.0, 0.6, 0.4}}});
    after_check["childrens"] = {{"BET 1.650000", facing_small}};
    root["childrens"] = {{"CHECK", after_check}, {"BET 2.000000", SolverNode({"FOLD", "CALL"}, {})}};
    return root;
  }

  OutputParser parser_{config::OutputSchema{}};
  canonical::SuitMapping identity_;
};

TEST_F(OutputParserTest, ParsesRootNode) {
  strategy::Solution solution = parser_.Parse(SolverRun(Dump(), 120, 0.28), identity_);
  EXPECT_EQ(solution.Size(), 2u);
  EXPECT_EQ(solution.GetIterations(), 120);
  EXPECT_NEAR(solution.GetExploitability(), 0.28, 1e-9);
  const strategy::Strategy& ak = OutputParser::ExtractStrategy(solution, Hand::FromString("AcKd"));
  ASSERT_EQ(ak.GetActions().size(), 2u);
  EXPECT_EQ(ak.GetActions()[1], GameAction(PokerAction::kBet, 2.0));
  EXPECT_DOUBLE_EQ(ak.Frequency(GameAction(PokerAction::kBet, 2.0)), 0.75);
  EXPECT_DOUBLE_EQ(ak.Ev(GameAction(PokerAction::kCheck)), 1.0);
  EXPECT_DOUBLE_EQ(ak.Ev(GameAction(PokerAction::kBet, 2.0)), 2.0);
}

TEST_F(OutputParserTest, ExtractStrategyMissingHand) {
  strategy::Solution solution = parser_.Parse(SolverRun(Dump()), identity_);
  EXPECT_THROW(OutputParser::ExtractStrategy(solution, Hand::FromString("2c2d")), NotFoundError);
}

TEST_F(OutputParserTest, TruncatedOutputIsParseError) {
  solver::RawOutput raw = SolverRun(Dump());
  std::string full = *raw.result_file_contents;
  raw.result_file_contents = full.substr(0, full.size() / 2);
  try {
    parser_.Parse(raw, identity_);
    FAIL() << "Expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_FALSE(e.Excerpt().empty());
    EXPECT_LE(e.Excerpt().size(), kMaxExcerptBytes);
  }
}

TEST_F(OutputParserTest, MissingResultFileIsParseError) {
  solver::RawOutput raw = SolverRun(Dump());
  raw.result_file_contents.reset();
  EXPECT_THROW(parser_.Parse(raw, identity_), ParseError);
}

TEST_F(OutputParserTest, MissingProgressLinesIsParseError) {
  solver::RawOutput raw = SolverRun(Dump());
  raw.stdout_text = "Iter: 40\n";
  EXPECT_THROW(parser_.Parse(raw, identity_), ParseError);
  raw.stdout_text = "Total exploitability 0.5 precent\n";
  EXPECT_THROW(parser_.Parse(raw, identity_), ParseError);
}

TEST_F(OutputParserTest, LastProgressLineWins) {
  solver::RawOutput raw = SolverRun(Dump());
  raw.stdout_text = SolverStdout(10, 5.0) + SolverStdout(20, 1.5) + SolverStdout(30, 0.25);
  strategy::Solution solution = parser_.Parse(raw, identity_);
  EXPECT_EQ(solution.GetIterations(), 30);
  EXPECT_NEAR(solution.GetExploitability(), 0.25, 1e-9);
}

TEST_F(OutputParserTest, SchemaMismatchIsParseError) {
  json dump = Dump();
  dump.erase("evs");
  EXPECT_THROW(parser_.Parse(SolverRun(dump), identity_), ParseError);

  json no_strategy = Dump();
  no_strategy.erase("strategy");
  EXPECT_THROW(parser_.Parse(SolverRun(no_strategy), identity_), ParseError);

  json short_row = Dump();
  short_row["strategy"]["strategy"]["AcKd"] = {1.0};
  EXPECT_THROW(parser_.Parse(SolverRun(short_row), identity_), ParseError);

  json bad_hand = Dump();
  bad_hand["strategy"]["strategy"]["XxYy"] = {0.5, 0.5};
  EXPECT_THROW(parser_.Parse(SolverRun(bad_hand), identity_), ParseError);

  json no_evs_for_hand = Dump();
  no_evs_for_hand["evs"]["evs"].erase("QhQs");
  EXPECT_THROW(parser_.Parse(SolverRun(no_evs_for_hand), identity_), ParseError);
}

TEST_F(OutputParserTest, RenormalizesWithinTolerance) {
  json dump = Dump();
  dump["strategy"]["strategy"]["AcKd"] = {0.2502, 0.7502};
  strategy::Solution solution = parser_.Parse(SolverRun(dump), identity_);
  const strategy::Strategy& ak = solution.GetStrategy(Hand::FromString("AcKd"));
  EXPECT_NEAR(ak.FrequencySum(), 1.0, 1e-12);
  EXPECT_NEAR(ak.Frequency(GameAction(PokerAction::kCheck)), 0.2502 / 1.0004, 1e-12);
}

TEST_F(OutputParserTest, RejectsFrequenciesOutsideTolerance) {
  json dump = Dump();
  dump["strategy"]["strategy"]["AcKd"] = {0.3, 0.8};
  EXPECT_THROW(parser_.Parse(SolverRun(dump), identity_), ParseError);
}

TEST_F(OutputParserTest, RelabelsHandsThroughMapping) {
  // Canonical c is real d and the other way round.
  canonical::SuitMapping mapping(std::array<int, 4>{1, 0, 2, 3});
  strategy::Solution solution = parser_.Parse(SolverRun(Dump()), mapping);
  EXPECT_NE(solution.Find(Hand::FromString("AdKc")), nullptr);
  EXPECT_EQ(solution.Find(Hand::FromString("AcKd")), nullptr);
  EXPECT_DOUBLE_EQ(solution.GetStrategy(Hand::FromString("AdKc"))
                       .Frequency(GameAction(PokerAction::kBet, 2.0)),
                   0.75);
}

TEST_F(OutputParserTest, FollowsLineToDecisionNode) {
  std::vector<GameAction> line = {GameAction(PokerAction::kCheck)};
  strategy::Solution solution = parser_.Parse(SolverRun(Dump()), identity_, line);
  EXPECT_EQ(solution.Size(), 1u);
  const strategy::Strategy& ak = solution.GetStrategy(Hand::FromString("AcKd"));
  EXPECT_EQ(ak.GetActions().size(), 3u);
  EXPECT_DOUBLE_EQ(ak.Frequency(GameAction(PokerAction::kBet, 3.75)), 0.7);
}

TEST_F(OutputParserTest, LineMatchesNearestBetSize) {
  // 1.5 is closest to the 1.65 branch the solver built.
  std::vector<GameAction> line = {GameAction(PokerAction::kCheck),
                                  GameAction(PokerAction::kBet, 1.5)};
  strategy::Solution solution = parser_.Parse(SolverRun(Dump()), identity_, line);
  const strategy::Strategy& ak = solution.GetStrategy(Hand::FromString("AcKd"));
  EXPECT_DOUBLE_EQ(ak.Frequency(GameAction(PokerAction::kCall)), 0.6);
}

TEST_F(OutputParserTest, LineOutsideTreeIsNotFound) {
  std::vector<GameAction> raise = {GameAction(PokerAction::kRaise, 6.0)};
  EXPECT_THROW(parser_.Parse(SolverRun(Dump()), identity_, raise), NotFoundError);
  // Past a leaf.
  std::vector<GameAction> too_deep = {GameAction(PokerAction::kCheck),
                                      GameAction(PokerAction::kBet, 3.75),
                                      GameAction(PokerAction::kCall)};
  EXPECT_THROW(parser_.Parse(SolverRun(Dump()), identity_, too_deep), NotFoundError);
}

TEST_F(OutputParserTest, ReadsJsonFromStdout) {
  config::OutputSchema schema;
  schema.source = config::OutputSchema::Source::kStdout;
  OutputParser parser(schema);
  solver::RawOutput raw;
  raw.stdout_text = "Loading ranges\n" + SolverStdout(50, 0.4) + Dump().dump() + "\n";
  strategy::Solution solution = parser.Parse(raw, identity_);
  EXPECT_EQ(solution.GetIterations(), 50);
  EXPECT_EQ(solution.Size(), 2u);

  raw.stdout_text = SolverStdout(50, 0.4);
  EXPECT_THROW(parser.Parse(raw, identity_), ParseError);
}

TEST_F(OutputParserTest, CustomFieldNames) {
  config::OutputSchema schema;
  schema.children_key = "children";
  schema.strategy_table_key = "table";
  OutputParser parser(schema);
  json dump = Dump();
  dump["children"] = dump["childrens"];
  dump.erase("childrens");
  dump["strategy"]["table"] = dump["strategy"]["strategy"];
  dump["strategy"].erase("strategy");
  strategy::Solution solution = parser.Parse(SolverRun(dump), identity_);
  EXPECT_EQ(solution.Size(), 2u);
  // The child node still uses the default table name.
  EXPECT_THROW(parser.Parse(SolverRun(dump), identity_, {GameAction(PokerAction::kCheck)}),
               ParseError);
}

TEST_F(OutputParserTest, DecisionNodeMustBelongToActingPlayer) {
  json dump = SolverNode({"CHECK", "BET 2.000000"}, {{"AcKd", {0.25, 0.75}}}, 1);
  dump["childrens"] = {{"CHECK", SolverNode({"CHECK", "BET 3.750000"}, {{"AcKd", {0.4, 0.6}}}, 0)}};

  EXPECT_EQ(parser_.Parse(SolverRun(dump), identity_, {}, 1).Size(), 1u);
  EXPECT_THROW(parser_.Parse(SolverRun(dump), identity_, {}, 0), ParseError);
  EXPECT_EQ(parser_.Parse(SolverRun(dump), identity_, {GameAction(PokerAction::kCheck)}, 0).Size(),
            1u);
  EXPECT_THROW(parser_.Parse(SolverRun(dump), identity_, {GameAction(PokerAction::kCheck)}, 1),
               ParseError);
}

TEST_F(OutputParserTest, NodeWithoutPlayerFieldIsNotChecked) {
  EXPECT_EQ(parser_.Parse(SolverRun(Dump()), identity_, {}, 0).Size(), 2u);
  config::OutputSchema schema;
  schema.player_key = "";
  OutputParser parser(schema);
  json dump = SolverNode({"CHECK", "BET 2.000000"}, {{"AcKd", {0.25, 0.75}}}, 1);
  EXPECT_EQ(parser.Parse(SolverRun(dump), identity_, {}, 0).Size(), 1u);
}
