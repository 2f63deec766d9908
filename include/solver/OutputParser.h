#ifndef GTO_BROKER_SOLVER_OUTPUT_PARSER_H_
#define GTO_BROKER_SOLVER_OUTPUT_PARSER_H_

#include "solver/ProcessRunner.h"
#include "strategy/Solution.h"
#include "canonical/SuitMapping.h"
#include "tools/SolverConfig.h"
#include "GameAction.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace gto_broker {
namespace solver {

// Turns a TexasSolver dump into a Solution.
//
// The dump is a tree of action nodes:
//   {"actions": [...], "childrens": {"CHECK": {...}, "BET 2.000000": {...}},
//    "strategy": {"actions": [...], "strategy": {"AcKd": [f0, f1, ...]}},
//    "evs": {"actions": [...], "evs": {"AcKd": [ev0, ev1, ...]}}}
// Field names come from the OutputSchema. Convergence figures are read from
// the progress lines on stdout.
class OutputParser {
 public:
  explicit OutputParser(config::OutputSchema schema);

  // Args:
  //   raw: Output of a successful run.
  //   mapping: Applied to every hand label (canonical -> real).
  //   line: Actions from the dump's root to the decision node to read.
  //   acting_player: Player index expected at that node (schema's ip_player
  //                  or oop_player). Checked when the node names its player.
  // Throws:
  //   ParseError on anything that does not match the schema, including a
  //   decision node that belongs to the other player.
  //   NotFoundError if the line leads to a node the dump does not have.
  strategy::Solution Parse(const RawOutput& raw,
                           const canonical::SuitMapping& mapping,
                           const std::vector<core::GameAction>& line = {},
                           std::optional<int> acting_player = std::nullopt) const;

  // Throws NotFoundError if the hand is not in the solution.
  static const strategy::Strategy& ExtractStrategy(const strategy::Solution& solution,
                                                   const core::Hand& hand);

 private:
  std::string SelectPayload(const RawOutput& raw) const;
  const json& FindNode(const json& root, const std::vector<core::GameAction>& line,
                       const std::string& payload) const;
  void CheckPlayer(const json& node, int acting_player, const std::string& payload) const;
  strategy::Solution::Table ReadTable(const json& node, const canonical::SuitMapping& mapping,
                                      const std::string& payload) const;
  // First number after the last occurrence of marker on stdout.
  std::optional<double> ReadMetric(const std::string& stdout_text, const std::string& marker) const;

  config::OutputSchema schema_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_OUTPUT_PARSER_H_
