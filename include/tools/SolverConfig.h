#ifndef GTO_BROKER_CONFIG_SOLVER_CONFIG_H_
#define GTO_BROKER_CONFIG_SOLVER_CONFIG_H_

#include "tools/GameTreeBuildingSettings.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace gto_broker {
namespace config {

// Preflop opening range of the in-position player and the matching
// defending range, in the solver's range syntax.
extern const char* const kDefaultIpRange;
extern const char* const kDefaultOopRange;

// How stack depth and pot size are collapsed into cache buckets.
// Coarser buckets raise the hit rate and lose strategic fidelity.
struct BucketingPolicy {
  // Width of one effective-stack bucket, in big blinds.
  double stack_bucket_bb = 10.0;
  // Grid step for pot / effective stack.
  double pot_ratio_step = 0.05;
};

// Command-line contract of the solver binary. Version-specific, so nothing
// here is hard-coded in the command builder.
struct CommandSchema {
  std::string input_file_flag = "--input_file";
  std::string resource_dir_flag = "--resource_dir";
  std::string mode_flag = "--mode";
  std::string mode_value = "holdem";
  std::string input_file_name = "solver_input.txt";
  std::string result_file_name = "output_result.json";
  std::vector<std::string> extra_arguments;
};

// Field names and markers of the solver's output.
struct OutputSchema {
  enum class Source { kResultFile, kStdout };

  Source source = Source::kResultFile;
  std::string children_key = "childrens";
  std::string strategy_key = "strategy";
  std::string strategy_table_key = "strategy";
  std::string actions_key = "actions";
  std::string evs_key = "evs";
  std::string evs_table_key = "evs";
  // Player to act at an action node. Empty disables the check.
  std::string player_key = "player";
  int ip_player = 0;
  int oop_player = 1;
  // Stdout progress lines.
  std::string iteration_marker = "Iter:";
  std::string exploitability_marker = "Total exploitability";
  // Frequency sums this close to 1 are renormalized; anything further
  // off is rejected as a schema mismatch.
  double normalize_tolerance = 1e-3;
};

// Everything the bridge needs to know about the external solver.
struct SolverConfig {
  std::filesystem::path binary_path;
  // Empty means: "resources" next to the binary, if it exists.
  std::filesystem::path resource_dir;
  // Parent of the per-run work directories. Empty means the system temp dir.
  std::filesystem::path work_root;
  std::filesystem::path cache_dir;

  int threads = 6;
  double accuracy = 0.3;  // Target exploitability, percent of the pot.
  int max_iterations = 1000;
  bool use_isomorphism = true;
  double allin_threshold = 0.67;
  int dump_rounds = 2;
  int print_interval = 10;

  std::chrono::milliseconds timeout{300000};
  // How long one caller waits on a shared solve. Zero waits indefinitely.
  std::chrono::milliseconds wait_timeout{0};
  int worker_pool_size = 1;
  bool retry_on_timeout = false;
  std::chrono::milliseconds retry_backoff{500};
  std::vector<int> transient_exit_codes;

  std::string ip_range = kDefaultIpRange;
  std::string oop_range = kDefaultOopRange;
  GameTreeBuildingSettings bet_sizes = GameTreeBuildingSettings::Defaults();
  BucketingPolicy bucketing;
  CommandSchema command_schema;
  OutputSchema output_schema;

  // Throws ConfigurationError naming the first bad field.
  void Validate() const;

  // resource_dir if set, else <binary dir>/resources when that exists.
  std::optional<std::filesystem::path> ResolveResourceDir() const;

  // Missing keys keep their defaults. Throws ConfigurationError on type
  // mismatches and on invalid values.
  static SolverConfig FromJson(const json& j);
  static SolverConfig LoadFromFile(const std::filesystem::path& path);
};

} // namespace config
} // namespace gto_broker

#endif // GTO_BROKER_CONFIG_SOLVER_CONFIG_H_
