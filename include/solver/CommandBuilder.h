#ifndef GTO_BROKER_SOLVER_COMMAND_BUILDER_H_
#define GTO_BROKER_SOLVER_COMMAND_BUILDER_H_

#include "canonical/Canonicalizer.h"
#include "tools/SolverConfig.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gto_broker {
namespace solver {

// Everything needed to start one solver run. The runner creates a private
// work directory, writes input_file_contents to input_file_name inside it
// and starts `executable arguments...` there.
struct ProcessInvocation {
  std::filesystem::path executable;
  std::vector<std::string> arguments;
  std::string input_file_name;
  std::string input_file_contents;
  // Empty when the solver reports on stdout only.
  std::string result_file_name;
};

// Translates a canonical situation into a TexasSolver console run.
class CommandBuilder {
 public:
  // Throws ConfigurationError if the configuration is invalid.
  explicit CommandBuilder(config::SolverConfig config);

  // Throws ConfigurationError if the situation cannot be solved: preflop,
  // anything but a heads-up IP/OOP spot, zero stack, or a board not
  // matching the street.
  ProcessInvocation Build(const canonical::CanonicalSituation& situation) const;

  // The input script alone.
  std::string BuildInputScript(const canonical::CanonicalSituation& situation) const;

  const config::SolverConfig& GetConfig() const { return config_; }

 private:
  void ValidateSituation(const canonical::CanonicalSituation& situation) const;

  config::SolverConfig config_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_COMMAND_BUILDER_H_
