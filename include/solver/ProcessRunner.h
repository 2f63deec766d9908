#ifndef GTO_BROKER_SOLVER_PROCESS_RUNNER_H_
#define GTO_BROKER_SOLVER_PROCESS_RUNNER_H_

#include "solver/CommandBuilder.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gto_broker {
namespace solver {

// What a finished solver run left behind.
struct RawOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  // Contents of the invocation's result file, if it asked for one and the
  // process wrote it.
  std::optional<std::string> result_file_contents;
  std::chrono::milliseconds elapsed{0};
  int attempts = 1;
};

// Runs an external process to completion. Implementations are safe to call
// from several threads at once.
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  // Returns only for a zero exit status.
  // Throws:
  //   SpawnError if the executable is missing or not executable.
  //   ProcessExecutionError for non-zero exits and timeouts.
  virtual RawOutput Run(const ProcessInvocation& invocation,
                        std::chrono::milliseconds timeout) = 0;
};

// fork/exec based runner. Each run gets its own work directory and its own
// process group; on timeout the whole group is killed and reaped before
// Run returns, so nothing is left behind.
class PosixProcessRunner : public ProcessRunner {
 public:
  struct Options {
    // Parent of the per-run work directories. Empty means the temp dir.
    std::filesystem::path work_root;
    // Exit codes the binary uses for resource exhaustion.
    std::vector<int> transient_exit_codes;
    bool retry_on_timeout = false;
    std::chrono::milliseconds retry_backoff{500};
  };

  PosixProcessRunner();
  explicit PosixProcessRunner(Options options);

  RawOutput Run(const ProcessInvocation& invocation,
                std::chrono::milliseconds timeout) override;

  // Throws SpawnError unless `executable` is a regular file we may execute.
  static void CheckExecutable(const std::filesystem::path& executable);

 private:
  RawOutput RunOnce(const ProcessInvocation& invocation, std::chrono::milliseconds timeout);
  bool IsTransient(int exit_code) const;

  Options options_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_PROCESS_RUNNER_H_
