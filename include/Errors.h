#ifndef GTO_BROKER_ERRORS_H_
#define GTO_BROKER_ERRORS_H_

#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility> // For std::move

namespace gto_broker {

// Maximum number of bytes of raw solver output / stderr kept on an error.
constexpr std::size_t kMaxExcerptBytes = 512;

// Returns at most max_bytes of text, keeping the tail (where solvers
// usually print the interesting part) and marking the truncation.
std::string MakeExcerpt(const std::string& text,
                        std::size_t max_bytes = kMaxExcerptBytes);

// Bad situation or bad solver configuration. Caller error, never retried.
class ConfigurationError : public std::invalid_argument {
 public:
  ConfigurationError(std::string field, const std::string& message)
      : std::invalid_argument(message), field_(std::move(field)) {}

  // Name of the offending field (e.g. "board", "accuracy").
  const std::string& Field() const { return field_; }

 private:
  std::string field_;
};

// Failure running the external solver binary.
class ProcessExecutionError : public std::runtime_error {
 public:
  enum class Kind {
    kNonZeroExit,  // Deterministic failure reported by the binary.
    kTimeout,      // Hard wall-clock limit hit, process killed.
    kTransient,    // Resource exhaustion and similar, one retry allowed.
    kSpawn,        // Binary missing or not executable.
    kWaitTimeout   // A caller gave up waiting on a shared computation.
  };

  ProcessExecutionError(Kind kind, const std::string& message,
                        int exit_status = -1, std::string stderr_excerpt = "",
                        int attempts = 1)
      : std::runtime_error(message),
        kind_(kind),
        exit_status_(exit_status),
        stderr_excerpt_(std::move(stderr_excerpt)),
        attempts_(attempts) {}

  Kind GetKind() const { return kind_; }
  int ExitStatus() const { return exit_status_; }
  const std::string& StderrExcerpt() const { return stderr_excerpt_; }
  int Attempts() const { return attempts_; }
  void SetAttempts(int attempts) { attempts_ = attempts; }

  static std::string KindToString(Kind kind);

 private:
  Kind kind_;
  int exit_status_;
  std::string stderr_excerpt_;
  int attempts_;
};

// The binary could not be started at all. A configuration problem, so it
// is never retried.
class SpawnError : public ProcessExecutionError {
 public:
  explicit SpawnError(const std::string& message)
      : ProcessExecutionError(Kind::kSpawn, message) {}
};

// Solver output did not match the configured schema.
class ParseError : public std::runtime_error {
 public:
  ParseError(const std::string& message, const std::string& raw_output)
      : std::runtime_error(message), excerpt_(MakeExcerpt(raw_output)) {}

  const std::string& Excerpt() const { return excerpt_; }

 private:
  std::string excerpt_;
};

// A hand, action or cached solution the caller asked for does not exist.
class NotFoundError : public std::out_of_range {
 public:
  explicit NotFoundError(const std::string& message)
      : std::out_of_range(message) {}
};

// Storage failure in the solution cache. Absorbed by the cache itself.
class CacheIOError : public std::runtime_error {
 public:
  CacheIOError(std::string path, const std::string& message)
      : std::runtime_error(message), path_(std::move(path)) {}

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

// Process exit codes of the command line tool, one per error class.
constexpr int kExitOk = 0;
constexpr int kExitInternal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNotFound = 3;
constexpr int kExitProcess = 4;
constexpr int kExitParse = 5;
constexpr int kExitCacheIO = 6;

// Runs command and returns its exit code. An exception escaping it is
// reported as an "[ERROR]" line on err and mapped to its exit code;
// anything outside the classes above gives kExitInternal.
int RunReportingErrors(const std::function<int()>& command, std::ostream& err);

} // namespace gto_broker

#endif // GTO_BROKER_ERRORS_H_
