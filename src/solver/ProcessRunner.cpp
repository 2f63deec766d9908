#include "solver/ProcessRunner.h"
#include "Errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility> // For std::move

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace gto_broker {
namespace solver {

namespace {

constexpr int kPollSliceMs = 20;

// Closes the descriptor on scope exit.
class FdGuard {
 public:
  FdGuard() = default;
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() { Close(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int Get() const { return fd_; }
  void Reset(int fd) { Close(); fd_ = fd; }
  void Close() {
      if (fd_ >= 0) {
          ::close(fd_);
          fd_ = -1;
      }
  }

 private:
  int fd_ = -1;
};

// Removes the run's work directory on scope exit.
class WorkDirGuard {
 public:
  explicit WorkDirGuard(fs::path dir) : dir_(std::move(dir)) {}
  ~WorkDirGuard() {
      std::error_code ec;
      fs::remove_all(dir_, ec);
      if (ec) {
          std::cerr << "[WARNING] Could not remove solver work directory " << dir_.string()
                    << ": " << ec.message() << std::endl;
      }
  }
  WorkDirGuard(const WorkDirGuard&) = delete;
  WorkDirGuard& operator=(const WorkDirGuard&) = delete;

  const fs::path& Path() const { return dir_; }

 private:
  fs::path dir_;
};

std::string ErrnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

fs::path MakeWorkDir(const fs::path& work_root) {
    std::error_code ec;
    fs::path root = work_root.empty() ? fs::temp_directory_path(ec) : work_root;
    if (ec) {
        throw SpawnError("No temp directory for solver runs: " + ec.message());
    }
    fs::create_directories(root, ec);
    if (ec) {
        throw SpawnError("Cannot create solver work root " + root.string() + ": " + ec.message());
    }
    std::string templ = (root / "gto_broker_XXXXXX").string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw SpawnError(ErrnoMessage("Cannot create solver work directory under " + root.string()));
    }
    return fs::path(buffer.data());
}

void MakePipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ProcessExecutionError(ProcessExecutionError::Kind::kTransient, ErrnoMessage("pipe2 failed"));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
}

// Reads whatever is available; closes the guard on EOF.
void DrainOnce(FdGuard& fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = ::read(fd.Get(), buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.Close();
    }
}

// One poll round over the open output pipes.
void PumpOutput(FdGuard& out, FdGuard& err, std::string& out_text, std::string& err_text,
                int timeout_ms) {
    pollfd fds[2];
    FdGuard* guards[2];
    std::string* sinks[2];
    nfds_t count = 0;
    if (out.Get() >= 0) {
        fds[count] = {out.Get(), POLLIN, 0};
        guards[count] = &out;
        sinks[count] = &out_text;
        ++count;
    }
    if (err.Get() >= 0) {
        fds[count] = {err.Get(), POLLIN, 0};
        guards[count] = &err;
        sinks[count] = &err_text;
        ++count;
    }
    if (count == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return;
    }
    int ready = ::poll(fds, count, timeout_ms);
    if (ready <= 0) {
        return;
    }
    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
            DrainOnce(*guards[i], *sinks[i]);
        }
    }
}

int WaitBlocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return status;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::optional<std::string> ReadFileIfPresent(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

PosixProcessRunner::PosixProcessRunner() : PosixProcessRunner(Options{}) {}

PosixProcessRunner::PosixProcessRunner(Options options) : options_(std::move(options)) {}

void PosixProcessRunner::CheckExecutable(const fs::path& executable) {
    std::error_code ec;
    if (executable.empty() || !fs::is_regular_file(executable, ec)) {
        throw SpawnError("Solver binary not found at '" + executable.string() + "'");
    }
    if (::access(executable.c_str(), X_OK) != 0) {
        throw SpawnError(ErrnoMessage("Solver binary '" + executable.string() + "' is not executable"));
    }
}

bool PosixProcessRunner::IsTransient(int exit_code) const {
    return std::find(options_.transient_exit_codes.begin(), options_.transient_exit_codes.end(),
                     exit_code) != options_.transient_exit_codes.end();
}

RawOutput PosixProcessRunner::Run(const ProcessInvocation& invocation,
                                  std::chrono::milliseconds timeout) {
    for (int attempt = 1;; ++attempt) {
        try {
            RawOutput output = RunOnce(invocation, timeout);
            output.attempts = attempt;
            return output;
        } catch (ProcessExecutionError& e) {
            e.SetAttempts(attempt);
            bool retryable = e.GetKind() == ProcessExecutionError::Kind::kTransient ||
                             (e.GetKind() == ProcessExecutionError::Kind::kTimeout &&
                              options_.retry_on_timeout);
            if (attempt > 1 || !retryable) {
                throw;
            }
            std::cerr << "[WARNING] Solver run failed (" << ProcessExecutionError::KindToString(e.GetKind())
                      << "): " << e.what() << ". Retrying in " << options_.retry_backoff.count()
                      << " ms." << std::endl;
            std::this_thread::sleep_for(options_.retry_backoff);
        }
    }
}

RawOutput PosixProcessRunner::RunOnce(const ProcessInvocation& invocation,
                                      std::chrono::milliseconds timeout) {
    CheckExecutable(invocation.executable);
    fs::path executable = fs::absolute(invocation.executable);

    WorkDirGuard work_dir(MakeWorkDir(options_.work_root));
    if (!invocation.input_file_name.empty()) {
        std::ofstream input(work_dir.Path() / invocation.input_file_name);
        input << invocation.input_file_contents;
        input.close();
        if (!input) {
            throw SpawnError("Cannot write solver input file in " + work_dir.Path().string());
        }
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args;
    args.push_back(executable.string());
    args.insert(args.end(), invocation.arguments.begin(), invocation.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::string cwd = work_dir.Path().string();

    FdGuard out_read, out_write, err_read, err_write, exec_read, exec_write;
    MakePipe(out_read, out_write);
    MakePipe(err_read, err_write);
    MakePipe(exec_read, exec_write);
    FdGuard dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));

    std::cout << "[INFO] Starting solver " << executable.filename().string() << " in " << cwd
              << " (timeout " << timeout.count() << " ms)" << std::endl;
    Clock::time_point start = Clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessExecutionError(ProcessExecutionError::Kind::kTransient, ErrnoMessage("fork failed"));
    }
    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        if (::chdir(cwd.c_str()) == 0 &&
            (dev_null.Get() < 0 || ::dup2(dev_null.Get(), STDIN_FILENO) >= 0) &&
            ::dup2(out_write.Get(), STDOUT_FILENO) >= 0 &&
            ::dup2(err_write.Get(), STDERR_FILENO) >= 0) {
            ::execv(argv[0], argv.data());
        }
        int error = errno;
        ssize_t ignored = ::write(exec_write.Get(), &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    out_write.Close();
    err_write.Close();
    exec_write.Close();

    // exec_read sees EOF when execv succeeds (CLOEXEC) or the errno otherwise.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        WaitBlocking(pid);
        errno = exec_errno;
        throw SpawnError(ErrnoMessage("Cannot execute solver binary " + executable.string()));
    }

    RawOutput output;
    Clock::time_point deadline = start + timeout;
    bool timed_out = false;
    int status = 0;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        int slice = static_cast<int>(std::clamp<long long>(remaining.count(), 0, kPollSliceMs));
        PumpOutput(out_read, err_read, output.stdout_text, output.stderr_text, slice);

        // WNOWAIT keeps the child a zombie, so its process group id cannot
        // be reused before the group is killed below.
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid) {
            // Pick up whatever is still buffered in the pipes.
            while (out_read.Get() >= 0 || err_read.Get() >= 0) {
                size_t before = output.stdout_text.size() + output.stderr_text.size();
                PumpOutput(out_read, err_read, output.stdout_text, output.stderr_text, 0);
                if (output.stdout_text.size() + output.stderr_text.size() == before) {
                    break;
                }
            }
            // Anything the solver left running in its group goes too.
            ::kill(-pid, SIGKILL);
            status = WaitBlocking(pid);
            break;
        }
        if (Clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            status = WaitBlocking(pid);
            timed_out = true;
            break;
        }
    }
    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    output.exit_code = DecodeStatus(status);

    if (timed_out) {
        std::cerr << "[ERROR] Solver timed out after " << output.elapsed.count() << " ms, killed."
                  << std::endl;
        throw ProcessExecutionError(ProcessExecutionError::Kind::kTimeout,
                                    "Solver exceeded its " + std::to_string(timeout.count()) +
                                        " ms time limit and was killed.",
                                    output.exit_code, MakeExcerpt(output.stderr_text));
    }
    if (output.exit_code != 0) {
        // A SIGKILL we did not send is the OOM killer.
        bool killed_externally = WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL;
        auto kind = (IsTransient(output.exit_code) || killed_externally)
                        ? ProcessExecutionError::Kind::kTransient
                        : ProcessExecutionError::Kind::kNonZeroExit;
        std::cerr << "[ERROR] Solver exited with status " << output.exit_code << " after "
                  << output.elapsed.count() << " ms." << std::endl;
        throw ProcessExecutionError(kind, "Solver exited with status " + std::to_string(output.exit_code),
                                    output.exit_code, MakeExcerpt(output.stderr_text));
    }

    if (!invocation.result_file_name.empty()) {
        output.result_file_contents = ReadFileIfPresent(work_dir.Path() / invocation.result_file_name);
    }
    std::cout << "[INFO] Solver finished in " << output.elapsed.count() << " ms." << std::endl;
    return output;
}

} // namespace solver
} // namespace gto_broker
