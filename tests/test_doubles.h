#ifndef GTO_BROKER_TESTS_TEST_DOUBLES_H_
#define GTO_BROKER_TESTS_TEST_DOUBLES_H_

#include "cache/SolutionStore.h"
#include "solver/ProcessRunner.h"
#include "strategy/Solution.h"
#include "Errors.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

using json = nlohmann::json;

namespace gto_broker {
namespace testing_support {

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string templ = (std::filesystem::temp_directory_path() / "gto_broker_test_XXXXXX").string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = buffer.data();
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& Path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Writes an executable /bin/sh script and returns its path.
inline std::filesystem::path WriteScript(const std::filesystem::path& dir, const std::string& name,
                                         const std::string& body) {
  std::filesystem::path path = dir / name;
  std::ofstream out(path);
  out << "#!/bin/sh\n" << body << "\n";
  out.close();
  ::chmod(path.c_str(), 0755);
  return path;
}

// Progress lines as the console solver prints them.
inline std::string SolverStdout(int iterations, double exploitability) {
  return "Iter: " + std::to_string(iterations) + "\nTotal exploitability " +
         std::to_string(exploitability) + " precent\n";
}

// One decision node of a solver dump. `table` maps hand labels to
// frequencies; EVs are 1.0, 2.0, ... per action. `player` is written only
// when given (0 in position, 1 out of position).
inline json SolverNode(const std::vector<std::string>& actions,
                       const std::map<std::string, std::vector<double>>& table,
                       std::optional<int> player = std::nullopt) {
  json strategy_table = json::object();
  json ev_table = json::object();
  for (const auto& [hand, freqs] : table) {
    strategy_table[hand] = freqs;
    std::vector<double> evs;
    for (size_t i = 0; i < freqs.size(); ++i) evs.push_back(1.0 + static_cast<double>(i));
    ev_table[hand] = evs;
  }
  json node;
  node["node_type"] = "action_node";
  if (player.has_value()) {
    node["player"] = *player;
  }
  node["actions"] = actions;
  node["strategy"] = {{"actions", actions}, {"strategy", strategy_table}};
  node["evs"] = {{"actions", actions}, {"evs", ev_table}};
  return node;
}

// A successful run whose result file holds `dump`.
inline solver::RawOutput SolverRun(const json& dump, int iterations = 120,
                                   double exploitability = 0.28) {
  solver::RawOutput raw;
  raw.exit_code = 0;
  raw.stdout_text = SolverStdout(iterations, exploitability);
  raw.result_file_contents = dump.dump();
  return raw;
}

// Two-hand solution used where the contents do not matter.
inline strategy::SolutionPtr SmallSolution(double exploitability = 0.5) {
  using core::GameAction;
  using core::PokerAction;
  std::vector<GameAction> actions = {GameAction(PokerAction::kCheck),
                                     GameAction(PokerAction::kBet, 2.0)};
  strategy::Solution::Table table;
  core::Hand ak = core::Hand::FromString("AcKd");
  core::Hand qq = core::Hand::FromString("QhQs");
  table.emplace(ak.ToString(), strategy::Strategy(ak, actions, {0.25, 0.75}, {1.5, 2.0}));
  table.emplace(qq.ToString(), strategy::Strategy(qq, actions, {1.0, 0.0}, {3.0, 2.5}));
  return std::make_shared<const strategy::Solution>(std::move(table), exploitability, 100);
}

// Process runner double: returns a canned output and counts calls.
class FakeProcessRunner : public solver::ProcessRunner {
 public:
  explicit FakeProcessRunner(solver::RawOutput output) : output_(std::move(output)) {}

  solver::RawOutput Run(const solver::ProcessInvocation& invocation,
                        std::chrono::milliseconds timeout) override {
    ++calls;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_invocation_ = invocation;
      last_timeout_ = timeout;
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (failure) {
      failure();
    }
    return output_;
  }

  solver::ProcessInvocation LastInvocation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_invocation_;
  }
  std::chrono::milliseconds LastTimeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_timeout_;
  }

  std::atomic<int> calls{0};
  std::chrono::milliseconds delay{0};
  // Called after the delay; throw from it to simulate a failed run.
  std::function<void()> failure;

 private:
  solver::RawOutput output_;
  mutable std::mutex mutex_;
  solver::ProcessInvocation last_invocation_;
  std::chrono::milliseconds last_timeout_{0};
};

// In-memory store that counts operations and can be told to fail.
class RecordingStore : public cache::SolutionStore {
 public:
  std::optional<cache::CacheEntry> Load(const std::string& key) override {
    ++loads;
    if (fail_loads) {
      throw CacheIOError("memory://" + key, "injected read failure");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void Save(const cache::CacheEntry& entry) override {
    ++saves;
    if (fail_saves) {
      throw CacheIOError("memory://" + entry.key, "injected write failure");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(entry.key, entry);
  }

  std::vector<std::string> ListKeys() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, entry] : entries_) keys.push_back(key);
    return keys;
  }

  std::atomic<int> loads{0};
  std::atomic<int> saves{0};
  std::atomic<bool> fail_loads{false};
  std::atomic<bool> fail_saves{false};

 private:
  std::mutex mutex_;
  std::map<std::string, cache::CacheEntry> entries_;
};

} // namespace testing_support
} // namespace gto_broker

#endif // GTO_BROKER_TESTS_TEST_DOUBLES_H_
