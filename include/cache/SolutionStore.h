#ifndef GTO_BROKER_CACHE_SOLUTION_STORE_H_
#define GTO_BROKER_CACHE_SOLUTION_STORE_H_

#include "strategy/Solution.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace gto_broker {
namespace cache {

enum class Provenance { kPrecomputed, kDynamic };

std::string ProvenanceToString(Provenance provenance);
// Throws std::invalid_argument on unknown names.
Provenance ProvenanceFromString(const std::string& text);

// One persisted solution, stored in canonical suits.
struct CacheEntry {
  std::string key;
  strategy::SolutionPtr solution;
  Provenance provenance = Provenance::kDynamic;
  std::chrono::system_clock::time_point created_at;

  // {"key": ..., "provenance": "dynamic", "created_at": <unix ms>,
  //  "solution": {...}}
  json ToJson() const;
  // Throws std::invalid_argument or json::exception on malformed input.
  static CacheEntry FromJson(const json& j);
};

// Durable key -> entry storage behind the solution cache.
class SolutionStore {
 public:
  virtual ~SolutionStore() = default;

  // std::nullopt when the key was never stored.
  // Throws CacheIOError when an entry exists but cannot be read.
  virtual std::optional<CacheEntry> Load(const std::string& key) = 0;

  // Replaces any existing entry atomically.
  // Throws CacheIOError on write failures.
  virtual void Save(const CacheEntry& entry) = 0;

  virtual std::vector<std::string> ListKeys() = 0;
};

// One JSON file per key, <dir>/<key>.json. Writes go to a temporary file
// in the same directory that is then renamed over the target, so readers
// never see a partial entry.
class FileSolutionStore : public SolutionStore {
 public:
  // Creates the directory if needed. Throws CacheIOError if it cannot.
  explicit FileSolutionStore(std::filesystem::path directory);

  std::optional<CacheEntry> Load(const std::string& key) override;
  void Save(const CacheEntry& entry) override;
  std::vector<std::string> ListKeys() override;

  const std::filesystem::path& Directory() const { return directory_; }
  std::filesystem::path PathFor(const std::string& key) const;

 private:
  std::filesystem::path directory_;
};

} // namespace cache
} // namespace gto_broker

#endif // GTO_BROKER_CACHE_SOLUTION_STORE_H_
