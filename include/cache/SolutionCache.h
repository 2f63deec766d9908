#ifndef GTO_BROKER_CACHE_SOLUTION_CACHE_H_
#define GTO_BROKER_CACHE_SOLUTION_CACHE_H_

#include "cache/SolutionStore.h"
#include "strategy/Solution.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace gto_broker {
namespace cache {

// In-memory solution cache in front of an optional durable store, with
// single-flight coalescing of computations per key.
//
// Thread-safe. Reads run concurrently; writes are serialized. A storage
// failure never fails a request: the entry simply stays uncached.
class SolutionCache {
 public:
  struct Stats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t size = 0;
  };

  using ComputeFn = std::function<strategy::SolutionPtr()>;

  // store may be null for a memory-only cache.
  explicit SolutionCache(std::shared_ptr<SolutionStore> store = nullptr);
  // Blocks until computations started by GetOrCompute have finished.
  ~SolutionCache();

  SolutionCache(const SolutionCache&) = delete;
  SolutionCache& operator=(const SolutionCache&) = delete;

  // nullptr on a miss. Loads through from the store.
  strategy::SolutionPtr Get(const std::string& key);

  // Stores and publishes an entry. Without force an existing entry is kept
  // and false is returned.
  // Throws CacheIOError if the store rejects the write; the entry is then
  // not published either.
  bool Put(const std::string& key, strategy::SolutionPtr solution, Provenance provenance,
           bool force = false);

  // Returns the cached solution, or runs compute exactly once per key no
  // matter how many callers ask concurrently. Every caller waiting on the
  // same run gets the same instance, or the same exception.
  //
  // wait_timeout bounds only this caller's wait; the shared computation
  // keeps running and is cached for later callers.
  // Throws ProcessExecutionError (kWaitTimeout) when the wait times out,
  // or whatever compute threw.
  strategy::SolutionPtr GetOrCompute(
      const std::string& key, ComputeFn compute,
      std::optional<std::chrono::milliseconds> wait_timeout = std::nullopt);

  // Loads every entry persisted in directory and publishes it as
  // precomputed. Existing entries are kept unless force is set.
  // Returns the number of entries added. Unreadable entries are logged
  // and skipped.
  // Throws CacheIOError if the directory does not exist.
  size_t SeedFromDirectory(const std::filesystem::path& directory, bool force = false);

  std::optional<Provenance> ProvenanceOf(const std::string& key) const;
  Stats GetStats() const;
  size_t InFlightCount() const;

  SolutionStore* GetStore() const { return store_.get(); }

 private:
  strategy::SolutionPtr FindInMemory(const std::string& key) const;
  void Publish(CacheEntry entry);
  void FinishFlight(const std::string& key);

  std::shared_ptr<SolutionStore> store_;

  mutable std::shared_mutex entries_mutex_;
  std::map<std::string, CacheEntry> entries_;
  std::mutex write_mutex_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};

  mutable std::mutex inflight_mutex_;
  std::map<std::string, std::shared_future<strategy::SolutionPtr>> inflight_;

  std::mutex active_mutex_;
  std::condition_variable active_cv_;
  int active_computations_ = 0;
};

} // namespace cache
} // namespace gto_broker

#endif // GTO_BROKER_CACHE_SOLUTION_CACHE_H_
