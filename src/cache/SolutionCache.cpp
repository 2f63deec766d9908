#include "cache/SolutionCache.h"
#include "Errors.h"

#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility> // For std::move

namespace fs = std::filesystem;

namespace gto_broker {
namespace cache {

SolutionCache::SolutionCache(std::shared_ptr<SolutionStore> store) : store_(std::move(store)) {}

SolutionCache::~SolutionCache() {
    std::unique_lock<std::mutex> lock(active_mutex_);
    active_cv_.wait(lock, [this] { return active_computations_ == 0; });
}

strategy::SolutionPtr SolutionCache::FindInMemory(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.solution;
}

void SolutionCache::Publish(CacheEntry entry) {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    std::string key = entry.key;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

strategy::SolutionPtr SolutionCache::Get(const std::string& key) {
    if (strategy::SolutionPtr found = FindInMemory(key)) {
        ++hits_;
        return found;
    }
    if (store_) {
        try {
            std::optional<CacheEntry> entry = store_->Load(key);
            if (entry.has_value() && entry->solution) {
                strategy::SolutionPtr solution = entry->solution;
                {
                    // Keep an entry another thread published meanwhile.
                    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
                    auto inserted = entries_.emplace(key, std::move(*entry));
                    solution = inserted.first->second.solution;
                }
                ++hits_;
                return solution;
            }
        } catch (const CacheIOError& e) {
            std::cerr << "[WARNING] Cache read failed for " << e.Path() << ": " << e.what()
                      << ". Treating as a miss." << std::endl;
        }
    }
    ++misses_;
    return nullptr;
}

bool SolutionCache::Put(const std::string& key, strategy::SolutionPtr solution,
                        Provenance provenance, bool force) {
    if (!solution) {
        throw std::invalid_argument("Cannot cache a null solution for key " + key);
    }
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    if (!force) {
        if (FindInMemory(key)) {
            return false;
        }
        if (store_) {
            try {
                if (store_->Load(key).has_value()) {
                    return false;
                }
            } catch (const CacheIOError&) {
                // Unreadable entries get replaced.
            }
        }
    }

    CacheEntry entry;
    entry.key = key;
    entry.solution = std::move(solution);
    entry.provenance = provenance;
    entry.created_at = std::chrono::system_clock::now();
    if (store_) {
        store_->Save(entry);
    }
    Publish(std::move(entry));
    return true;
}

void SolutionCache::FinishFlight(const std::string& key) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(key);
}

strategy::SolutionPtr SolutionCache::GetOrCompute(
        const std::string& key, ComputeFn compute,
        std::optional<std::chrono::milliseconds> wait_timeout) {
    if (strategy::SolutionPtr hit = Get(key)) {
        std::cout << "[INFO] Cache hit for " << key << std::endl;
        return hit;
    }

    std::shared_future<strategy::SolutionPtr> future;
    std::shared_ptr<std::promise<strategy::SolutionPtr>> promise;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            std::cout << "[INFO] Joining in-flight solve for " << key << std::endl;
            future = it->second;
        } else {
            // A flight may have landed between Get and here.
            if (strategy::SolutionPtr landed = FindInMemory(key)) {
                return landed;
            }
            std::cout << "[INFO] Cache miss for " << key << std::endl;
            promise = std::make_shared<std::promise<strategy::SolutionPtr>>();
            future = promise->get_future().share();
            inflight_.emplace(key, future);
        }
    }

    if (promise) {
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            ++active_computations_;
        }
        // The computation runs on its own thread so that no caller's wait
        // timeout can cut it short.
        auto task = [this, key, compute = std::move(compute), promise]() {
            try {
                strategy::SolutionPtr result = compute();
                if (!result) {
                    throw std::logic_error("Computation for " + key + " produced no solution.");
                }
                try {
                    Put(key, result, Provenance::kDynamic);
                } catch (const CacheIOError& e) {
                    std::cerr << "[WARNING] Could not cache solution for " << key << " ("
                              << e.Path() << "): " << e.what() << std::endl;
                }
                FinishFlight(key);
                promise->set_value(std::move(result));
            } catch (...) {
                FinishFlight(key);
                promise->set_exception(std::current_exception());
            }
            std::lock_guard<std::mutex> lock(active_mutex_);
            --active_computations_;
            active_cv_.notify_all();
        };
        try {
            std::thread(std::move(task)).detach();
        } catch (const std::system_error&) {
            FinishFlight(key);
            {
                std::lock_guard<std::mutex> lock(active_mutex_);
                --active_computations_;
            }
            promise->set_exception(std::current_exception());
            throw;
        }
    }

    if (wait_timeout.has_value() &&
        future.wait_for(*wait_timeout) == std::future_status::timeout) {
        throw ProcessExecutionError(ProcessExecutionError::Kind::kWaitTimeout,
                                    "Gave up waiting " + std::to_string(wait_timeout->count()) +
                                        " ms for the solve of " + key);
    }
    return future.get();
}

size_t SolutionCache::SeedFromDirectory(const fs::path& directory, bool force) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw CacheIOError(directory.string(), "Seed directory " + directory.string() + " does not exist.");
    }
    FileSolutionStore source(directory);
    size_t added = 0;
    for (const std::string& key : source.ListKeys()) {
        try {
            std::optional<CacheEntry> entry = source.Load(key);
            if (entry.has_value() && Put(key, entry->solution, Provenance::kPrecomputed, force)) {
                ++added;
            }
        } catch (const CacheIOError& e) {
            std::cerr << "[WARNING] Skipping seed entry " << e.Path() << ": " << e.what() << std::endl;
        }
    }
    std::cout << "[INFO] Seeded " << added << " precomputed solutions from "
              << directory.string() << std::endl;
    return added;
}

std::optional<Provenance> SolutionCache::ProvenanceOf(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.provenance;
}

SolutionCache::Stats SolutionCache::GetStats() const {
    Stats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    stats.size = entries_.size();
    return stats;
}

size_t SolutionCache::InFlightCount() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_.size();
}

} // namespace cache
} // namespace gto_broker
