#include "cache/SolutionStore.h"
#include "Errors.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

#include <unistd.h>

namespace fs = std::filesystem;

namespace gto_broker {
namespace cache {

namespace {

constexpr const char* kEntryExtension = ".json";

std::atomic<uint64_t> temp_counter{0};

void CheckKey(const std::string& key, const fs::path& directory) {
    if (key.empty() || key.find('/') != std::string::npos || key.find('\\') != std::string::npos ||
        key == "." || key == "..") {
        throw CacheIOError(directory.string(), "Invalid cache key '" + key + "'.");
    }
}

} // namespace

std::string ProvenanceToString(Provenance provenance) {
    switch (provenance) {
        case Provenance::kPrecomputed: return "precomputed";
        case Provenance::kDynamic:     return "dynamic";
    }
    return "unknown";
}

Provenance ProvenanceFromString(const std::string& text) {
    if (text == "precomputed") return Provenance::kPrecomputed;
    if (text == "dynamic") return Provenance::kDynamic;
    throw std::invalid_argument("Unknown provenance '" + text + "'");
}

// --- CacheEntry ---

json CacheEntry::ToJson() const {
    if (!solution) {
        throw std::invalid_argument("Cache entry '" + key + "' has no solution.");
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(created_at.time_since_epoch());
    json j;
    j["key"] = key;
    j["provenance"] = ProvenanceToString(provenance);
    j["created_at"] = millis.count();
    j["solution"] = solution->ToJson();
    return j;
}

CacheEntry CacheEntry::FromJson(const json& j) {
    CacheEntry entry;
    entry.key = j.at("key").get<std::string>();
    entry.provenance = ProvenanceFromString(j.at("provenance").get<std::string>());
    entry.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.at("created_at").get<long long>()));
    entry.solution = std::make_shared<const strategy::Solution>(
        strategy::Solution::FromJson(j.at("solution")));
    return entry;
}

// --- FileSolutionStore ---

FileSolutionStore::FileSolutionStore(fs::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec || !fs::is_directory(directory_)) {
        throw CacheIOError(directory_.string(),
                           "Cannot create cache directory " + directory_.string() + ": " + ec.message());
    }
}

fs::path FileSolutionStore::PathFor(const std::string& key) const {
    CheckKey(key, directory_);
    return directory_ / (key + kEntryExtension);
}

std::optional<CacheEntry> FileSolutionStore::Load(const std::string& key) {
    fs::path path = PathFor(key);
    std::ifstream in(path);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        throw CacheIOError(path.string(), "Cannot open cache entry " + path.string());
    }
    CacheEntry entry;
    try {
        json j;
        in >> j;
        entry = CacheEntry::FromJson(j);
    } catch (const json::exception& e) {
        throw CacheIOError(path.string(), "Corrupt cache entry " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw CacheIOError(path.string(), "Invalid cache entry " + path.string() + ": " + e.what());
    }
    if (entry.key != key) {
        throw CacheIOError(path.string(), "Cache entry " + path.string() + " holds key '" +
                                              entry.key + "', expected '" + key + "'.");
    }
    return entry;
}

void FileSolutionStore::Save(const CacheEntry& entry) {
    fs::path path = PathFor(entry.key);
    std::ostringstream temp_name;
    temp_name << "." << entry.key << ".tmp." << ::getpid() << "." << temp_counter.fetch_add(1);
    fs::path temp_path = directory_ / temp_name.str();

    std::string serialized;
    try {
        serialized = entry.ToJson().dump();
    } catch (const std::invalid_argument& e) {
        throw CacheIOError(path.string(), e.what());
    }

    std::ofstream out(temp_path, std::ios::trunc);
    out << serialized;
    out.close();
    std::error_code ec;
    if (!out) {
        fs::remove(temp_path, ec);
        throw CacheIOError(path.string(), "Failed to write cache entry " + temp_path.string());
    }
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw CacheIOError(path.string(),
                           "Failed to publish cache entry " + path.string() + ": " + ec.message());
    }
}

std::vector<std::string> FileSolutionStore::ListKeys() {
    std::vector<std::string> keys;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        std::string name = p.filename().string();
        if (p.extension() == kEntryExtension && !name.empty() && name[0] != '.') {
            keys.push_back(p.stem().string());
        }
    }
    if (ec) {
        throw CacheIOError(directory_.string(), "Cannot list cache directory: " + ec.message());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace cache
} // namespace gto_broker
