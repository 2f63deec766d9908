#include "cache/SolutionCache.h"
#include "cache/SolutionStore.h"
#include "canonical/Canonicalizer.h"
#include "solver/LiveSolverBridge.h"
#include "solver/PrecomputedSolver.h"
#include "tools/SolverConfig.h"
#include "Card.h"
#include "Errors.h"
#include "GameAction.h"
#include "Hand.h"
#include "Situation.h"

#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace gto_broker;

namespace {

const char* const kUsage =
    "Usage: gto_broker <command> [options]\n"
    "\n"
    "Commands:\n"
    "  key          Print the canonical key of a situation (and hand).\n"
    "  strategy     Print the strategy of --hand in a situation.\n"
    "  solve        Print the whole strategy table of a situation.\n"
    "  cache-stats  Print the entries of a cache directory.\n"
    "  seed         Copy precomputed entries from --from into --cache-dir.\n"
    "\n"
    "Situation options:\n"
    "  --street preflop|flop|turn|river   --board QsJh2h\n"
    "  --pot <bb>   --stack <bb>   --position <seat>   --opponents BTN,CO\n"
    "  --history \"flop:BB:check;flop:BTN:bet 2\"   --hand AcKd\n"
    "\n"
    "Other options:\n"
    "  --config <solver.json>   --cache-dir <dir>   --precomputed\n"
    "  --from <dir>   --force\n";

using Options = std::map<std::string, std::string>;

Options ParseOptions(int argc, char* argv[]) {
    Options options;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw ConfigurationError("arguments", "Unexpected argument '" + arg + "'");
        }
        std::string name = arg.substr(2);
        if (name == "force" || name == "precomputed") {
            options[name] = "1";
        } else if (i + 1 < argc) {
            options[name] = argv[++i];
        } else {
            throw ConfigurationError(name, "Option --" + name + " needs a value.");
        }
    }
    return options;
}

const std::string& Require(const Options& options, const std::string& name) {
    auto it = options.find(name);
    if (it == options.end()) {
        throw ConfigurationError(name, "Missing required option --" + name);
    }
    return it->second;
}

double RequireNumber(const Options& options, const std::string& name) {
    const std::string& text = Require(options, name);
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // Reported below.
    }
    throw ConfigurationError(name, "Option --" + name + " expects a number, got '" + text + "'");
}

std::vector<std::string> Split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, separator)) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

// "<street>:<seat>:<action>" entries separated by ';'.
std::vector<core::HistoryEntry> ParseHistory(const std::string& text) {
    std::vector<core::HistoryEntry> history;
    for (const std::string& item : Split(text, ';')) {
        std::vector<std::string> fields = Split(item, ':');
        if (fields.size() != 3) {
            throw ConfigurationError("history", "History entry '" + item + "' is not street:seat:action");
        }
        history.emplace_back(core::StreetFromString(fields[0]), core::PositionFromString(fields[1]),
                             core::GameAction::FromString(fields[2]));
    }
    return history;
}

core::Situation ReadSituation(const Options& options) {
    std::vector<core::Card> board;
    if (options.count("board")) {
        board = core::Card::ParseCards(options.at("board"));
    }
    std::vector<core::Position> opponents;
    if (options.count("opponents")) {
        for (const std::string& seat : Split(options.at("opponents"), ',')) {
            opponents.push_back(core::PositionFromString(seat));
        }
    }
    std::vector<core::HistoryEntry> history;
    if (options.count("history")) {
        history = ParseHistory(options.at("history"));
    }
    return core::Situation(core::StreetFromString(Require(options, "street")), std::move(board),
                           RequireNumber(options, "pot"), RequireNumber(options, "stack"),
                           core::PositionFromString(Require(options, "position")),
                           std::move(opponents), std::move(history));
}

std::optional<core::Hand> ReadHand(const Options& options) {
    if (!options.count("hand")) {
        return std::nullopt;
    }
    return core::Hand::FromString(options.at("hand"));
}

std::unique_ptr<solver::Solver> MakeSolver(const Options& options) {
    if (options.count("precomputed")) {
        config::BucketingPolicy policy;
        if (options.count("config")) {
            policy = config::SolverConfig::LoadFromFile(options.at("config")).bucketing;
        }
        auto store = std::make_shared<cache::FileSolutionStore>(Require(options, "cache-dir"));
        auto solution_cache = std::make_shared<cache::SolutionCache>(store);
        return std::make_unique<solver::PrecomputedSolver>(solution_cache, policy);
    }
    config::SolverConfig config = config::SolverConfig::LoadFromFile(Require(options, "config"));
    if (options.count("cache-dir")) {
        config.cache_dir = options.at("cache-dir");
    }
    return std::make_unique<solver::LiveSolverBridge>(std::move(config));
}

int RunKey(const Options& options) {
    config::BucketingPolicy policy;
    if (options.count("config")) {
        policy = config::SolverConfig::LoadFromFile(options.at("config")).bucketing;
    }
    canonical::Canonicalizer canonicalizer(policy);
    core::Situation situation = ReadSituation(options);
    std::optional<core::Hand> hand = ReadHand(options);
    canonical::CanonicalForm form = hand.has_value() ? canonicalizer.Canonicalize(situation, *hand)
                                                     : canonicalizer.Canonicalize(situation);
    std::cout << form.key.ToString() << std::endl;
    std::cout << "suits: " << form.mapping.ToString() << std::endl;
    return 0;
}

int RunStrategy(const Options& options) {
    core::Situation situation = ReadSituation(options);
    std::optional<core::Hand> hand = ReadHand(options);
    if (!hand.has_value()) {
        throw ConfigurationError("hand", "Missing required option --hand");
    }
    std::unique_ptr<solver::Solver> backend = MakeSolver(options);
    strategy::Strategy result = backend->GetStrategy(situation, *hand);
    std::cout << result.ToJson().dump(2) << std::endl;
    return 0;
}

int RunSolve(const Options& options) {
    core::Situation situation = ReadSituation(options);
    std::unique_ptr<solver::Solver> backend = MakeSolver(options);
    strategy::SolutionPtr solution = backend->Solve(situation);
    std::cout << solution->ToJson().dump(2) << std::endl;
    return 0;
}

int RunCacheStats(const Options& options) {
    cache::FileSolutionStore store(Require(options, "cache-dir"));
    std::vector<std::string> keys = store.ListKeys();
    json report;
    report["directory"] = store.Directory().string();
    report["entries"] = keys.size();
    json entries = json::array();
    for (const std::string& key : keys) {
        json item;
        item["key"] = key;
        try {
            std::optional<cache::CacheEntry> entry = store.Load(key);
            if (entry.has_value()) {
                item["provenance"] = cache::ProvenanceToString(entry->provenance);
                item["hands"] = entry->solution->Size();
                item["exploitability"] = entry->solution->GetExploitability();
            }
        } catch (const CacheIOError& e) {
            item["error"] = e.what();
        }
        entries.push_back(item);
    }
    report["keys"] = entries;
    std::cout << report.dump(2) << std::endl;
    return 0;
}

int RunSeed(const Options& options) {
    auto store = std::make_shared<cache::FileSolutionStore>(Require(options, "cache-dir"));
    cache::SolutionCache solution_cache(store);
    size_t added = solution_cache.SeedFromDirectory(Require(options, "from"), options.count("force") > 0);
    std::cout << added << " entries seeded." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        std::cout << kUsage;
        return 0;
    }

    return RunReportingErrors([&] {
        Options options = ParseOptions(argc, argv);
        if (command == "key") return RunKey(options);
        if (command == "strategy") return RunStrategy(options);
        if (command == "solve") return RunSolve(options);
        if (command == "cache-stats") return RunCacheStats(options);
        if (command == "seed") return RunSeed(options);
        std::cerr << "[ERROR] Unknown command '" << command << "'\n" << kUsage;
        return kExitUsage;
    }, std::cerr);
}
