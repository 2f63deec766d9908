#include "tools/SolverConfig.h"
#include "Errors.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace gto_broker {
namespace config {

const char* const kDefaultIpRange =
    "AA,KK,QQ,JJ,TT,99:0.75,88:0.75,77:0.5,66:0.5,55:0.5,44:0.5,33:0.5,22:0.5,"
    "AK,AQ,AJs,ATs,A9s:0.75,A8s:0.75,A7s:0.75,A6s:0.75,A5s,A4s,A3s:0.75,A2s:0.75,"
    "AJo:0.75,ATo:0.5,KQ,KJs,KTs,K9s:0.75,KJo:0.5,QJs,QTs,Q9s:0.5,JTs,J9s:0.5,"
    "T9s,T8s:0.5,98s,87s,76s,65s:0.75,54s:0.5";
const char* const kDefaultOopRange =
    "QQ:0.5,JJ:0.75,TT,99,88,77,66,55,44,33,22,AQs:0.5,AJs,ATs,A9s,A8s,A7s,A6s,"
    "A5s,A4s,A3s,A2s,AQo:0.75,AJo,ATo,A9o:0.5,KQs:0.75,KJs,KTs,K9s,K8s,K7s:0.5,"
    "KQo,KJo,KTo:0.5,QJs,QTs,Q9s,Q8s:0.5,QJo,QTo:0.5,JTs,J9s,J8s:0.5,JTo,T9s,T8s,"
    "T7s:0.5,98s,97s,87s,86s,76s,75s:0.5,65s,64s:0.5,54s,43s:0.5";

namespace {

// Reads key into target when present; wraps nlohmann's type errors.
template <typename T>
void ReadIfPresent(const json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        std::ostringstream oss;
        oss << "Config key '" << key << "' has the wrong type ("
            << j.at(key).type_name() << "): " << e.what();
        throw ConfigurationError(key, oss.str());
    }
}

void ReadPath(const json& j, const char* key, fs::path& target) {
    std::string value;
    if (j.contains(key)) {
        ReadIfPresent(j, key, value);
        target = value;
    }
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& target) {
    long long value = target.count();
    ReadIfPresent(j, key, value);
    target = std::chrono::milliseconds(value);
}

CommandSchema ReadCommandSchema(const json& j) {
    CommandSchema schema;
    ReadIfPresent(j, "input_file_flag", schema.input_file_flag);
    ReadIfPresent(j, "resource_dir_flag", schema.resource_dir_flag);
    ReadIfPresent(j, "mode_flag", schema.mode_flag);
    ReadIfPresent(j, "mode_value", schema.mode_value);
    ReadIfPresent(j, "input_file_name", schema.input_file_name);
    ReadIfPresent(j, "result_file_name", schema.result_file_name);
    ReadIfPresent(j, "extra_arguments", schema.extra_arguments);
    return schema;
}

OutputSchema ReadOutputSchema(const json& j) {
    OutputSchema schema;
    std::string source = "file";
    ReadIfPresent(j, "source", source);
    if (source == "file") {
        schema.source = OutputSchema::Source::kResultFile;
    } else if (source == "stdout") {
        schema.source = OutputSchema::Source::kStdout;
    } else {
        throw ConfigurationError("output_schema.source",
                                 "output_schema.source must be 'file' or 'stdout', got '" + source + "'");
    }
    ReadIfPresent(j, "children_key", schema.children_key);
    ReadIfPresent(j, "strategy_key", schema.strategy_key);
    ReadIfPresent(j, "strategy_table_key", schema.strategy_table_key);
    ReadIfPresent(j, "actions_key", schema.actions_key);
    ReadIfPresent(j, "evs_key", schema.evs_key);
    ReadIfPresent(j, "evs_table_key", schema.evs_table_key);
    ReadIfPresent(j, "player_key", schema.player_key);
    ReadIfPresent(j, "ip_player", schema.ip_player);
    ReadIfPresent(j, "oop_player", schema.oop_player);
    ReadIfPresent(j, "iteration_marker", schema.iteration_marker);
    ReadIfPresent(j, "exploitability_marker", schema.exploitability_marker);
    ReadIfPresent(j, "normalize_tolerance", schema.normalize_tolerance);
    return schema;
}

void RequirePositive(double value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << field << " must be positive, got " << value;
        throw ConfigurationError(field, oss.str());
    }
}

void RequireNonEmpty(const std::string& value, const char* field) {
    if (value.empty()) {
        throw ConfigurationError(field, std::string(field) + " must not be empty.");
    }
}

} // namespace

void SolverConfig::Validate() const {
    if (binary_path.empty()) {
        throw ConfigurationError("binary_path", "binary_path is required.");
    }
    if (threads < 1) {
        throw ConfigurationError("threads", "threads must be at least 1, got " + std::to_string(threads));
    }
    RequirePositive(accuracy, "accuracy");
    if (max_iterations < 1) {
        throw ConfigurationError("max_iterations",
                                 "max_iterations must be at least 1, got " + std::to_string(max_iterations));
    }
    if (!std::isfinite(allin_threshold) || allin_threshold <= 0.0 || allin_threshold > 1.0) {
        std::ostringstream oss;
        oss << "allin_threshold must be in (0, 1], got " << allin_threshold;
        throw ConfigurationError("allin_threshold", oss.str());
    }
    if (dump_rounds < 1) {
        throw ConfigurationError("dump_rounds", "dump_rounds must be at least 1.");
    }
    if (print_interval < 1) {
        throw ConfigurationError("print_interval", "print_interval must be at least 1.");
    }
    if (timeout.count() <= 0) {
        throw ConfigurationError("timeout_ms", "timeout_ms must be positive.");
    }
    if (wait_timeout.count() < 0) {
        throw ConfigurationError("wait_timeout_ms", "wait_timeout_ms cannot be negative.");
    }
    if (worker_pool_size < 1) {
        throw ConfigurationError("worker_pool_size", "worker_pool_size must be at least 1.");
    }
    if (retry_backoff.count() < 0) {
        throw ConfigurationError("retry_backoff_ms", "retry_backoff_ms cannot be negative.");
    }
    RequireNonEmpty(ip_range, "ip_range");
    RequireNonEmpty(oop_range, "oop_range");
    RequirePositive(bucketing.stack_bucket_bb, "bucketing.stack_bucket_bb");
    RequirePositive(bucketing.pot_ratio_step, "bucketing.pot_ratio_step");
    RequireNonEmpty(command_schema.input_file_flag, "command_schema.input_file_flag");
    RequireNonEmpty(command_schema.input_file_name, "command_schema.input_file_name");
    if (output_schema.source == OutputSchema::Source::kResultFile) {
        RequireNonEmpty(command_schema.result_file_name, "command_schema.result_file_name");
    }
    RequirePositive(output_schema.normalize_tolerance, "output_schema.normalize_tolerance");
    if (output_schema.ip_player == output_schema.oop_player) {
        throw ConfigurationError("output_schema.ip_player",
                                 "output_schema.ip_player and oop_player must differ.");
    }
    bet_sizes.Validate();
}

std::optional<fs::path> SolverConfig::ResolveResourceDir() const {
    if (!resource_dir.empty()) {
        return resource_dir;
    }
    std::error_code ec;
    fs::path candidate = binary_path.parent_path() / "resources";
    if (!binary_path.empty() && fs::is_directory(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

SolverConfig SolverConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("config", "Solver configuration must be a JSON object.");
    }
    SolverConfig config;
    ReadPath(j, "binary_path", config.binary_path);
    ReadPath(j, "resource_dir", config.resource_dir);
    ReadPath(j, "work_root", config.work_root);
    ReadPath(j, "cache_dir", config.cache_dir);
    ReadIfPresent(j, "threads", config.threads);
    ReadIfPresent(j, "accuracy", config.accuracy);
    ReadIfPresent(j, "max_iterations", config.max_iterations);
    ReadIfPresent(j, "use_isomorphism", config.use_isomorphism);
    ReadIfPresent(j, "allin_threshold", config.allin_threshold);
    ReadIfPresent(j, "dump_rounds", config.dump_rounds);
    ReadIfPresent(j, "print_interval", config.print_interval);
    ReadMillis(j, "timeout_ms", config.timeout);
    ReadMillis(j, "wait_timeout_ms", config.wait_timeout);
    ReadIfPresent(j, "worker_pool_size", config.worker_pool_size);
    ReadIfPresent(j, "retry_on_timeout", config.retry_on_timeout);
    ReadMillis(j, "retry_backoff_ms", config.retry_backoff);
    ReadIfPresent(j, "transient_exit_codes", config.transient_exit_codes);
    ReadIfPresent(j, "ip_range", config.ip_range);
    ReadIfPresent(j, "oop_range", config.oop_range);

    try {
        if (j.contains("bet_sizes")) {
            config.bet_sizes = GameTreeBuildingSettings::FromJson(j.at("bet_sizes"), config.bet_sizes);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("bet_sizes", std::string("Invalid bet_sizes: ") + e.what());
    }
    if (j.contains("bucketing")) {
        const json& b = j.at("bucketing");
        ReadIfPresent(b, "stack_bucket_bb", config.bucketing.stack_bucket_bb);
        ReadIfPresent(b, "pot_ratio_step", config.bucketing.pot_ratio_step);
    }
    if (j.contains("command_schema")) {
        config.command_schema = ReadCommandSchema(j.at("command_schema"));
    }
    if (j.contains("output_schema")) {
        config.output_schema = ReadOutputSchema(j.at("output_schema"));
    }

    config.Validate();
    return config;
}

SolverConfig SolverConfig::LoadFromFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("config", "Cannot open solver config file: " + path.string());
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("config",
                                 "Solver config " + path.string() + " is not valid JSON: " + e.what());
    }
    std::cout << "[INFO] Loaded solver config from " << path.string() << std::endl;
    return FromJson(j);
}

} // namespace config
} // namespace gto_broker
