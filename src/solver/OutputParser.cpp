#include "solver/OutputParser.h"
#include "Errors.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace solver {

namespace {

double ReadNumberOrNan(const json& value) {
    if (value.is_null()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value.get<double>();
}

std::vector<double> ReadNumbers(const json& array) {
    std::vector<double> numbers;
    numbers.reserve(array.size());
    for (const auto& value : array) {
        numbers.push_back(ReadNumberOrNan(value));
    }
    return numbers;
}

} // namespace

OutputParser::OutputParser(config::OutputSchema schema) : schema_(std::move(schema)) {}

std::string OutputParser::SelectPayload(const RawOutput& raw) const {
    if (schema_.source == config::OutputSchema::Source::kResultFile) {
        if (!raw.result_file_contents.has_value()) {
            throw ParseError("Solver finished without writing its result file.", raw.stdout_text);
        }
        return *raw.result_file_contents;
    }
    size_t begin = raw.stdout_text.find('{');
    size_t end = raw.stdout_text.rfind('}');
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        throw ParseError("No JSON object found on solver stdout.", raw.stdout_text);
    }
    return raw.stdout_text.substr(begin, end - begin + 1);
}

const json& OutputParser::FindNode(const json& root, const std::vector<core::GameAction>& line,
                                   const std::string& payload) const {
    const json* node = &root;
    for (const auto& action : line) {
        if (!node->is_object() || !node->contains(schema_.children_key) ||
            !node->at(schema_.children_key).is_object()) {
            throw NotFoundError("Solver tree has no node after " + action.ToString() +
                                ": the line leaves the solved tree.");
        }
        const json* best = nullptr;
        double best_distance = std::numeric_limits<double>::infinity();
        for (const auto& [label, child] : node->at(schema_.children_key).items()) {
            std::optional<core::GameAction> candidate;
            try {
                candidate = core::GameAction::FromString(label);
            } catch (const std::invalid_argument& e) {
                throw ParseError("Unknown action label '" + label + "' in solver tree: " + e.what(), payload);
            }
            if (candidate->GetAction() != action.GetAction()) {
                continue;
            }
            double distance = 0.0;
            if (action.HasAmount() && candidate->HasAmount()) {
                distance = std::fabs(candidate->GetAmount() - action.GetAmount());
            }
            if (distance < best_distance) {
                best_distance = distance;
                best = &child;
            }
        }
        if (best == nullptr) {
            throw NotFoundError("Action " + action.ToString() + " is not in the solved bet tree.");
        }
        node = best;
    }
    return *node;
}

void OutputParser::CheckPlayer(const json& node, int acting_player, const std::string& payload) const {
    if (schema_.player_key.empty() || !node.is_object() || !node.contains(schema_.player_key)) {
        return;
    }
    int player = node.at(schema_.player_key).get<int>();
    if (player != acting_player) {
        std::ostringstream oss;
        oss << "Decision node belongs to player " << player << ", expected player " << acting_player << ".";
        throw ParseError(oss.str(), payload);
    }
}

strategy::Solution::Table OutputParser::ReadTable(const json& node,
                                                  const canonical::SuitMapping& mapping,
                                                  const std::string& payload) const {
    if (!node.is_object() || !node.contains(schema_.strategy_key)) {
        throw ParseError("Decision node has no '" + schema_.strategy_key + "' field.", payload);
    }
    const json& strategy_node = node.at(schema_.strategy_key);
    std::vector<core::GameAction> actions;
    for (const auto& label : strategy_node.at(schema_.actions_key)) {
        actions.push_back(core::GameAction::FromString(label.get<std::string>()));
    }
    const json& frequencies = strategy_node.at(schema_.strategy_table_key);
    if (!node.contains(schema_.evs_key)) {
        throw ParseError("Decision node has no '" + schema_.evs_key + "' field.", payload);
    }
    const json& evs = node.at(schema_.evs_key).at(schema_.evs_table_key);

    strategy::Solution::Table table;
    for (const auto& [label, values] : frequencies.items()) {
        core::Hand hand = mapping.ToReal(core::Hand::FromString(label));
        std::vector<double> freqs = ReadNumbers(values);
        if (!evs.contains(label)) {
            throw ParseError("Hand " + label + " has frequencies but no EVs.", payload);
        }
        std::vector<double> hand_evs = ReadNumbers(evs.at(label));
        if (freqs.size() != actions.size() || hand_evs.size() != actions.size()) {
            std::ostringstream oss;
            oss << "Hand " << label << " has " << freqs.size() << " frequencies and "
                << hand_evs.size() << " EVs for " << actions.size() << " actions.";
            throw ParseError(oss.str(), payload);
        }
        double sum = 0.0;
        for (double f : freqs) sum += f;
        if (!std::isfinite(sum) || std::fabs(sum - 1.0) > schema_.normalize_tolerance) {
            std::ostringstream oss;
            oss << "Frequencies of " << label << " sum to " << sum << ".";
            throw ParseError(oss.str(), payload);
        }
        for (double& f : freqs) f /= sum;

        std::string key = hand.ToString();
        table.emplace(key, strategy::Strategy(hand, actions, std::move(freqs), std::move(hand_evs)));
    }
    return table;
}

std::optional<double> OutputParser::ReadMetric(const std::string& stdout_text,
                                               const std::string& marker) const {
    size_t pos = stdout_text.rfind(marker);
    if (marker.empty() || pos == std::string::npos) {
        return std::nullopt;
    }
    size_t line_end = stdout_text.find('\n', pos);
    std::string rest = stdout_text.substr(pos + marker.size(),
                                          line_end == std::string::npos ? std::string::npos
                                                                        : line_end - pos - marker.size());
    for (size_t i = 0; i < rest.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(rest[i])) ||
            ((rest[i] == '-' || rest[i] == '.') && i + 1 < rest.size() &&
             std::isdigit(static_cast<unsigned char>(rest[i + 1])))) {
            return std::strtod(rest.c_str() + i, nullptr);
        }
    }
    return std::nullopt;
}

strategy::Solution OutputParser::Parse(const RawOutput& raw,
                                       const canonical::SuitMapping& mapping,
                                       const std::vector<core::GameAction>& line,
                                       std::optional<int> acting_player) const {
    std::string payload = SelectPayload(raw);
    json root;
    try {
        root = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("Solver output is not valid JSON: ") + e.what(), payload);
    }

    strategy::Solution::Table table;
    try {
        const json& node = FindNode(root, line, payload);
        if (acting_player.has_value()) {
            CheckPlayer(node, *acting_player, payload);
        }
        table = ReadTable(node, mapping, payload);
    } catch (const json::exception& e) {
        throw ParseError(std::string("Solver output does not match the schema: ") + e.what(), payload);
    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("Invalid strategy in solver output: ") + e.what(), payload);
    }

    std::optional<double> iterations = ReadMetric(raw.stdout_text, schema_.iteration_marker);
    std::optional<double> exploitability = ReadMetric(raw.stdout_text, schema_.exploitability_marker);
    if (!iterations.has_value()) {
        throw ParseError("No '" + schema_.iteration_marker + "' line on solver stdout.", raw.stdout_text);
    }
    if (!exploitability.has_value()) {
        throw ParseError("No '" + schema_.exploitability_marker + "' line on solver stdout.",
                         raw.stdout_text);
    }
    try {
        return strategy::Solution(std::move(table), *exploitability,
                                  static_cast<int>(std::llround(*iterations)));
    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("Invalid solution: ") + e.what(), payload);
    }
}

const strategy::Strategy& OutputParser::ExtractStrategy(const strategy::Solution& solution,
                                                        const core::Hand& hand) {
    return solution.GetStrategy(hand);
}

} // namespace solver
} // namespace gto_broker
