#include "solver/CommandBuilder.h"
#include "Errors.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace solver {

namespace {

const char* StreetName(core::Street street) {
    switch (street) {
        case core::Street::kFlop:  return "flop";
        case core::Street::kTurn:  return "turn";
        case core::Street::kRiver: return "river";
        case core::Street::kPreflop: break;
    }
    throw std::logic_error("Preflop has no bet size settings.");
}

void AppendSizes(std::ostringstream& out, const char* position, core::Street street,
                 const char* kind, const std::vector<double>& sizes) {
    for (double size : sizes) {
        out << "set_bet_sizes " << position << "," << StreetName(street) << ","
            << kind << "," << size << "\n";
    }
}

} // namespace

CommandBuilder::CommandBuilder(config::SolverConfig config) : config_(std::move(config)) {
    config_.Validate();
}

void CommandBuilder::ValidateSituation(const canonical::CanonicalSituation& situation) const {
    if (situation.street == core::Street::kPreflop) {
        throw ConfigurationError("street",
                                 "Preflop spots are served from precomputed solutions only.");
    }
    if (situation.position_label != "IP" && situation.position_label != "OOP") {
        throw ConfigurationError("opponents",
                                 "The solver handles heads-up spots only, got position '" +
                                 situation.position_label + "'.");
    }
    if (!std::isfinite(situation.effective_stack_bb) || situation.effective_stack_bb <= 0.0) {
        throw ConfigurationError("effective_stack", "Cannot solve a situation without chips behind.");
    }
    if (!std::isfinite(situation.pot_bb) || situation.pot_bb <= 0.0) {
        throw ConfigurationError("pot", "Cannot solve a situation with an empty pot.");
    }
    if (situation.board.size() != core::ExpectedBoardSize(situation.street)) {
        std::ostringstream oss;
        oss << core::StreetToString(situation.street) << " needs "
            << core::ExpectedBoardSize(situation.street) << " board cards, got "
            << situation.board.size();
        throw ConfigurationError("board", oss.str());
    }
}

std::string CommandBuilder::BuildInputScript(const canonical::CanonicalSituation& situation) const {
    ValidateSituation(situation);
    std::ostringstream out;
    out << "set_pot " << situation.pot_bb << "\n";
    out << "set_effective_stack " << situation.effective_stack_bb << "\n";
    out << "set_board " << core::Card::JoinCards(situation.board, ",") << "\n";
    out << "set_range_ip " << config_.ip_range << "\n";
    out << "set_range_oop " << config_.oop_range << "\n";

    // The solved tree starts at the current street.
    for (int s = static_cast<int>(situation.street); s <= static_cast<int>(core::Street::kRiver); ++s) {
        core::Street street = static_cast<core::Street>(s);
        for (bool in_position : {false, true}) {
            const char* position = in_position ? "ip" : "oop";
            const config::StreetSetting& setting = config_.bet_sizes.GetSetting(in_position, street);
            AppendSizes(out, position, street, "bet", setting.bet_sizes_percent);
            AppendSizes(out, position, street, "raise", setting.raise_sizes_percent);
            if (!in_position) {
                AppendSizes(out, position, street, "donk", setting.donk_sizes_percent);
            }
            if (setting.allow_all_in) {
                out << "set_bet_sizes " << position << "," << StreetName(street) << ",allin\n";
            }
        }
    }

    out << "set_allin_threshold " << config_.allin_threshold << "\n";
    out << "build_tree\n";
    out << "set_thread_num " << config_.threads << "\n";
    out << "set_accuracy " << config_.accuracy << "\n";
    out << "set_max_iteration " << config_.max_iterations << "\n";
    out << "set_print_interval " << config_.print_interval << "\n";
    out << "set_use_isomorphism " << (config_.use_isomorphism ? 1 : 0) << "\n";
    out << "start_solve\n";
    out << "set_dump_rounds " << config_.dump_rounds << "\n";
    if (config_.output_schema.source == config::OutputSchema::Source::kResultFile) {
        out << "dump_result " << config_.command_schema.result_file_name << "\n";
    }
    return out.str();
}

ProcessInvocation CommandBuilder::Build(const canonical::CanonicalSituation& situation) const {
    const config::CommandSchema& schema = config_.command_schema;
    ProcessInvocation invocation;
    invocation.executable = config_.binary_path;
    invocation.input_file_name = schema.input_file_name;
    invocation.input_file_contents = BuildInputScript(situation);
    if (config_.output_schema.source == config::OutputSchema::Source::kResultFile) {
        invocation.result_file_name = schema.result_file_name;
    }

    invocation.arguments.push_back(schema.input_file_flag);
    invocation.arguments.push_back(schema.input_file_name);
    auto resources = config_.ResolveResourceDir();
    if (resources.has_value() && !schema.resource_dir_flag.empty()) {
        invocation.arguments.push_back(schema.resource_dir_flag);
        invocation.arguments.push_back(resources->string());
    }
    if (!schema.mode_flag.empty()) {
        invocation.arguments.push_back(schema.mode_flag);
        invocation.arguments.push_back(schema.mode_value);
    }
    invocation.arguments.insert(invocation.arguments.end(), schema.extra_arguments.begin(),
                                schema.extra_arguments.end());
    return invocation;
}

} // namespace solver
} // namespace gto_broker
