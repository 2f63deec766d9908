#include "tools/GameTreeBuildingSettings.h"

#include <stdexcept>
#include <utility> // For std::move

namespace gto_broker {
namespace config {

GameTreeBuildingSettings::GameTreeBuildingSettings(
    StreetSetting flop_ip_setting,
    StreetSetting turn_ip_setting,
    StreetSetting river_ip_setting,
    StreetSetting flop_oop_setting,
    StreetSetting turn_oop_setting,
    StreetSetting river_oop_setting)
    : flop_ip_setting(std::move(flop_ip_setting)),
      turn_ip_setting(std::move(turn_ip_setting)),
      river_ip_setting(std::move(river_ip_setting)),
      flop_oop_setting(std::move(flop_oop_setting)),
      turn_oop_setting(std::move(turn_oop_setting)),
      river_oop_setting(std::move(river_oop_setting)) {}

GameTreeBuildingSettings GameTreeBuildingSettings::Defaults() {
    StreetSetting flop({33, 50, 75}, {33, 50, 75}, {}, true);
    StreetSetting later({50, 75, 100}, {50, 75, 100}, {}, true);
    return GameTreeBuildingSettings(flop, later, later, flop, later, later);
}

GameTreeBuildingSettings GameTreeBuildingSettings::FromJson(
        const json& j, const GameTreeBuildingSettings& fallback) {
    GameTreeBuildingSettings settings = fallback;
    auto read = [&j](const char* street, const char* position, StreetSetting& target) {
        if (j.contains(street) && j.at(street).contains(position)) {
            target = StreetSetting::FromJson(j.at(street).at(position), target);
        }
    };
    read("flop", "ip", settings.flop_ip_setting);
    read("turn", "ip", settings.turn_ip_setting);
    read("river", "ip", settings.river_ip_setting);
    read("flop", "oop", settings.flop_oop_setting);
    read("turn", "oop", settings.turn_oop_setting);
    read("river", "oop", settings.river_oop_setting);
    return settings;
}

const StreetSetting& GameTreeBuildingSettings::GetSetting(bool in_position,
                                                          core::Street street) const {
    switch (street) {
        case core::Street::kFlop:  return in_position ? flop_ip_setting : flop_oop_setting;
        case core::Street::kTurn:  return in_position ? turn_ip_setting : turn_oop_setting;
        case core::Street::kRiver: return in_position ? river_ip_setting : river_oop_setting;
        case core::Street::kPreflop:
            throw std::invalid_argument("GameTreeBuildingSettings are for postflop streets only.");
    }
    throw std::logic_error("Invalid street encountered in GetSetting.");
}

void GameTreeBuildingSettings::Validate() const {
    flop_ip_setting.Validate("bet_sizes.flop.ip");
    turn_ip_setting.Validate("bet_sizes.turn.ip");
    river_ip_setting.Validate("bet_sizes.river.ip");
    flop_oop_setting.Validate("bet_sizes.flop.oop");
    turn_oop_setting.Validate("bet_sizes.turn.oop");
    river_oop_setting.Validate("bet_sizes.river.oop");
}

} // namespace config
} // namespace gto_broker
