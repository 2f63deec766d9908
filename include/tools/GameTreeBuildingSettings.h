#ifndef GTO_BROKER_CONFIG_GAME_TREE_BUILDING_SETTINGS_H_
#define GTO_BROKER_CONFIG_GAME_TREE_BUILDING_SETTINGS_H_

#include "tools/StreetSetting.h"
#include "Situation.h" // For Street

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gto_broker {
namespace config {

// StreetSetting for every postflop street and both positions. This is the
// bet tree the external solver builds before solving.
struct GameTreeBuildingSettings {
  GameTreeBuildingSettings(
      StreetSetting flop_ip_setting,
      StreetSetting turn_ip_setting,
      StreetSetting river_ip_setting,
      StreetSetting flop_oop_setting,
      StreetSetting turn_oop_setting,
      StreetSetting river_oop_setting);

  GameTreeBuildingSettings() = default;

  // 33/50/75 flop, 50/75/100 turn and river, all-in everywhere.
  static GameTreeBuildingSettings Defaults();

  // Reads {"flop": {"ip": {...}, "oop": {...}}, "turn": ..., "river": ...};
  // anything missing keeps the value from `fallback`.
  static GameTreeBuildingSettings FromJson(const json& j,
                                           const GameTreeBuildingSettings& fallback);

  // Throws:
  //   std::invalid_argument if street is preflop (the tree is postflop only).
  const StreetSetting& GetSetting(bool in_position, core::Street street) const;

  void Validate() const;

  StreetSetting flop_ip_setting;
  StreetSetting turn_ip_setting;
  StreetSetting river_ip_setting;
  StreetSetting flop_oop_setting;
  StreetSetting turn_oop_setting;
  StreetSetting river_oop_setting;
};

} // namespace config
} // namespace gto_broker

#endif // GTO_BROKER_CONFIG_GAME_TREE_BUILDING_SETTINGS_H_
