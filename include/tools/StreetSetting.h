#ifndef GTO_BROKER_CONFIG_STREET_SETTING_H_
#define GTO_BROKER_CONFIG_STREET_SETTING_H_

#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace gto_broker {
namespace config {

// The bet-size abstraction handed to the external solver for one street and
// one position (IP or OOP). Sizes are percentages of the pot.
struct StreetSetting {
  StreetSetting(std::vector<double> bet_sizes_percent,
                std::vector<double> raise_sizes_percent,
                std::vector<double> donk_sizes_percent,
                bool allow_all_in);

  StreetSetting() = default;

  // Reads {"bet": [...], "raise": [...], "donk": [...], "allin": bool}.
  // Missing keys keep the values already in `fallback`.
  static StreetSetting FromJson(const json& j, const StreetSetting& fallback);

  // Throws ConfigurationError if any size is not a positive finite number.
  void Validate(const char* field) const;

  std::vector<double> bet_sizes_percent;
  std::vector<double> raise_sizes_percent;

  // Leading out into the previous street's aggressor. OOP only.
  std::vector<double> donk_sizes_percent;

  // Adds an explicit all-in action to every betting decision.
  bool allow_all_in = false;
};

} // namespace config
} // namespace gto_broker

#endif // GTO_BROKER_CONFIG_STREET_SETTING_H_
