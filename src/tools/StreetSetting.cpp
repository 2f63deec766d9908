#include "tools/StreetSetting.h"
#include "Errors.h"

#include <cmath>
#include <sstream>
#include <utility> // For std::move

namespace gto_broker {
namespace config {

StreetSetting::StreetSetting(std::vector<double> bet_sizes_percent,
                             std::vector<double> raise_sizes_percent,
                             std::vector<double> donk_sizes_percent,
                             bool allow_all_in)
    : bet_sizes_percent(std::move(bet_sizes_percent)),
      raise_sizes_percent(std::move(raise_sizes_percent)),
      donk_sizes_percent(std::move(donk_sizes_percent)),
      allow_all_in(allow_all_in) {}

StreetSetting StreetSetting::FromJson(const json& j, const StreetSetting& fallback) {
    StreetSetting setting = fallback;
    if (j.contains("bet")) setting.bet_sizes_percent = j.at("bet").get<std::vector<double>>();
    if (j.contains("raise")) setting.raise_sizes_percent = j.at("raise").get<std::vector<double>>();
    if (j.contains("donk")) setting.donk_sizes_percent = j.at("donk").get<std::vector<double>>();
    if (j.contains("allin")) setting.allow_all_in = j.at("allin").get<bool>();
    return setting;
}

void StreetSetting::Validate(const char* field) const {
    for (const auto* sizes : {&bet_sizes_percent, &raise_sizes_percent, &donk_sizes_percent}) {
        for (double size : *sizes) {
            if (!std::isfinite(size) || size <= 0.0) {
                std::ostringstream oss;
                oss << "Bet size " << size << "% in " << field << " must be positive.";
                throw ConfigurationError(field, oss.str());
            }
        }
    }
}

} // namespace config
} // namespace gto_broker
