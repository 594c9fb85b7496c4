#ifndef HELIOSTRATEGY_RACE_H
#define HELIOSTRATEGY_RACE_H

#include "utils/ConfigManager.h"

#include <cstdint>
#include <string>
#include <vector>

namespace helio {
namespace sim {

enum class RaceType {
    ASC,    ///< American Solar Challenge (road race)
    FSGP    ///< Formula Sun Grand Prix (track race)
};

/**
 * @brief Parse "ASC" / "FSGP".
 * @throws PreconditionError for any other race type.
 */
RaceType parse_race_type(const std::string& name);

std::string to_string(RaceType type);

/**
 * @brief Race calendar: start date and the per-second driving and charging masks.
 *
 * Mask index s is the number of seconds since local midnight of the first
 * race day; a second is permitted when begin <= time_of_day < end for that
 * day's window.
 */
class RaceConfig {
public:
    /**
     * @throws PreconditionError if there are no days or a window is outside a day.
     */
    RaceConfig(RaceType type, const RaceProps& props);

    /**
     * @brief Build from the races configured in races.json.
     * @throws PreconditionError if the race type is unsupported or not configured.
     */
    static RaceConfig from_config(const std::string& race_name,
                                  const ConfigManager& config = ConfigManager::instance());

    RaceType type() const { return type_; }
    int tiling() const { return props_.tiling; }
    int start_year() const { return props_.start_year; }
    int start_month() const { return props_.start_month; }
    int start_day() const { return props_.start_day; }
    std::size_t num_days() const { return props_.days.size(); }

    /**
     * @brief Race duration in seconds (whole days).
     */
    std::int64_t duration_s() const { return static_cast<std::int64_t>(driving_.size()); }

    const std::vector<bool>& driving_mask() const { return driving_; }
    const std::vector<bool>& charging_mask() const { return charging_; }

private:
    enum class WindowKind { Driving, Charging };

    std::vector<bool> make_time_mask(WindowKind kind) const;

    RaceType type_;
    RaceProps props_;
    std::vector<bool> driving_;
    std::vector<bool> charging_;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_RACE_H
