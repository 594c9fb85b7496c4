#ifndef HELIOSTRATEGY_ENVIRONMENT_LOADER_H
#define HELIOSTRATEGY_ENVIRONMENT_LOADER_H

#include "simulation/Route.h"
#include "simulation/Weather.h"

#include <optional>
#include <string>

namespace helio {
namespace sim {

/**
 * @brief Reads route and weather files produced by the GIS and forecast collaborators.
 *
 * Route files hold a "nodes" array of objects with latitude, longitude and
 * optionally distance_m, elevation_m, gradient, speed_limit_kmh,
 * time_zone_s and curvature. Missing distances are accumulated along the
 * great circle and missing gradients derived from elevations.
 *
 * Weather files hold a "records" array with timestamp and optionally
 * ghi_wm2, wind_speed_mps, wind_direction_deg, cloud_cover_percent and
 * temperature_c.
 */
class EnvironmentLoader {
public:
    explicit EnvironmentLoader(const std::string& environment_dir);

    /**
     * @return Route if successful, nullopt on failure (reason printed to stderr).
     */
    std::optional<Route> load_route(const std::string& filename, int tiling = 1) const;

    /**
     * @return WeatherSeries if successful, nullopt on failure (reason printed to stderr).
     */
    std::optional<WeatherSeries> load_weather(const std::string& filename) const;

    static std::optional<Route> route_from_json_string(const std::string& json_str, int tiling = 1);
    static std::optional<WeatherSeries> weather_from_json_string(const std::string& json_str);

private:
    std::string environment_dir_;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_ENVIRONMENT_LOADER_H
