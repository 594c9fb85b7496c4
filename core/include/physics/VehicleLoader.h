#ifndef HELIOSTRATEGY_VEHICLE_LOADER_H
#define HELIOSTRATEGY_VEHICLE_LOADER_H

#include "physics/Types.h"

#include <string>
#include <unordered_map>
#include <vector>
#include <optional>

namespace helio {
namespace physics {

/**
 * @brief Loads and manages car configurations from JSON preset files.
 *
 * Each preset holds one section per component ("vehicle", "array", "lvs",
 * "motor", "regen", "battery"). The "motor_type" and "battery_type" fields
 * select the model variant. Missing fields fall back to the defaults in
 * Types.h.
 */
class VehicleLoader {
public:
    /**
     * @brief Construct a VehicleLoader with the path to presets directory.
     * @param presets_dir Path to the vehicle_presets directory.
     */
    explicit VehicleLoader(const std::string& presets_dir);

    /**
     * @brief Load a specific car preset from a JSON file.
     * @param filename The JSON filename (e.g., "brightside.json").
     * @return CarConfig if successful, nullopt on failure.
     */
    std::optional<CarConfig> load_preset(const std::string& filename) const;

    /**
     * @brief Load all presets from the presets directory.
     * @return Map of car name -> CarConfig.
     */
    std::unordered_map<std::string, CarConfig> load_all_presets() const;

    /**
     * @brief Get list of available preset filenames.
     */
    std::vector<std::string> list_presets() const;

    /**
     * @brief Load a car configuration from a JSON string.
     * @return CarConfig if successful, nullopt on failure.
     */
    static std::optional<CarConfig> from_json_string(const std::string& json_str);

    /**
     * @brief Get a default car configuration (basic motor, datasheet battery).
     */
    static CarConfig get_default();

private:
    std::string presets_dir_;
};

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_VEHICLE_LOADER_H
