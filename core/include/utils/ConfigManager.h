#ifndef HELIOSTRATEGY_CONFIG_MANAGER_H
#define HELIOSTRATEGY_CONFIG_MANAGER_H

#include <optional>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace helio {

/**
 * @brief Charging and driving windows of a single race day.
 *
 * All values are seconds since local midnight; a window is [begin, end).
 */
struct DayWindows {
    int charging_begin = 0;
    int charging_end = 0;
    int driving_begin = 0;
    int driving_end = 0;
};

/**
 * @brief Race constants as read from races.json.
 */
struct RaceProps {
    std::string name;
    int start_year = 2024;
    int start_month = 1;
    int start_day = 1;
    int tiling = 1;                   ///< Number of times the route is repeated (laps)
    std::vector<DayWindows> days;     ///< One entry per race day, in order
};

/**
 * @brief Singleton configuration manager for HelioStrategy.
 *
 * Loads simulation parameters from YAML and race constants from JSON.
 * Thread-safe initialization with lazy loading support.
 */
class ConfigManager {
public:
    /**
     * @brief Get the singleton instance.
     * @return Reference to the ConfigManager instance.
     */
    static ConfigManager& instance();

    /**
     * @brief Initialize with a specific config directory path.
     * @param config_dir Path to the configuration directory.
     *
     * Expects simulation.yaml and races.json inside config_dir.
     * Calling it again reloads everything from the new directory.
     */
    void initialize(const std::string& config_dir);

    /**
     * @brief Check if the manager has been initialized.
     */
    bool is_initialized() const { return initialized_; }

    /**
     * @brief Directory the configuration was loaded from.
     */
    const std::string& config_dir() const;

    /**
     * @brief Look up race constants by race type name ("ASC", "FSGP").
     * @return RaceProps, or nullopt if the race is not configured.
     */
    std::optional<RaceProps> get_race(const std::string& race_name) const;

    /**
     * @brief Names of all configured races.
     */
    std::vector<std::string> list_races() const;

    /**
     * @brief Get a simulation parameter by key.
     * @tparam T The expected type (double, bool, int, std::string).
     * @param key The parameter name from simulation.yaml.
     * @return The parameter value.
     * @throws std::runtime_error if key not found or type mismatch.
     */
    template <typename T>
    T get_sim_param(const std::string& key) const;

    /**
     * @brief Get a simulation parameter with default value.
     * @tparam T The expected type.
     * @param key The parameter name.
     * @param default_value Value to return if key not found.
     * @return The parameter value or default.
     */
    template <typename T>
    T get_sim_param_or(const std::string& key, const T& default_value) const;

    /**
     * @brief Get a nested section of simulation.yaml (e.g. "optimization").
     * @throws std::runtime_error if the section is missing or not a map.
     */
    YAML::Node get_section(const std::string& key) const;

    // Delete copy/move operations for singleton
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

private:
    ConfigManager();
    ~ConfigManager() = default;

    void load_simulation_config(const std::string& path);
    void load_races(const std::string& path);
    void ensure_initialized() const;

    bool initialized_ = false;
    std::string config_dir_;

    YAML::Node sim_config_;
    std::unordered_map<std::string, RaceProps> races_;
};

// ============================================================================
// Template implementations
// ============================================================================

template <typename T>
T ConfigManager::get_sim_param(const std::string& key) const {
    ensure_initialized();

    if (!sim_config_[key]) {
        throw std::runtime_error("Simulation parameter not found: " + key);
    }

    try {
        return sim_config_[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Type mismatch for parameter '" + key + "': " + e.what());
    }
}

template <typename T>
T ConfigManager::get_sim_param_or(const std::string& key, const T& default_value) const {
    ensure_initialized();

    if (!sim_config_[key]) {
        return default_value;
    }

    try {
        return sim_config_[key].as<T>();
    } catch (const YAML::Exception&) {
        return default_value;
    }
}

} // namespace helio

#endif // HELIOSTRATEGY_CONFIG_MANAGER_H
