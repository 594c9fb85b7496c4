#include "utils/ConfigManager.h"

#include <algorithm>
#include <fstream>
#include <filesystem>

namespace helio {

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager()
    : initialized_(false) {
}

void ConfigManager::initialize(const std::string& config_dir) {
    if (initialized_) {
        // Allow re-initialization for testing purposes
        races_.clear();
    }

    config_dir_ = config_dir;

    std::filesystem::path base_path(config_dir_);
    std::string sim_path = (base_path / "simulation.yaml").string();
    std::string races_path = (base_path / "races.json").string();

    load_simulation_config(sim_path);
    load_races(races_path);

    initialized_ = true;
}

void ConfigManager::ensure_initialized() const {
    if (!initialized_) {
        // Auto-initialize with default config directory
        const_cast<ConfigManager*>(this)->initialize(HELIOSTRATEGY_DEFAULT_CONFIG_DIR);
    }
}

const std::string& ConfigManager::config_dir() const {
    ensure_initialized();
    return config_dir_;
}

void ConfigManager::load_simulation_config(const std::string& path) {
    try {
        sim_config_ = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load simulation config from '" + path + "': " + e.what());
    }
}

void ConfigManager::load_races(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open races file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;

        for (auto& [name, race] : j.items()) {
            RaceProps props;
            props.name = name;
            props.start_year = race.value("start_year", 2024);
            props.start_month = race.value("start_month", 1);
            props.start_day = race.value("start_day", 1);
            props.tiling = race.value("tiling", 1);

            // Days are keyed "0", "1", ... so order them numerically
            const auto& days = race.at("days");
            props.days.resize(days.size());
            for (auto& [day_key, windows] : days.items()) {
                std::size_t day = static_cast<std::size_t>(std::stoul(day_key));
                if (day >= props.days.size()) {
                    throw std::runtime_error("Race '" + name + "' has a gap before day " + day_key);
                }
                DayWindows& w = props.days[day];
                w.charging_begin = windows.at("charging").at(0).get<int>();
                w.charging_end = windows.at("charging").at(1).get<int>();
                w.driving_begin = windows.at("driving").at(0).get<int>();
                w.driving_end = windows.at("driving").at(1).get<int>();
            }
            races_[name] = props;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse races JSON from '" + path + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid day key in races JSON '" + path + "': " + e.what());
    }
}

std::optional<RaceProps> ConfigManager::get_race(const std::string& race_name) const {
    ensure_initialized();

    auto it = races_.find(race_name);
    if (it != races_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> ConfigManager::list_races() const {
    ensure_initialized();

    std::vector<std::string> names;
    names.reserve(races_.size());
    for (const auto& entry : races_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

YAML::Node ConfigManager::get_section(const std::string& key) const {
    ensure_initialized();

    YAML::Node section = sim_config_[key];
    if (!section || !section.IsMap()) {
        throw std::runtime_error("Configuration section not found: " + key);
    }
    return section;
}

} // namespace helio
