#include "physics/VehicleLoader.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace helio {
namespace physics {

namespace {

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(key);
    return (it != j.end()) ? *it : empty;
}

void read_basic_motor(const nlohmann::json& m, BasicMotorParams& p) {
    p.road_friction = m.value("road_friction", p.road_friction);
    p.tire_radius_m = m.value("tire_radius_m", p.tire_radius_m);
    p.frontal_area_m2 = m.value("frontal_area_m2", p.frontal_area_m2);
    p.drag_coefficient = m.value("drag_coefficient", p.drag_coefficient);
}

MotorParams read_motor(const nlohmann::json& m) {
    std::string type = m.value("motor_type", std::string("basic"));
    if (type == "basic") {
        BasicMotorParams p;
        read_basic_motor(m, p);
        return p;
    }
    if (type == "advanced") {
        AdvancedMotorParams p;
        read_basic_motor(m, p);
        p.cornering_coefficient = m.value("cornering_coefficient", p.cornering_coefficient);
        return p;
    }
    throw std::invalid_argument("unknown motor_type '" + type + "'");
}

BatteryParams read_battery(const nlohmann::json& b) {
    std::string type = b.value("battery_type", std::string("basic"));
    if (type == "basic") {
        BasicBatteryParams p;
        p.max_voltage_v = b.value("max_voltage_v", p.max_voltage_v);
        p.min_voltage_v = b.value("min_voltage_v", p.min_voltage_v);
        p.max_current_capacity_ah = b.value("max_current_capacity_ah", p.max_current_capacity_ah);
        p.max_energy_capacity_wh = b.value("max_energy_capacity_wh", p.max_energy_capacity_wh);
        return p;
    }
    if (type == "thevenin") {
        TheveninBatteryParams p;
        p.soc_data = b.at("soc_data").get<std::vector<double>>();
        p.uoc_data = b.at("uoc_data").get<std::vector<double>>();
        p.r0_data = b.at("r0_data").get<std::vector<double>>();
        p.rp_data = b.at("rp_data").get<std::vector<double>>();
        p.cp_data = b.at("cp_data").get<std::vector<double>>();
        p.q_total_ah = b.value("q_total_ah", p.q_total_ah);
        return p;
    }
    throw std::invalid_argument("unknown battery_type '" + type + "'");
}

CarConfig parse_car_config(const nlohmann::json& j, const std::string& default_name) {
    CarConfig car;
    car.name = j.value("name", default_name);

    const auto& v = section(j, "vehicle");
    car.vehicle.mass_kg = v.value("mass_kg", car.vehicle.mass_kg);
    car.vehicle.max_acceleration_mps2 = v.value("max_acceleration_mps2", car.vehicle.max_acceleration_mps2);
    car.vehicle.max_deceleration_mps2 = v.value("max_deceleration_mps2", car.vehicle.max_deceleration_mps2);

    const auto& a = section(j, "array");
    car.array.panel_efficiency = a.value("panel_efficiency", car.array.panel_efficiency);
    car.array.panel_size_m2 = a.value("panel_size_m2", car.array.panel_size_m2);

    const auto& l = section(j, "lvs");
    car.lvs.voltage_v = l.value("voltage_v", car.lvs.voltage_v);
    car.lvs.current_a = l.value("current_a", car.lvs.current_a);

    const auto& r = section(j, "regen");
    car.regen.efficiency = r.value("efficiency", car.regen.efficiency);
    car.regen.min_speed_mps = r.value("min_speed_mps", car.regen.min_speed_mps);
    car.regen.max_energy_per_tick_j = r.value("max_energy_per_tick_j", car.regen.max_energy_per_tick_j);

    car.motor = read_motor(section(j, "motor"));
    car.battery = read_battery(section(j, "battery"));
    return car;
}

} // anonymous namespace

VehicleLoader::VehicleLoader(const std::string& presets_dir)
    : presets_dir_(presets_dir) {
}

std::optional<CarConfig> VehicleLoader::load_preset(const std::string& filename) const {
    std::filesystem::path filepath = std::filesystem::path(presets_dir_) / filename;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "VehicleLoader: Could not open " << filepath << std::endl;
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;

        CarConfig car = parse_car_config(j, filepath.stem().string());
        if (!car.is_valid()) {
            std::cerr << "VehicleLoader: Invalid parameters in " << filepath << std::endl;
            return std::nullopt;
        }
        return car;

    } catch (const nlohmann::json::exception& e) {
        std::cerr << "VehicleLoader: JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        std::cerr << "VehicleLoader: " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::unordered_map<std::string, CarConfig> VehicleLoader::load_all_presets() const {
    std::unordered_map<std::string, CarConfig> presets;

    for (const auto& filename : list_presets()) {
        auto car = load_preset(filename);
        if (car) {
            presets[car->name] = *car;
        }
    }

    return presets;
}

std::vector<std::string> VehicleLoader::list_presets() const {
    std::vector<std::string> presets;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(presets_dir_)) {
            if (entry.path().extension() == ".json") {
                presets.push_back(entry.path().filename().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "VehicleLoader: Could not list presets directory: " << e.what() << std::endl;
    }

    return presets;
}

std::optional<CarConfig> VehicleLoader::from_json_string(const std::string& json_str) {
    try {
        CarConfig car = parse_car_config(nlohmann::json::parse(json_str), "custom");
        if (!car.is_valid()) {
            return std::nullopt;
        }
        return car;

    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

CarConfig VehicleLoader::get_default() {
    CarConfig car;
    car.name = "default_solar_car";
    return car;
}

} // namespace physics
} // namespace helio
