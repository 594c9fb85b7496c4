#include "simulation/EnvironmentLoader.h"
#include "physics/PhysicsMath.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace helio {
namespace sim {

namespace {

Route parse_route(const nlohmann::json& j, int tiling) {
    const auto& raw_nodes = j.at("nodes");
    std::vector<RouteNode> nodes;
    nodes.reserve(raw_nodes.size());

    bool has_distances = true;
    bool has_gradients = true;
    for (const auto& n : raw_nodes) {
        RouteNode node;
        node.latitude_deg = n.at("latitude").get<double>();
        node.longitude_deg = n.at("longitude").get<double>();
        node.distance_m = n.value("distance_m", 0.0);
        node.elevation_m = n.value("elevation_m", 0.0);
        node.gradient = n.value("gradient", 0.0);
        node.speed_limit_kmh = n.value("speed_limit_kmh", 100.0);
        node.time_zone_s = n.value("time_zone_s", 0.0);
        node.curvature = n.value("curvature", 0.0);
        has_distances = has_distances && n.contains("distance_m");
        has_gradients = has_gradients && n.contains("gradient");
        nodes.push_back(node);
    }

    if (!has_distances) {
        double cumulative = 0.0;
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (i > 0) {
                cumulative += physics::calc_haversine_distance(
                    nodes[i - 1].latitude_deg, nodes[i - 1].longitude_deg,
                    nodes[i].latitude_deg, nodes[i].longitude_deg);
            }
            nodes[i].distance_m = cumulative;
        }
    }

    if (!has_gradients) {
        for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
            double run = nodes[i + 1].distance_m - nodes[i].distance_m;
            nodes[i].gradient = (run > 0.0)
                ? (nodes[i + 1].elevation_m - nodes[i].elevation_m) / run
                : 0.0;
        }
        if (nodes.size() > 1) {
            nodes.back().gradient = nodes[nodes.size() - 2].gradient;
        }
    }

    return Route(std::move(nodes), tiling);
}

WeatherSeries parse_weather(const nlohmann::json& j) {
    std::vector<WeatherRecord> records;
    for (const auto& r : j.at("records")) {
        WeatherRecord record;
        record.timestamp = r.at("timestamp").get<std::int64_t>();
        if (r.contains("ghi_wm2") && !r.at("ghi_wm2").is_null()) {
            record.ghi_wm2 = r.at("ghi_wm2").get<double>();
        }
        record.wind_speed_mps = r.value("wind_speed_mps", 0.0);
        record.wind_direction_deg = r.value("wind_direction_deg", 0.0);
        record.cloud_cover_percent = r.value("cloud_cover_percent", 0.0);
        record.temperature_c = r.value("temperature_c", 20.0);
        records.push_back(record);
    }
    return WeatherSeries(std::move(records));
}

std::optional<nlohmann::json> read_json_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "EnvironmentLoader: Could not open " << filepath << std::endl;
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "EnvironmentLoader: JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // anonymous namespace

EnvironmentLoader::EnvironmentLoader(const std::string& environment_dir)
    : environment_dir_(environment_dir) {
}

std::optional<Route> EnvironmentLoader::load_route(const std::string& filename, int tiling) const {
    std::filesystem::path filepath = std::filesystem::path(environment_dir_) / filename;
    auto j = read_json_file(filepath);
    if (!j) {
        return std::nullopt;
    }

    try {
        return parse_route(*j, tiling);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "EnvironmentLoader: Malformed route in " << filepath << ": " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "EnvironmentLoader: Invalid route in " << filepath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<WeatherSeries> EnvironmentLoader::load_weather(const std::string& filename) const {
    std::filesystem::path filepath = std::filesystem::path(environment_dir_) / filename;
    auto j = read_json_file(filepath);
    if (!j) {
        return std::nullopt;
    }

    try {
        return parse_weather(*j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "EnvironmentLoader: Malformed weather in " << filepath << ": " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "EnvironmentLoader: Invalid weather in " << filepath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<Route> EnvironmentLoader::route_from_json_string(const std::string& json_str, int tiling) {
    try {
        return parse_route(nlohmann::json::parse(json_str), tiling);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<WeatherSeries> EnvironmentLoader::weather_from_json_string(const std::string& json_str) {
    try {
        return parse_weather(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace sim
} // namespace helio
