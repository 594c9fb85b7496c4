#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "optimization/FitnessAdapter.h"
#include "optimization/GeneticOptimizer.h"
#include "optimization/InputBounds.h"
#include "physics/PhysicsMath.h"
#include "physics/SolarGeometry.h"
#include "physics/VehicleLoader.h"
#include "simulation/Race.h"
#include "simulation/Route.h"
#include "simulation/SimulationModel.h"
#include "simulation/Weather.h"
#include "utils/ConfigManager.h"
#include "utils/ThreadPool.h"

using helio::ConfigManager;
using helio::ThreadPool;
using helio::optimization::FitnessAdapter;
using helio::optimization::GeneticOptimizer;
using helio::optimization::GeneticSettings;
using helio::optimization::InputBounds;
using helio::sim::RaceConfig;
using helio::sim::Route;
using helio::sim::RouteNode;
using helio::sim::SimulationModel;
using helio::sim::SimulationSettings;
using helio::sim::WeatherRecord;
using helio::sim::WeatherSeries;

namespace {

constexpr double TIME_ZONE_S = -5.0 * 3600.0;

// Circular track; the closing segment back to node 0 completes each lap
std::shared_ptr<const Route> create_loop_route(double lap_m, int num_nodes, int laps) {
    const double radius_m = lap_m / (2.0 * helio::physics::PhysicsConstants::PI);
    std::vector<RouteNode> nodes;
    for (int i = 0; i < num_nodes; ++i) {
        const double angle = 2.0 * helio::physics::PhysicsConstants::PI * i / num_nodes;
        RouteNode node;
        node.latitude_deg = 40.0 + radius_m * std::sin(angle) / 111000.0;
        node.longitude_deg = -95.0 + radius_m * (1.0 - std::cos(angle)) / 85000.0;  // ~85 km per degree here
        node.distance_m = lap_m * i / num_nodes;
        node.elevation_m = 300.0;
        node.speed_limit_kmh = 80.0;
        node.time_zone_s = TIME_ZONE_S;
        node.curvature = 1.0 / radius_m;
        nodes.push_back(node);
    }
    return std::make_shared<const Route>(std::move(nodes), laps);
}

std::shared_ptr<const WeatherSeries> create_hourly_weather(const RaceConfig& race) {
    const std::int64_t start = helio::physics::days_from_civil(
        race.start_year(), race.start_month(), race.start_day()) * 86400 -
        static_cast<std::int64_t>(TIME_ZONE_S);

    std::vector<WeatherRecord> records;
    for (std::int64_t t = start - 3600; t <= start + race.duration_s() + 3600; t += 3600) {
        WeatherRecord record;
        record.timestamp = t;
        record.wind_speed_mps = 3.0;
        record.wind_direction_deg = 270.0;
        record.cloud_cover_percent = 20.0;
        records.push_back(record);
    }
    return std::make_shared<const WeatherSeries>(std::move(records));
}

}  // namespace

int main(int argc, char** argv) {
    std::size_t population_size = 32;
    std::size_t num_threads = std::thread::hardware_concurrency();
    std::size_t generations = 5;

    if (argc > 1) {
        population_size = static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10));
    }
    if (argc > 2) {
        num_threads = static_cast<std::size_t>(std::strtoul(argv[2], nullptr, 10));
    }
    if (argc > 3) {
        generations = static_cast<std::size_t>(std::strtoul(argv[3], nullptr, 10));
    }

    auto& cfg = ConfigManager::instance();
    if (!cfg.is_initialized()) {
        cfg.initialize(HELIOSTRATEGY_DEFAULT_CONFIG_DIR);
    }

    RaceConfig race = RaceConfig::from_config("FSGP", cfg);
    auto route = create_loop_route(5000.0, 50, race.tiling());
    auto weather = create_hourly_weather(race);

    auto model = std::make_shared<const SimulationModel>(
        helio::physics::VehicleLoader::get_default(), route, weather, race,
        SimulationSettings::from_config(cfg));

    std::cout << "HelioStrategy optimizer benchmark\n";
    std::cout << "  race        : " << helio::sim::to_string(race.type()) << "\n";
    std::cout << "  genes       : " << model->driving_time_divisions() << "\n";
    std::cout << "  ticks       : " << model->tick_count() << "\n";
    std::cout << "  population  : " << population_size << "\n";
    std::cout << "  generations : " << generations << "\n";
    std::cout << "  threads     : " << num_threads << "\n";

    FitnessAdapter fitness(model);
    InputBounds bounds(model->driving_time_divisions(), 20.0, 60.0);

    // Raw population throughput, one simulation per task
    std::vector<std::vector<double>> speeds(population_size,
                                            std::vector<double>(bounds.size(), 40.0));
    ThreadPool pool(num_threads);

    auto t_start = std::chrono::steady_clock::now();

    std::vector<double> scores(speeds.size(), 0.0);
    const auto errors = pool.parallel_for(speeds.size(), [&](std::size_t i) { scores[i] = fitness(speeds[i]); });
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    auto t_eval = std::chrono::steady_clock::now();

    // Full optimizer run
    GeneticSettings settings;
    settings.population_size = population_size;
    settings.num_parents = std::max<std::size_t>(2, population_size / 2);
    settings.generation_limit = generations;
    settings.num_threads = num_threads;
    GeneticOptimizer optimizer(fitness, bounds, settings);
    auto best = optimizer.run();

    auto t_end = std::chrono::steady_clock::now();

    std::chrono::duration<double> eval_elapsed = t_eval - t_start;
    std::chrono::duration<double> opt_elapsed = t_end - t_eval;
    double eval_s = eval_elapsed.count();
    double sims_per_second = (eval_s > 0.0)
                                 ? static_cast<double>(speeds.size()) / eval_s
                                 : 0.0;

    std::cout << "Benchmark results:\n";
    std::cout << "  evaluation elapsed : " << eval_s << " s\n";
    std::cout << "  simulations/second : " << sims_per_second << "\n";
    std::cout << "  optimizer elapsed  : " << opt_elapsed.count() << " s\n";
    std::cout << "  generations run    : " << optimizer.generations_completed() << "\n";
    std::cout << "  best fitness       : " << best.fitness << "\n";

    return 0;
}
