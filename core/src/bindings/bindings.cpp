/**
 * @file bindings.cpp
 * @brief Pybind11 bindings for the HelioStrategy core library.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "utils/ConfigManager.h"
#include "utils/Errors.h"
#include "physics/PhysicsMath.h"
#include "physics/Types.h"
#include "physics/VehicleLoader.h"
#include "simulation/EnvironmentLoader.h"
#include "simulation/Race.h"
#include "simulation/Route.h"
#include "simulation/SimulationModel.h"
#include "simulation/Weather.h"
#include "optimization/FitnessAdapter.h"
#include "optimization/GeneticOptimizer.h"
#include "optimization/InitialPopulation.h"
#include "optimization/InputBounds.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

using helio::sim::SimulationModel;

std::shared_ptr<SimulationModel> make_model(const helio::physics::CarConfig& car,
                                            const helio::sim::Route& route,
                                            const helio::sim::WeatherSeries& weather,
                                            const std::string& race_name,
                                            const helio::sim::SimulationSettings& settings) {
    return std::make_shared<SimulationModel>(
        car,
        std::make_shared<const helio::sim::Route>(route),
        std::make_shared<const helio::sim::WeatherSeries>(weather),
        helio::sim::RaceConfig::from_config(race_name),
        settings);
}

py::dict summary_to_dict(const helio::sim::SimulationSummary& s) {
    py::dict output;
    output["time_taken"] = s.time_taken_s;
    output["distance_travelled"] = s.distance_travelled_m;
    output["final_soc"] = s.final_soc;
    output["route_length"] = s.route_length_m;
    output["min_raw_soc"] = s.min_raw_soc;
    output["was_successful"] = s.was_successful;
    output["distance_before_exhaustion"] = s.distance_before_exhaustion_m;
    output["tick_count"] = s.tick_count;
    return output;
}

/**
 * @brief Optimizer bound to one model, reachable from Python while it runs.
 *
 * run() releases the GIL, so another Python thread can call request_stop();
 * the optimizer then finishes the current generation and returns the best
 * solution found so far.
 */
class SpeedOptimizer {
public:
    SpeedOptimizer(std::shared_ptr<SimulationModel> model,
                   const helio::optimization::GeneticSettings& settings,
                   const helio::optimization::FitnessSettings& fitness_settings,
                   double min_speed_kmh,
                   double max_speed_kmh,
                   bool smoothed_initial_population)
        : model_(std::move(model))
        , optimizer_(helio::optimization::FitnessAdapter(model_, fitness_settings),
                     helio::optimization::InputBounds(model_->driving_time_divisions(), min_speed_kmh, max_speed_kmh),
                     settings)
        , smoothed_initial_population_(smoothed_initial_population) {}

    py::dict run() {
        helio::optimization::BestSolution best;
        {
            py::gil_scoped_release release;
            if (smoothed_initial_population_) {
                const auto& settings = optimizer_.settings();
                helio::optimization::SmoothedPopulationSettings smoothing;
                smoothing.seed = settings.seed;
                optimizer_.set_initial_population(helio::optimization::generate_smoothed_population(
                    settings.population_size, optimizer_.bounds().size(), smoothing,
                    helio::optimization::completes_without_exhaustion(*model_)));
            }
            best = optimizer_.run();
        }

        py::dict output;
        output["solution"] = best.genes;
        output["fitness"] = best.fitness;
        output["index"] = best.index;
        output["generations_completed"] = optimizer_.generations_completed();
        output["stopped_by_request"] = optimizer_.stopped_by_request();
        output["diversity"] = optimizer_.diversity();
        return output;
    }

    void request_stop() { optimizer_.request_stop(); }
    bool stop_requested() const { return optimizer_.stop_requested(); }
    std::size_t generations_completed() const { return optimizer_.generations_completed(); }

    py::tuple best_solution() const {
        const helio::optimization::BestSolution best = optimizer_.best_solution();
        return py::make_tuple(best.genes, best.fitness, best.index);
    }

private:
    std::shared_ptr<SimulationModel> model_;
    helio::optimization::GeneticOptimizer optimizer_;
    bool smoothed_initial_population_;
};

} // anonymous namespace

PYBIND11_MODULE(_heliostrategy_core, m) {
    m.doc() = "HelioStrategy Core - Solar Car Race Simulation and Speed Optimization";

    // ========================================================================
    // Exceptions
    // ========================================================================
    py::register_exception<helio::PreconditionError>(m, "PreconditionError", PyExc_ValueError);
    py::register_exception<helio::DataCoverageError>(m, "DataCoverageError", PyExc_IndexError);
    py::register_exception<helio::PrematureDataRecoveryError>(m, "PrematureDataRecoveryError", PyExc_RuntimeError);
    py::register_exception<helio::EvaluationError>(m, "EvaluationError", PyExc_RuntimeError);

    // ========================================================================
    // Physics Constants
    // ========================================================================
    py::class_<helio::physics::PhysicsConstants>(m, "PhysicsConstants")
        .def_readonly_static("EARTH_GRAVITY", &helio::physics::PhysicsConstants::EARTH_GRAVITY)
        .def_readonly_static("AIR_DENSITY_SEA_LEVEL", &helio::physics::PhysicsConstants::AIR_DENSITY_SEA_LEVEL)
        .def_readonly_static("EARTH_RADIUS_M", &helio::physics::PhysicsConstants::EARTH_RADIUS_M);

    // ========================================================================
    // Vehicle parameters
    // ========================================================================
    py::class_<helio::physics::VehicleParams>(m, "VehicleParams")
        .def(py::init<>())
        .def_readwrite("mass_kg", &helio::physics::VehicleParams::mass_kg)
        .def_readwrite("max_acceleration_mps2", &helio::physics::VehicleParams::max_acceleration_mps2)
        .def_readwrite("max_deceleration_mps2", &helio::physics::VehicleParams::max_deceleration_mps2)
        .def("is_valid", &helio::physics::VehicleParams::is_valid);

    py::class_<helio::physics::ArrayParams>(m, "ArrayParams")
        .def(py::init<>())
        .def_readwrite("panel_efficiency", &helio::physics::ArrayParams::panel_efficiency)
        .def_readwrite("panel_size_m2", &helio::physics::ArrayParams::panel_size_m2);

    py::class_<helio::physics::LVSParams>(m, "LVSParams")
        .def(py::init<>())
        .def_readwrite("voltage_v", &helio::physics::LVSParams::voltage_v)
        .def_readwrite("current_a", &helio::physics::LVSParams::current_a);

    py::class_<helio::physics::RegenParams>(m, "RegenParams")
        .def(py::init<>())
        .def_readwrite("efficiency", &helio::physics::RegenParams::efficiency)
        .def_readwrite("min_speed_mps", &helio::physics::RegenParams::min_speed_mps)
        .def_readwrite("max_energy_per_tick_j", &helio::physics::RegenParams::max_energy_per_tick_j);

    py::class_<helio::physics::CarConfig>(m, "CarConfig")
        .def(py::init<>())
        .def_readwrite("name", &helio::physics::CarConfig::name)
        .def_readwrite("vehicle", &helio::physics::CarConfig::vehicle)
        .def_readwrite("array", &helio::physics::CarConfig::array)
        .def_readwrite("lvs", &helio::physics::CarConfig::lvs)
        .def_readwrite("regen", &helio::physics::CarConfig::regen)
        .def("is_valid", &helio::physics::CarConfig::is_valid);

    // ========================================================================
    // Loaders
    // ========================================================================
    py::class_<helio::physics::VehicleLoader>(m, "VehicleLoader")
        .def(py::init<const std::string&>())
        .def("load_preset", &helio::physics::VehicleLoader::load_preset)
        .def("load_all_presets", &helio::physics::VehicleLoader::load_all_presets)
        .def("list_presets", &helio::physics::VehicleLoader::list_presets)
        .def_static("from_json_string", &helio::physics::VehicleLoader::from_json_string)
        .def_static("get_default", &helio::physics::VehicleLoader::get_default);

    py::class_<helio::sim::Route>(m, "Route")
        .def("size", &helio::sim::Route::size)
        .def("tiling", &helio::sim::Route::tiling)
        .def("length_m", &helio::sim::Route::length_m)
        .def("speed_limit_table", &helio::sim::Route::speed_limit_table);

    py::class_<helio::sim::WeatherSeries>(m, "WeatherSeries")
        .def("size", &helio::sim::WeatherSeries::size)
        .def("first_timestamp", &helio::sim::WeatherSeries::first_timestamp)
        .def("last_timestamp", &helio::sim::WeatherSeries::last_timestamp);

    py::class_<helio::sim::EnvironmentLoader>(m, "EnvironmentLoader")
        .def(py::init<const std::string&>())
        .def("load_route", &helio::sim::EnvironmentLoader::load_route,
             py::arg("filename"), py::arg("tiling") = 1)
        .def("load_weather", &helio::sim::EnvironmentLoader::load_weather, py::arg("filename"));

    // ========================================================================
    // Simulation
    // ========================================================================
    py::enum_<helio::sim::ExhaustionPolicy>(m, "ExhaustionPolicy")
        .value("CONTINUE", helio::sim::ExhaustionPolicy::Continue)
        .value("STOP", helio::sim::ExhaustionPolicy::Stop)
        .export_values();

    py::class_<helio::sim::SimulationSettings>(m, "SimulationSettings")
        .def(py::init<>())
        .def_readwrite("tick_s", &helio::sim::SimulationSettings::tick_s)
        .def_readwrite("granularity", &helio::sim::SimulationSettings::granularity)
        .def_readwrite("start_offset_s", &helio::sim::SimulationSettings::start_offset_s)
        .def_readwrite("initial_soc", &helio::sim::SimulationSettings::initial_soc)
        .def_readwrite("acceleration_cap_enabled", &helio::sim::SimulationSettings::acceleration_cap_enabled)
        .def_readwrite("exhaustion_policy", &helio::sim::SimulationSettings::exhaustion_policy)
        .def_readwrite("gravity", &helio::sim::SimulationSettings::gravity)
        .def_readwrite("air_density", &helio::sim::SimulationSettings::air_density)
        .def_static("from_config", []() { return helio::sim::SimulationSettings::from_config(); });

    py::class_<SimulationModel, std::shared_ptr<SimulationModel>>(m, "SimulationModel")
        .def(py::init(&make_model),
             py::arg("car"), py::arg("route"), py::arg("weather"),
             py::arg("race"), py::arg("settings") = helio::sim::SimulationSettings())
        .def("driving_time_divisions", &SimulationModel::driving_time_divisions)
        .def("tick_count", &SimulationModel::tick_count)
        .def("simulation_duration_s", &SimulationModel::simulation_duration_s)
        .def("run_model", &SimulationModel::run_model, py::arg("speed"))
        .def("has_results", &SimulationModel::has_results)
        .def("get_results", &SimulationModel::get_results, py::arg("keys"))
        .def("summary", [](const SimulationModel& model) {
            return summary_to_dict(model.last_simulation().summary());
        })
        .def("was_successful", [](const SimulationModel& model) {
            return model.last_simulation().summary().was_successful;
        })
        .def_static("result_keys", &helio::sim::Simulation::result_keys);

    // ========================================================================
    // Optimization
    // ========================================================================
    py::class_<helio::optimization::InputBounds>(m, "InputBounds")
        .def(py::init<>())
        .def(py::init<std::size_t, double, double>())
        .def("add_bounds", &helio::optimization::InputBounds::add_bounds)
        .def("add_bound", &helio::optimization::InputBounds::add_bound)
        .def("remove_bound", &helio::optimization::InputBounds::remove_bound)
        .def("__len__", &helio::optimization::InputBounds::size)
        .def("get_bounds", [](const helio::optimization::InputBounds& b) {
            std::vector<std::pair<double, double>> out;
            for (const auto& bound : b.get_bounds()) out.emplace_back(bound.low, bound.high);
            return out;
        })
        .def("get_bound_dict", [](const helio::optimization::InputBounds& b) {
            py::dict out;
            for (const auto& entry : b.get_bound_dict()) {
                out[py::str(entry.first)] = py::make_tuple(entry.second.low, entry.second.high);
            }
            return out;
        });

    py::class_<helio::optimization::FitnessSettings>(m, "FitnessSettings")
        .def(py::init<>())
        .def_property("objective",
            [](const helio::optimization::FitnessSettings& s) { return helio::optimization::to_string(s.objective); },
            [](helio::optimization::FitnessSettings& s, const std::string& name) {
                s.objective = helio::optimization::parse_objective(name);
            })
        .def_readwrite("reference_time_s", &helio::optimization::FitnessSettings::reference_time_s)
        .def_readwrite("reference_distance_m", &helio::optimization::FitnessSettings::reference_distance_m)
        .def_readwrite("exhaustion_penalty", &helio::optimization::FitnessSettings::exhaustion_penalty);

    py::class_<helio::optimization::GeneticSettings>(m, "GeneticSettings")
        .def(py::init<>())
        .def_readwrite("population_size", &helio::optimization::GeneticSettings::population_size)
        .def_readwrite("generation_limit", &helio::optimization::GeneticSettings::generation_limit)
        .def_readwrite("num_parents", &helio::optimization::GeneticSettings::num_parents)
        .def_readwrite("k_tournament", &helio::optimization::GeneticSettings::k_tournament)
        .def_readwrite("elitism", &helio::optimization::GeneticSettings::elitism)
        .def_readwrite("mutation_percent", &helio::optimization::GeneticSettings::mutation_percent)
        .def_readwrite("max_mutation", &helio::optimization::GeneticSettings::max_mutation)
        .def_readwrite("seed", &helio::optimization::GeneticSettings::seed)
        .def_readwrite("num_threads", &helio::optimization::GeneticSettings::num_threads)
        .def("set_stopping_criteria", [](helio::optimization::GeneticSettings& s, const std::string& text) {
            s.stopping_criteria = helio::optimization::parse_stopping_criteria(text);
        })
        .def_static("from_config", []() { return helio::optimization::GeneticSettings::from_config(); });

    py::class_<SpeedOptimizer>(m, "SpeedOptimizer")
        .def(py::init<std::shared_ptr<SimulationModel>,
                      const helio::optimization::GeneticSettings&,
                      const helio::optimization::FitnessSettings&,
                      double, double, bool>(),
             py::arg("model"),
             py::arg("settings") = helio::optimization::GeneticSettings(),
             py::arg("fitness") = helio::optimization::FitnessSettings(),
             py::arg("min_speed_kmh") = 20.0,
             py::arg("max_speed_kmh") = 60.0,
             py::arg("smoothed_initial_population") = false)
        .def("run", &SpeedOptimizer::run,
             "Evolve speed vectors. Returns a dict with solution, fitness, index,\n"
             "generations_completed, stopped_by_request and diversity.")
        .def("request_stop", &SpeedOptimizer::request_stop,
             "Stop after the current generation; safe to call while run() is active")
        .def("stop_requested", &SpeedOptimizer::stop_requested)
        .def("generations_completed", &SpeedOptimizer::generations_completed)
        .def("best_solution", &SpeedOptimizer::best_solution);

    m.def("optimize",
        [](std::shared_ptr<SimulationModel> model,
           const helio::optimization::GeneticSettings& settings,
           const helio::optimization::FitnessSettings& fitness,
           double min_speed_kmh, double max_speed_kmh, bool smoothed_initial_population) {
            SpeedOptimizer optimizer(std::move(model), settings, fitness,
                                     min_speed_kmh, max_speed_kmh, smoothed_initial_population);
            return optimizer.run();
        },
        py::arg("model"),
        py::arg("settings") = helio::optimization::GeneticSettings(),
        py::arg("fitness") = helio::optimization::FitnessSettings(),
        py::arg("min_speed_kmh") = 20.0,
        py::arg("max_speed_kmh") = 60.0,
        py::arg("smoothed_initial_population") = false,
        "Run a SpeedOptimizer to completion and return its result dict.");

    py::class_<helio::sim::RaceConfig>(m, "RaceConfig")
        .def_static("from_config", [](const std::string& name) {
            return helio::sim::RaceConfig::from_config(name);
        }, py::arg("name"))
        .def("tiling", &helio::sim::RaceConfig::tiling)
        .def("duration_s", &helio::sim::RaceConfig::duration_s);

    // ========================================================================
    // ConfigManager access
    // ========================================================================
    m.def("config_init", [](const std::string& path) {
        helio::ConfigManager::instance().initialize(path);
    }, py::arg("config_dir"), "Initialize configuration from directory");

    m.def("list_races", []() {
        return helio::ConfigManager::instance().list_races();
    }, "Names of the races configured in races.json");

    m.def("get_sim_param_double", [](const std::string& key) {
        return helio::ConfigManager::instance().get_sim_param<double>(key);
    }, py::arg("key"), "Get simulation parameter as double");

    m.def("mps_to_kmph", &helio::physics::mps_to_kmph, py::arg("mps"));
    m.def("kmph_to_mps", &helio::physics::kmph_to_mps, py::arg("kmph"));

    // ========================================================================
    // Default config directory
    // ========================================================================
    m.attr("DEFAULT_CONFIG_DIR") = HELIOSTRATEGY_DEFAULT_CONFIG_DIR;
}
