#include "simulation/SimulationModel.h"
#include "physics/SolarGeometry.h"
#include "utils/Errors.h"

#include <string>
#include <utility>

namespace helio {
namespace sim {

ExhaustionPolicy parse_exhaustion_policy(const std::string& name) {
    if (name == "continue") return ExhaustionPolicy::Continue;
    if (name == "stop") return ExhaustionPolicy::Stop;
    throw PreconditionError("Unknown exhaustion policy: " + name);
}

SimulationSettings SimulationSettings::from_config(const ConfigManager& config) {
    SimulationSettings s;
    s.tick_s = config.get_sim_param_or<int>("tick", s.tick_s);
    s.granularity = config.get_sim_param_or<int>("granularity", s.granularity);
    s.start_offset_s = config.get_sim_param_or<std::int64_t>("start_time", s.start_offset_s);
    s.initial_soc = config.get_sim_param_or<double>("initial_soc", s.initial_soc);
    s.acceleration_cap_enabled = config.get_sim_param_or<bool>("max_acceleration_enabled",
                                                               s.acceleration_cap_enabled);
    s.exhaustion_policy = parse_exhaustion_policy(
        config.get_sim_param_or<std::string>("exhaustion_policy", "continue"));
    s.gravity = config.get_sim_param_or<double>("gravity", s.gravity);
    s.air_density = config.get_sim_param_or<double>("air_density", s.air_density);
    return s;
}

SimulationModel::SimulationModel(physics::CarConfig car,
                                 std::shared_ptr<const Route> route,
                                 std::shared_ptr<const WeatherSeries> weather,
                                 RaceConfig race,
                                 SimulationSettings settings,
                                 std::shared_ptr<const ComputeKernels> kernels)
    : car_(std::move(car))
    , route_(std::move(route))
    , weather_(std::move(weather))
    , race_(std::move(race))
    , settings_(settings)
    , kernels_(std::move(kernels)) {
    if (!route_ || !weather_ || !kernels_) {
        throw PreconditionError("SimulationModel requires a route, a weather series and compute kernels");
    }
    if (route_->tiling() != race_.tiling()) {
        throw PreconditionError("Route is tiled " + std::to_string(route_->tiling()) + " time(s) but " +
                                to_string(race_.type()) + " is raced over " +
                                std::to_string(race_.tiling()) + " lap(s)");
    }
    if (!car_.is_valid()) {
        throw PreconditionError("Invalid car configuration: " + car_.name);
    }
    if (settings_.initial_soc < 0.0 || settings_.initial_soc > 1.0) {
        throw PreconditionError("Initial state of charge must lie in [0, 1]");
    }
    if (settings_.gravity <= 0.0 || settings_.air_density < 0.0) {
        throw PreconditionError("Gravity must be positive and air density non-negative");
    }
    if (settings_.start_offset_s < 0 || settings_.start_offset_s >= race_.duration_s()) {
        throw PreconditionError("Start time " + std::to_string(settings_.start_offset_s) +
                                " s is outside the race (" + std::to_string(race_.duration_s()) + " s)");
    }

    duration_s_ = race_.duration_s() - settings_.start_offset_s;

    const auto& driving = race_.driving_mask();
    std::vector<bool> driving_seconds(driving.begin() + settings_.start_offset_s, driving.end());

    ScheduleLimits limits;
    limits.max_deceleration_mps2 = car_.vehicle.max_deceleration_mps2;
    if (settings_.acceleration_cap_enabled) {
        limits.max_acceleration_mps2 = car_.vehicle.max_acceleration_mps2;
    }
    limits.speed_limit_table = route_->speed_limit_table();

    expander_ = std::make_unique<SpeedScheduleExpander>(
        driving_seconds, settings_.tick_s, settings_.granularity, std::move(limits), *kernels_);

    // Race day 0 starts at local midnight of the route origin
    std::int64_t race_start_unix =
        physics::days_from_civil(race_.start_year(), race_.start_month(), race_.start_day()) * 86400 -
        static_cast<std::int64_t>(route_->node(0).time_zone_s);
    start_unix_ = race_start_unix + settings_.start_offset_s;

    weather_->check_coverage(start_unix_, start_unix_ + duration_s_);

    weather_timestamps_.reserve(weather_->size());
    for (const auto& record : weather_->records()) {
        weather_timestamps_.push_back(record.timestamp);
    }
}

Simulation SimulationModel::simulate(const std::vector<double>& speed_vector,
                                     bool record_trajectory) const {
    return Simulation(*this, expander_->expand(speed_vector), record_trajectory);
}

void SimulationModel::run_model(const std::vector<double>& speed_vector) {
    last_run_.reset();
    last_run_.emplace(simulate(speed_vector, true));
}

const Simulation& SimulationModel::last_simulation() const {
    if (!last_run_) {
        throw PrematureDataRecoveryError("Results requested before run_model() was called");
    }
    return *last_run_;
}

std::vector<ResultValue> SimulationModel::get_results(const std::vector<std::string>& keys) const {
    return last_simulation().get_results(keys);
}

} // namespace sim
} // namespace helio
