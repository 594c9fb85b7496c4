#include "simulation/Simulation.h"
#include "simulation/SimulationModel.h"
#include "physics/Battery.h"
#include "physics/Components.h"
#include "physics/PhysicsMath.h"
#include "physics/SolarGeometry.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace helio {
namespace sim {

namespace {

using TrajectoryField = std::vector<double> Trajectory::*;

const std::unordered_map<std::string, TrajectoryField>& trajectory_fields() {
    static const std::unordered_map<std::string, TrajectoryField> fields = {
        {"timestamps", &Trajectory::timestamps},
        {"raw_speed_kmh", &Trajectory::raw_speed_kmh},
        {"speed_kmh", &Trajectory::speed_kmh},
        {"distances", &Trajectory::distances},
        {"closest_route_index", &Trajectory::closest_route_index},
        {"closest_weather_index", &Trajectory::closest_weather_index},
        {"gradient", &Trajectory::gradient},
        {"elevation", &Trajectory::elevation},
        {"time_zone", &Trajectory::time_zone},
        {"local_time", &Trajectory::local_time},
        {"solar_irradiance", &Trajectory::solar_irradiance},
        {"wind_speed", &Trajectory::wind_speed},
        {"headwind", &Trajectory::headwind},
        {"cloud_cover", &Trajectory::cloud_cover},
        {"motor_energy", &Trajectory::motor_energy},
        {"lvs_energy", &Trajectory::lvs_energy},
        {"array_energy", &Trajectory::array_energy},
        {"regen_energy", &Trajectory::regen_energy},
        {"consumed_energy", &Trajectory::consumed_energy},
        {"produced_energy", &Trajectory::produced_energy},
        {"delta_energy", &Trajectory::delta_energy},
        {"raw_soc", &Trajectory::raw_soc},
        {"state_of_charge", &Trajectory::state_of_charge},
        {"battery_voltage", &Trajectory::battery_voltage},
    };
    return fields;
}

const std::vector<std::string> SCALAR_KEYS = {
    "time_taken", "distance_travelled", "final_soc", "route_length",
    "min_raw_soc", "was_successful", "distance_before_exhaustion", "tick_count"
};

constexpr std::int64_t DAY_S = 86400;

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

} // anonymous namespace

void Trajectory::reserve(std::size_t n) {
    for (const auto& entry : trajectory_fields()) {
        (this->*(entry.second)).reserve(n);
    }
}

Simulation::Simulation(const SimulationModel& model,
                       std::vector<double> tick_speeds_kmh,
                       bool record_trajectory)
    : has_trajectory_(record_trajectory) {
    if (tick_speeds_kmh.size() != model.tick_count()) {
        throw PreconditionError("Expected " + std::to_string(model.tick_count()) +
                                " tick speeds, got " + std::to_string(tick_speeds_kmh.size()));
    }
    for (double v : tick_speeds_kmh) {
        if (!std::isfinite(v) || v < 0.0) {
            throw PreconditionError("Tick speeds must be finite and non-negative");
        }
    }
    run(model, tick_speeds_kmh);
}

void Simulation::run(const SimulationModel& model, const std::vector<double>& tick_speeds_kmh) {
    const Route& route = model.route();
    const WeatherSeries& weather = model.weather();
    const RaceConfig& race = model.race();
    const SimulationSettings& settings = model.settings();
    const physics::CarConfig& car = model.car();
    const ComputeKernels& kernels = model.kernels();

    physics::Atmosphere atmosphere;
    atmosphere.gravity = settings.gravity;
    atmosphere.air_density = settings.air_density;

    // Components are resolved once per run; the battery carries the state
    std::unique_ptr<physics::Motor> motor = physics::make_motor(car.motor, car.vehicle.mass_kg, atmosphere);
    std::unique_ptr<physics::EnergyStorage> battery = physics::make_battery(car.battery, settings.initial_soc);
    physics::SolarArray array(car.array);
    physics::LowVoltageSystem lvs(car.lvs);
    physics::RegenBrake regen(car.regen, car.vehicle.mass_kg, settings.gravity);

    const std::size_t n = tick_speeds_kmh.size();
    const double tick = static_cast<double>(settings.tick_s);
    const double route_length = route.length_m();
    const auto& midpoints = route.segment_midpoints();
    const auto& weather_ts = model.weather_timestamps();
    const auto& driving_mask = race.driving_mask();
    const auto& charging_mask = race.charging_mask();

    if (has_trajectory_) {
        trajectory_.reserve(n);
    }

    summary_ = SimulationSummary();
    summary_.route_length_m = route_length;
    summary_.tick_count = n;
    summary_.min_raw_soc = battery->raw_state_of_charge();
    summary_.time_taken_s = static_cast<double>(model.simulation_duration_s());

    double distance = 0.0;
    double previous_speed_mps = 0.0;
    double previous_elevation = route.node(0).elevation_m;
    std::size_t route_index = 0;
    std::size_t weather_index = 0;
    bool route_complete = false;
    bool exhausted = false;

    for (std::size_t t = 0; t < n; ++t) {
        const std::int64_t elapsed = static_cast<std::int64_t>(t) * settings.tick_s;
        const std::size_t race_second = static_cast<std::size_t>(settings.start_offset_s + elapsed);
        const std::int64_t unix_time = model.simulation_start_unix() + elapsed;

        // 1. Position
        const bool parked = route_complete ||
            (exhausted && settings.exhaustion_policy == ExhaustionPolicy::Stop);
        const double speed_kmh = parked ? 0.0 : tick_speeds_kmh[t];
        const double speed_mps = physics::kmph_to_mps(speed_kmh);

        distance = std::min(distance + speed_mps * tick, route_length);
        if (!route_complete && distance >= route_length) {
            route_complete = true;
            summary_.time_taken_s = static_cast<double>(elapsed) + tick;
        }

        // 2-3. Environment indices
        route_index = kernels.advance_route_index(midpoints, distance, route_index);
        weather_index = kernels.advance_weather_index(weather_ts, unix_time, weather_index);

        // 4. Environment lookup
        const RouteNode& node = route.node(route_index);
        const WeatherRecord& record = weather.record(weather_index);

        const std::int64_t local_unix = unix_time + static_cast<std::int64_t>(node.time_zone_s);
        const std::int64_t local_day = floor_div(local_unix, DAY_S);
        const double local_time_h = static_cast<double>(local_unix - local_day * DAY_S) / 3600.0;

        // 5. Irradiance
        double irradiance = 0.0;
        if (record.ghi_wm2) {
            irradiance = *record.ghi_wm2;
        } else {
            physics::CivilDate date = physics::civil_from_days(local_day);
            int doy = physics::day_of_year(date.year, date.month, date.day);
            double clear_sky = physics::SolarGeometry::global_horizontal_irradiance(
                node.latitude_deg, node.longitude_deg, node.time_zone_s / 3600.0,
                doy, local_time_h, node.elevation_m);
            irradiance = physics::SolarGeometry::apply_cloud_cover(clear_sky, record.cloud_cover_percent);
        }

        const double headwind = physics::calc_headwind_speed(
            record.wind_speed_mps, record.wind_direction_deg, route.bearing_deg(route_index));

        // 6. Component models
        physics::TickConditions conditions;
        conditions.speed_mps = speed_mps;
        conditions.previous_speed_mps = previous_speed_mps;
        conditions.gradient = node.gradient;
        conditions.elevation_m = node.elevation_m;
        conditions.previous_elevation_m = previous_elevation;
        conditions.headwind_mps = headwind;
        conditions.irradiance_wm2 = irradiance;
        conditions.curvature = node.curvature;
        conditions.dt_s = tick;

        const bool driving = driving_mask[race_second];
        const bool charging = charging_mask[race_second];

        const double motor_energy = driving ? motor->consumed_energy(conditions) : 0.0;
        const double lvs_energy = driving ? lvs.consumed_energy(conditions) : 0.0;
        const double array_energy = charging ? array.produced_energy(conditions) : 0.0;
        const double regen_energy = driving ? regen.produced_energy(conditions) : 0.0;

        const double consumed = motor_energy + lvs_energy;
        const double produced = array_energy + regen_energy;
        const double delta = produced - consumed;

        // 7. Battery
        battery->update(delta, tick);
        const double raw_soc = battery->raw_state_of_charge();
        summary_.min_raw_soc = std::min(summary_.min_raw_soc, raw_soc);

        if (!exhausted && battery->is_exhausted()) {
            exhausted = true;
            summary_.was_successful = false;
            summary_.distance_before_exhaustion_m = distance;
        }

        // 8. Record
        if (has_trajectory_) {
            trajectory_.timestamps.push_back(static_cast<double>(unix_time));
            trajectory_.raw_speed_kmh.push_back(tick_speeds_kmh[t]);
            trajectory_.speed_kmh.push_back(speed_kmh);
            trajectory_.distances.push_back(distance);
            trajectory_.closest_route_index.push_back(static_cast<double>(route_index));
            trajectory_.closest_weather_index.push_back(static_cast<double>(weather_index));
            trajectory_.gradient.push_back(node.gradient);
            trajectory_.elevation.push_back(node.elevation_m);
            trajectory_.time_zone.push_back(node.time_zone_s);
            trajectory_.local_time.push_back(local_time_h);
            trajectory_.solar_irradiance.push_back(irradiance);
            trajectory_.wind_speed.push_back(record.wind_speed_mps);
            trajectory_.headwind.push_back(headwind);
            trajectory_.cloud_cover.push_back(record.cloud_cover_percent);
            trajectory_.motor_energy.push_back(motor_energy);
            trajectory_.lvs_energy.push_back(lvs_energy);
            trajectory_.array_energy.push_back(array_energy);
            trajectory_.regen_energy.push_back(regen_energy);
            trajectory_.consumed_energy.push_back(consumed);
            trajectory_.produced_energy.push_back(produced);
            trajectory_.delta_energy.push_back(delta);
            trajectory_.raw_soc.push_back(raw_soc);
            trajectory_.state_of_charge.push_back(battery->state_of_charge());
            trajectory_.battery_voltage.push_back(battery->voltage());
        }

        previous_speed_mps = speed_mps;
        previous_elevation = node.elevation_m;
    }

    summary_.distance_travelled_m = distance;
    summary_.final_soc = battery->state_of_charge();
    if (!exhausted) {
        summary_.distance_before_exhaustion_m = distance;
    }
}

ResultValue Simulation::get_result(const std::string& key) const {
    if (key == "time_taken") return summary_.time_taken_s;
    if (key == "distance_travelled") return summary_.distance_travelled_m;
    if (key == "final_soc") return summary_.final_soc;
    if (key == "route_length") return summary_.route_length_m;
    if (key == "min_raw_soc") return summary_.min_raw_soc;
    if (key == "was_successful") return summary_.was_successful ? 1.0 : 0.0;
    if (key == "distance_before_exhaustion") return summary_.distance_before_exhaustion_m;
    if (key == "tick_count") return static_cast<double>(summary_.tick_count);

    const auto& fields = trajectory_fields();
    auto it = fields.find(key);
    if (it == fields.end()) {
        throw std::invalid_argument("Unknown simulation result: " + key);
    }
    if (!has_trajectory_) {
        throw std::invalid_argument("Result '" + key + "' is unavailable: trajectory was not recorded");
    }
    return trajectory_.*(it->second);
}

std::vector<ResultValue> Simulation::get_results(const std::vector<std::string>& keys) const {
    std::vector<ResultValue> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        results.push_back(get_result(key));
    }
    return results;
}

const std::vector<std::string>& Simulation::result_keys() {
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> all = SCALAR_KEYS;
        for (const auto& entry : trajectory_fields()) {
            all.push_back(entry.first);
        }
        std::sort(all.begin() + static_cast<std::ptrdiff_t>(SCALAR_KEYS.size()), all.end());
        return all;
    }();
    return keys;
}

} // namespace sim
} // namespace helio
