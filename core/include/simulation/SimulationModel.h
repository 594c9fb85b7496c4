#ifndef HELIOSTRATEGY_SIMULATION_MODEL_H
#define HELIOSTRATEGY_SIMULATION_MODEL_H

#include "physics/Types.h"
#include "simulation/ComputeKernels.h"
#include "simulation/Race.h"
#include "simulation/Route.h"
#include "simulation/Simulation.h"
#include "simulation/SpeedSchedule.h"
#include "simulation/Weather.h"
#include "utils/ConfigManager.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace helio {
namespace sim {

/**
 * @brief What the engine does once the raw state of charge drops below zero.
 */
enum class ExhaustionPolicy {
    Continue,   ///< Keep driving the schedule; raw SOC keeps going negative
    Stop        ///< Park the car from the first exhausted tick
};

/**
 * @throws PreconditionError for anything but "continue" / "stop".
 */
ExhaustionPolicy parse_exhaustion_policy(const std::string& name);

/**
 * @brief Simulation-wide settings.
 */
struct SimulationSettings {
    int tick_s = 1;                        ///< Tick length (s)
    int granularity = 1;                   ///< Optimization intervals per hour
    std::int64_t start_offset_s = 0;       ///< Seconds after local midnight of race day 0
    double initial_soc = 1.0;
    bool acceleration_cap_enabled = false;
    ExhaustionPolicy exhaustion_policy = ExhaustionPolicy::Continue;
    double gravity = 9.81;
    double air_density = 1.225;

    /**
     * @brief Read settings from simulation.yaml, falling back to the defaults above.
     */
    static SimulationSettings from_config(const ConfigManager& config = ConfigManager::instance());
};

/**
 * @brief Owns the immutable inputs of a simulation and runs it on speed vectors.
 *
 * simulate() is const and safe to call from several threads at once; it is
 * what the optimizer uses. run_model()/get_results() keep the last run for
 * result consumers and are not thread-safe.
 */
class SimulationModel {
public:
    /**
     * @throws PreconditionError on invalid car, settings or race, or a route
     *         whose tiling differs from the race's lap count.
     * @throws DataCoverageError if the weather does not cover the horizon.
     */
    SimulationModel(physics::CarConfig car,
                    std::shared_ptr<const Route> route,
                    std::shared_ptr<const WeatherSeries> weather,
                    RaceConfig race,
                    SimulationSettings settings,
                    std::shared_ptr<const ComputeKernels> kernels = std::make_shared<ComputeKernels>());

    /**
     * @brief Number of genes a speed vector must have.
     */
    std::size_t driving_time_divisions() const { return expander_->driving_time_divisions(); }

    std::size_t tick_count() const { return expander_->tick_count(); }

    /**
     * @brief Simulation horizon in seconds.
     */
    std::int64_t simulation_duration_s() const { return duration_s_; }

    /**
     * @brief Unix time at the first tick.
     */
    std::int64_t simulation_start_unix() const { return start_unix_; }

    /**
     * @brief Expand a speed vector and run the tick loop.
     * @throws PreconditionError if the speed vector length is wrong or a speed
     *         is negative or not finite.
     */
    Simulation simulate(const std::vector<double>& speed_vector, bool record_trajectory = true) const;

    /**
     * @brief Run and keep the result for get_results().
     */
    void run_model(const std::vector<double>& speed_vector);

    bool has_results() const { return last_run_.has_value(); }

    /**
     * @throws PrematureDataRecoveryError if run_model() has not been called.
     * @throws std::invalid_argument on an unknown key.
     */
    std::vector<ResultValue> get_results(const std::vector<std::string>& keys) const;

    /**
     * @throws PrematureDataRecoveryError if run_model() has not been called.
     */
    const Simulation& last_simulation() const;

    const physics::CarConfig& car() const { return car_; }
    const Route& route() const { return *route_; }
    const WeatherSeries& weather() const { return *weather_; }
    const RaceConfig& race() const { return race_; }
    const SimulationSettings& settings() const { return settings_; }
    const ComputeKernels& kernels() const { return *kernels_; }
    const SpeedScheduleExpander& expander() const { return *expander_; }
    const std::vector<std::int64_t>& weather_timestamps() const { return weather_timestamps_; }

private:
    physics::CarConfig car_;
    std::shared_ptr<const Route> route_;
    std::shared_ptr<const WeatherSeries> weather_;
    RaceConfig race_;
    SimulationSettings settings_;
    std::shared_ptr<const ComputeKernels> kernels_;
    std::unique_ptr<SpeedScheduleExpander> expander_;

    std::vector<std::int64_t> weather_timestamps_;
    std::int64_t duration_s_ = 0;
    std::int64_t start_unix_ = 0;

    std::optional<Simulation> last_run_;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_SIMULATION_MODEL_H
