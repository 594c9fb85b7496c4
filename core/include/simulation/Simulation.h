#ifndef HELIOSTRATEGY_SIMULATION_H
#define HELIOSTRATEGY_SIMULATION_H

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace helio {
namespace sim {

class SimulationModel;

/**
 * @brief Per-tick state recorded by the engine, one slot per tick.
 *
 * Distances are in meters, speeds in km/h, energies in joules per tick and
 * state of charge as a fraction.
 */
struct Trajectory {
    std::vector<double> timestamps;            ///< Unix time at the start of each tick
    std::vector<double> raw_speed_kmh;         ///< Speed requested by the schedule
    std::vector<double> speed_kmh;             ///< Speed actually driven
    std::vector<double> distances;             ///< Cumulative distance after the tick
    std::vector<double> closest_route_index;
    std::vector<double> closest_weather_index;
    std::vector<double> gradient;
    std::vector<double> elevation;
    std::vector<double> time_zone;             ///< UTC offset (s)
    std::vector<double> local_time;            ///< Hours since local midnight
    std::vector<double> solar_irradiance;      ///< W/m^2
    std::vector<double> wind_speed;            ///< Forecast wind speed (m/s)
    std::vector<double> headwind;              ///< Wind component against the direction of travel (m/s)
    std::vector<double> cloud_cover;           ///< Percent
    std::vector<double> motor_energy;
    std::vector<double> lvs_energy;
    std::vector<double> array_energy;
    std::vector<double> regen_energy;
    std::vector<double> consumed_energy;
    std::vector<double> produced_energy;
    std::vector<double> delta_energy;
    std::vector<double> raw_soc;               ///< Unclamped; negative means stranded
    std::vector<double> state_of_charge;       ///< Clamped to [0, 1]
    std::vector<double> battery_voltage;

    void reserve(std::size_t n);
};

/**
 * @brief Scalar outcome of a run.
 */
struct SimulationSummary {
    double time_taken_s = 0.0;                 ///< Time to finish the route, or the full horizon
    double distance_travelled_m = 0.0;
    double final_soc = 0.0;                    ///< Clamped fraction
    double route_length_m = 0.0;
    double min_raw_soc = 0.0;
    bool was_successful = true;                ///< Raw SOC never went negative
    double distance_before_exhaustion_m = 0.0;
    std::size_t tick_count = 0;
};

using ResultValue = std::variant<double, std::vector<double>>;

/**
 * @brief One completed simulation run.
 *
 * Construction executes the whole tick loop; an instance is always complete.
 * It copies what it needs from the model and does not reference it afterwards.
 */
class Simulation {
public:
    /**
     * @param model Immutable inputs.
     * @param tick_speeds_kmh Constrained per-tick speeds, one per tick.
     * @param record_trajectory When false only the summary is kept.
     * @throws PreconditionError if tick_speeds_kmh has the wrong length or a
     *         negative or non-finite speed.
     */
    Simulation(const SimulationModel& model,
               std::vector<double> tick_speeds_kmh,
               bool record_trajectory = true);

    const SimulationSummary& summary() const { return summary_; }
    bool has_trajectory() const { return has_trajectory_; }
    const Trajectory& trajectory() const { return trajectory_; }

    /**
     * @brief Look up results by name, in the order requested.
     *
     * Array keys: the Trajectory field names. Scalar keys: time_taken,
     * distance_travelled, final_soc, route_length, min_raw_soc,
     * was_successful, distance_before_exhaustion, tick_count.
     *
     * @throws std::invalid_argument on an unknown key, or an array key when
     *         the trajectory was not recorded.
     */
    std::vector<ResultValue> get_results(const std::vector<std::string>& keys) const;

    ResultValue get_result(const std::string& key) const;

    /**
     * @brief All supported result keys.
     */
    static const std::vector<std::string>& result_keys();

private:
    void run(const SimulationModel& model, const std::vector<double>& tick_speeds_kmh);

    bool has_trajectory_;
    Trajectory trajectory_;
    SimulationSummary summary_;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_SIMULATION_H
