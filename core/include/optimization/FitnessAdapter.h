#ifndef HELIOSTRATEGY_FITNESS_ADAPTER_H
#define HELIOSTRATEGY_FITNESS_ADAPTER_H

#include "simulation/Simulation.h"
#include "simulation/SimulationModel.h"

#include <yaml-cpp/yaml.h>

#include <memory>
#include <string>
#include <vector>

namespace helio {
namespace optimization {

/**
 * @brief Scalar extracted from a simulation run. Larger is always better.
 */
enum class Objective {
    DistanceTravelled,   ///< Metres covered
    TimeTaken,           ///< Negated seconds to finish
    DistanceAndTime      ///< Reference-normalised product of speed and completion
};

/**
 * @throws PreconditionError for anything but "distance_travelled",
 *         "time_taken" or "distance_and_time".
 */
Objective parse_objective(const std::string& name);

std::string to_string(Objective objective);

struct FitnessSettings {
    Objective objective = Objective::DistanceAndTime;
    double reference_time_s = 691200.0;        ///< Eight race days
    double reference_distance_m = 2466000.0;   ///< Full ASC route
    double exhaustion_penalty = 0.0;           ///< Subtracted from unsuccessful runs

    /**
     * @brief Read "objective", "reference_time", "reference_distance" and
     * "exhaustion_penalty" from an optimization section; missing keys keep
     * their defaults.
     */
    static FitnessSettings from_yaml(const YAML::Node& node);
};

/**
 * @brief Turns the simulation into the f(speed_vector) -> double the optimizer maximizes.
 *
 * Each call runs an independent simulation without recording a trajectory,
 * so one adapter can be shared by every worker of the thread pool.
 */
class FitnessAdapter {
public:
    /**
     * @throws PreconditionError if model is null or a reference value is not positive.
     */
    explicit FitnessAdapter(std::shared_ptr<const sim::SimulationModel> model,
                            FitnessSettings settings = FitnessSettings());

    double operator()(const std::vector<double>& speed_vector) const;

    /**
     * @brief Fitness of an already completed run.
     */
    double score(const sim::SimulationSummary& summary) const;

    const FitnessSettings& settings() const { return settings_; }
    const sim::SimulationModel& model() const { return *model_; }

private:
    std::shared_ptr<const sim::SimulationModel> model_;
    FitnessSettings settings_;
};

} // namespace optimization
} // namespace helio

#endif // HELIOSTRATEGY_FITNESS_ADAPTER_H
