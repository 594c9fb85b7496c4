#include "optimization/FitnessAdapter.h"
#include "utils/Errors.h"

#include <utility>

namespace helio {
namespace optimization {

Objective parse_objective(const std::string& name) {
    if (name == "distance_travelled") return Objective::DistanceTravelled;
    if (name == "time_taken") return Objective::TimeTaken;
    if (name == "distance_and_time") return Objective::DistanceAndTime;
    throw PreconditionError("Unknown objective: " + name);
}

std::string to_string(Objective objective) {
    switch (objective) {
        case Objective::DistanceTravelled: return "distance_travelled";
        case Objective::TimeTaken: return "time_taken";
        case Objective::DistanceAndTime: return "distance_and_time";
    }
    return "unknown";
}

FitnessSettings FitnessSettings::from_yaml(const YAML::Node& node) {
    FitnessSettings s;
    if (node["objective"]) {
        s.objective = parse_objective(node["objective"].as<std::string>());
    }
    if (node["reference_time"]) {
        s.reference_time_s = node["reference_time"].as<double>();
    }
    if (node["reference_distance"]) {
        s.reference_distance_m = node["reference_distance"].as<double>();
    }
    if (node["exhaustion_penalty"]) {
        s.exhaustion_penalty = node["exhaustion_penalty"].as<double>();
    }
    return s;
}

FitnessAdapter::FitnessAdapter(std::shared_ptr<const sim::SimulationModel> model,
                               FitnessSettings settings)
    : model_(std::move(model))
    , settings_(settings) {
    if (!model_) {
        throw PreconditionError("FitnessAdapter requires a simulation model");
    }
    if (settings_.reference_time_s <= 0.0 || settings_.reference_distance_m <= 0.0) {
        throw PreconditionError("Fitness reference time and distance must be positive");
    }
}

double FitnessAdapter::operator()(const std::vector<double>& speed_vector) const {
    sim::Simulation run = model_->simulate(speed_vector, false);
    return score(run.summary());
}

double FitnessAdapter::score(const sim::SimulationSummary& summary) const {
    const double penalty = summary.was_successful ? 0.0 : settings_.exhaustion_penalty;

    switch (settings_.objective) {
        case Objective::DistanceTravelled:
            return summary.distance_travelled_m - penalty;
        case Objective::TimeTaken:
            return -summary.time_taken_s - penalty;
        case Objective::DistanceAndTime: {
            // A stranded car scores nothing regardless of how far it got
            const double distance = summary.was_successful ? summary.distance_travelled_m : 0.0;
            return (settings_.reference_time_s / summary.time_taken_s) *
                   (distance / settings_.reference_distance_m);
        }
    }
    return 0.0;
}

} // namespace optimization
} // namespace helio
