#include "simulation/ComputeKernels.h"
#include "physics/PhysicsMath.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace helio {
namespace sim {

std::vector<double> ComputeKernels::constrain_speeds(const std::vector<double>& speed_limits,
                                                     const std::vector<double>& speeds,
                                                     double tick) const {
    if (speed_limits.empty()) {
        throw PreconditionError("constrain_speeds: speed limit table is empty");
    }
    if (tick <= 0.0) {
        throw PreconditionError("constrain_speeds: tick must be positive");
    }

    std::vector<double> constrained(speeds.size());
    const std::size_t last = speed_limits.size() - 1;
    double distance = 0.0;

    for (std::size_t t = 0; t < speeds.size(); ++t) {
        if (!std::isfinite(speeds[t]) || speeds[t] < 0.0) {
            throw PreconditionError("constrain_speeds: speed at tick " + std::to_string(t) +
                                    " is negative or not finite");
        }
        std::size_t index = static_cast<std::size_t>(std::floor(distance));
        index = std::min(index, last);

        constrained[t] = std::min(speed_limits[index], speeds[t]);
        distance += physics::kmph_to_mps(constrained[t]) * tick;
    }
    return constrained;
}

std::size_t ComputeKernels::advance_route_index(const std::vector<double>& midpoints,
                                                double distance_m,
                                                std::size_t current) const {
    while (current < midpoints.size() && distance_m >= midpoints[current]) {
        ++current;
    }
    return current;
}

std::size_t ComputeKernels::advance_weather_index(const std::vector<std::int64_t>& timestamps,
                                                  std::int64_t time,
                                                  std::size_t current) const {
    while (current + 1 < timestamps.size() &&
           std::llabs(timestamps[current + 1] - time) <= std::llabs(timestamps[current] - time)) {
        ++current;
    }
    return current;
}

std::vector<std::size_t> ComputeKernels::closest_route_indices(
    const std::vector<double>& distances,
    const std::vector<double>& midpoints) const {
    std::vector<std::size_t> indices(distances.size());
    std::size_t cursor = 0;
    for (std::size_t i = 0; i < distances.size(); ++i) {
        cursor = advance_route_index(midpoints, distances[i], cursor);
        indices[i] = cursor;
    }
    return indices;
}

std::vector<std::size_t> ComputeKernels::closest_weather_indices(
    const std::vector<std::int64_t>& times,
    const std::vector<std::int64_t>& timestamps) const {
    std::vector<std::size_t> indices(times.size());
    std::size_t cursor = 0;
    for (std::size_t i = 0; i < times.size(); ++i) {
        cursor = advance_weather_index(timestamps, times[i], cursor);
        indices[i] = cursor;
    }
    return indices;
}

} // namespace sim
} // namespace helio
