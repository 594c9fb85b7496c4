#ifndef HELIOSTRATEGY_COMPUTE_KERNELS_H
#define HELIOSTRATEGY_COMPUTE_KERNELS_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace helio {
namespace sim {

/**
 * @brief Numeric kernels used by the schedule expander and the tick loop.
 *
 * An instance is handed to the simulation explicitly; nothing here keeps
 * process-wide state. The virtual interface lets callers substitute
 * accelerated implementations without touching the engine.
 */
class ComputeKernels {
public:
    virtual ~ComputeKernels() = default;

    /**
     * @brief Clamp per-tick speeds to the legal limit at the position reached so far.
     * @param speed_limits Per-metre limit table (km/h); entry k applies at distance [k, k+1).
     * @param speeds Per-tick speeds (km/h).
     * @param tick Tick length (s).
     * @return Constrained speeds, same length as speeds.
     *
     * Ticks are resolved in order: the limit for tick t is looked up at the
     * distance accumulated by the already-constrained ticks before it.
     * Positions past the table use its last entry. The result is a fixed
     * point of this function.
     *
     * @throws PreconditionError if speed_limits is empty, tick is not positive
     *         or any speed is negative or not finite.
     */
    virtual std::vector<double> constrain_speeds(const std::vector<double>& speed_limits,
                                                 const std::vector<double>& speeds,
                                                 double tick) const;

    /**
     * @brief Advance a route cursor to the node closest to distance_m.
     * @param midpoints Segment midpoints of the route (Route::segment_midpoints()).
     * @param current Index returned for the previous (smaller or equal) distance.
     */
    virtual std::size_t advance_route_index(const std::vector<double>& midpoints,
                                            double distance_m,
                                            std::size_t current) const;

    /**
     * @brief Advance a weather cursor to the sample closest to time.
     * @param timestamps Strictly increasing sample times.
     * @param current Index returned for the previous (earlier or equal) time.
     */
    virtual std::size_t advance_weather_index(const std::vector<std::int64_t>& timestamps,
                                              std::int64_t time,
                                              std::size_t current) const;

    /**
     * @brief Batch form of advance_route_index over non-decreasing distances.
     */
    std::vector<std::size_t> closest_route_indices(const std::vector<double>& distances,
                                                   const std::vector<double>& midpoints) const;

    /**
     * @brief Batch form of advance_weather_index over non-decreasing times.
     */
    std::vector<std::size_t> closest_weather_indices(const std::vector<std::int64_t>& times,
                                                     const std::vector<std::int64_t>& timestamps) const;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_COMPUTE_KERNELS_H
