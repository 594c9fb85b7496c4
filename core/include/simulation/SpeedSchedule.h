#ifndef HELIOSTRATEGY_SPEED_SCHEDULE_H
#define HELIOSTRATEGY_SPEED_SCHEDULE_H

#include "simulation/ComputeKernels.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace helio {
namespace sim {

/**
 * @brief Reduce a per-second permission mask to optimization intervals.
 * @param seconds Per-second mask.
 * @param granularity Intervals per hour; must divide 3600.
 * @return One entry per block of 3600 / granularity seconds (the last block
 *         may be shorter); a block is permitted only if every second is.
 * @throws PreconditionError on an invalid granularity.
 */
std::vector<bool> reduce_granularity(const std::vector<bool>& seconds, int granularity);

/**
 * @brief Limits applied while expanding a speed vector, in vehicle units.
 */
struct ScheduleLimits {
    double max_deceleration_mps2 = 3.0;
    std::optional<double> max_acceleration_mps2;  ///< Unset disables the acceleration cap
    std::vector<double> speed_limit_table;        ///< Per-metre legal limits (km/h)
};

/**
 * @brief Expands a per-interval speed vector into a per-tick speed array.
 *
 * Pipeline: interval expansion, optional acceleration cap, backward
 * deceleration smoothing, then legal speed limits. The three constraint
 * passes are repeated until none of them changes the array (or a pass
 * limit is reached, in which case legal limits win because they run last).
 */
class SpeedScheduleExpander {
public:
    static constexpr int MAX_CONSTRAINT_PASSES = 16;

    /**
     * @param driving_seconds Per-second driving mask starting at the simulation start.
     * @param tick_s Tick length in seconds (> 0).
     * @param granularity Optimization intervals per hour.
     * @param limits Acceleration/deceleration caps and the legal limit table.
     * @param kernels Kernels used for the legal-limit pass; must outlive the expander.
     * @throws PreconditionError on invalid tick, granularity or limits.
     */
    SpeedScheduleExpander(const std::vector<bool>& driving_seconds,
                          int tick_s,
                          int granularity,
                          ScheduleLimits limits,
                          const ComputeKernels& kernels);

    /**
     * @brief Number of speed-vector entries expected (permitted intervals).
     */
    std::size_t driving_time_divisions() const { return divisions_; }

    std::size_t tick_count() const { return tick_count_; }
    int tick_s() const { return tick_s_; }
    int interval_s() const { return interval_s_; }

    /**
     * @brief Per-interval permission after granularity reduction.
     */
    const std::vector<bool>& interval_mask() const { return interval_mask_; }

    /**
     * @brief Per-tick flag: tick falls inside a permitted interval.
     */
    const std::vector<bool>& tick_mask() const { return tick_mask_; }

    /**
     * @brief Full pipeline.
     * @throws PreconditionError if speed_vector has the wrong length or holds a
     *         negative or non-finite speed.
     */
    std::vector<double> expand(const std::vector<double>& speed_vector) const;

    /**
     * @brief Interval expansion only: permitted ticks take their interval's speed, others 0.
     */
    std::vector<double> expand_raw(const std::vector<double>& speed_vector) const;

    /**
     * @brief Backward pass so that no tick drops more than the deceleration cap from the previous one.
     */
    std::vector<double> apply_deceleration_cap(std::vector<double> speeds) const;

    /**
     * @brief Forward pass so that no tick rises more than the acceleration cap (start from rest).
     */
    std::vector<double> apply_acceleration_cap(std::vector<double> speeds) const;

    std::vector<double> apply_speed_limits(const std::vector<double>& speeds) const;

    /**
     * @brief Largest allowed drop between consecutive ticks (km/h).
     */
    double max_drop_per_tick_kmh() const;

private:
    int tick_s_;
    int interval_s_;
    ScheduleLimits limits_;
    const ComputeKernels& kernels_;

    std::vector<bool> interval_mask_;
    std::vector<bool> tick_mask_;
    std::vector<std::size_t> tick_interval_;  ///< Speed-vector index per permitted tick
    std::size_t divisions_ = 0;
    std::size_t tick_count_ = 0;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_SPEED_SCHEDULE_H
