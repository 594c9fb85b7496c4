#include "simulation/SpeedSchedule.h"
#include "physics/PhysicsMath.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace helio {
namespace sim {

namespace {
constexpr int SECONDS_PER_HOUR = 3600;
} // anonymous namespace

std::vector<bool> reduce_granularity(const std::vector<bool>& seconds, int granularity) {
    if (granularity < 1 || granularity > SECONDS_PER_HOUR || SECONDS_PER_HOUR % granularity != 0) {
        throw PreconditionError("Granularity must divide 3600, got " + std::to_string(granularity));
    }

    const std::size_t block = static_cast<std::size_t>(SECONDS_PER_HOUR / granularity);
    const std::size_t blocks = (seconds.size() + block - 1) / block;

    std::vector<bool> reduced(blocks, true);
    for (std::size_t s = 0; s < seconds.size(); ++s) {
        if (!seconds[s]) {
            reduced[s / block] = false;
        }
    }
    return reduced;
}

SpeedScheduleExpander::SpeedScheduleExpander(const std::vector<bool>& driving_seconds,
                                             int tick_s,
                                             int granularity,
                                             ScheduleLimits limits,
                                             const ComputeKernels& kernels)
    : tick_s_(tick_s)
    , interval_s_(0)
    , limits_(std::move(limits))
    , kernels_(kernels) {
    if (tick_s_ < 1) {
        throw PreconditionError("Tick must be at least one second");
    }
    if (limits_.max_deceleration_mps2 <= 0.0 ||
        (limits_.max_acceleration_mps2 && *limits_.max_acceleration_mps2 <= 0.0)) {
        throw PreconditionError("Acceleration and deceleration caps must be positive");
    }
    if (limits_.speed_limit_table.empty()) {
        throw PreconditionError("Speed limit table is empty");
    }

    interval_mask_ = reduce_granularity(driving_seconds, granularity);
    interval_s_ = SECONDS_PER_HOUR / granularity;

    // Speed-vector index of each permitted interval
    std::vector<std::size_t> interval_gene(interval_mask_.size(), 0);
    for (std::size_t b = 0; b < interval_mask_.size(); ++b) {
        interval_gene[b] = divisions_;
        if (interval_mask_[b]) {
            ++divisions_;
        }
    }

    tick_count_ = (driving_seconds.size() + static_cast<std::size_t>(tick_s_) - 1) /
                  static_cast<std::size_t>(tick_s_);
    tick_mask_.assign(tick_count_, false);
    tick_interval_.assign(tick_count_, 0);

    for (std::size_t t = 0; t < tick_count_; ++t) {
        std::size_t block = (t * static_cast<std::size_t>(tick_s_)) / static_cast<std::size_t>(interval_s_);
        tick_mask_[t] = interval_mask_[block];
        tick_interval_[t] = interval_gene[block];
    }
}

double SpeedScheduleExpander::max_drop_per_tick_kmh() const {
    return physics::mps_to_kmph(limits_.max_deceleration_mps2 * tick_s_);
}

std::vector<double> SpeedScheduleExpander::expand_raw(const std::vector<double>& speed_vector) const {
    if (speed_vector.size() != divisions_) {
        throw PreconditionError("Speed vector has " + std::to_string(speed_vector.size()) +
                                " entries but the race has " + std::to_string(divisions_) +
                                " driving intervals");
    }
    for (std::size_t i = 0; i < speed_vector.size(); ++i) {
        if (!std::isfinite(speed_vector[i]) || speed_vector[i] < 0.0) {
            throw PreconditionError("Speed vector entry " + std::to_string(i) +
                                    " must be a finite non-negative speed, got " +
                                    std::to_string(speed_vector[i]));
        }
    }

    std::vector<double> speeds(tick_count_, 0.0);
    for (std::size_t t = 0; t < tick_count_; ++t) {
        if (tick_mask_[t]) {
            speeds[t] = speed_vector[tick_interval_[t]];
        }
    }
    return speeds;
}

std::vector<double> SpeedScheduleExpander::apply_deceleration_cap(std::vector<double> speeds) const {
    const double max_drop = max_drop_per_tick_kmh();

    for (std::size_t i = speeds.size(); i-- > 1;) {
        if (speeds[i - 1] - speeds[i] > max_drop) {
            speeds[i - 1] = speeds[i] + max_drop;
        }
    }
    return speeds;
}

std::vector<double> SpeedScheduleExpander::apply_acceleration_cap(std::vector<double> speeds) const {
    if (!limits_.max_acceleration_mps2) {
        return speeds;
    }
    const double max_rise = physics::mps_to_kmph(*limits_.max_acceleration_mps2 * tick_s_);

    double previous = 0.0;
    for (double& v : speeds) {
        v = std::min(v, previous + max_rise);
        previous = v;
    }
    return speeds;
}

std::vector<double> SpeedScheduleExpander::apply_speed_limits(const std::vector<double>& speeds) const {
    return kernels_.constrain_speeds(limits_.speed_limit_table, speeds, static_cast<double>(tick_s_));
}

std::vector<double> SpeedScheduleExpander::expand(const std::vector<double>& speed_vector) const {
    std::vector<double> speeds = expand_raw(speed_vector);

    // Every pass only lowers speeds, so this settles on the largest schedule
    // satisfying all three constraints.
    for (int pass = 0; pass < MAX_CONSTRAINT_PASSES; ++pass) {
        std::vector<double> next = apply_speed_limits(
            apply_deceleration_cap(apply_acceleration_cap(speeds)));
        if (next == speeds) {
            break;
        }
        speeds = std::move(next);
    }
    return speeds;
}

} // namespace sim
} // namespace helio
