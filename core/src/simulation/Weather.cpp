#include "simulation/Weather.h"
#include "utils/Errors.h"

#include <algorithm>
#include <string>
#include <utility>

namespace helio {
namespace sim {

WeatherSeries::WeatherSeries(std::vector<WeatherRecord> records)
    : records_(std::move(records))
    , period_s_(3600) {
    if (records_.empty()) {
        throw PreconditionError("Weather series must contain at least one record");
    }

    if (records_.size() > 1) {
        period_s_ = records_[1].timestamp - records_[0].timestamp;
    }
    for (std::size_t i = 1; i < records_.size(); ++i) {
        std::int64_t gap = records_[i].timestamp - records_[i - 1].timestamp;
        if (gap <= 0) {
            throw PreconditionError("Weather timestamps must be strictly increasing (record " +
                                    std::to_string(i) + ")");
        }
        period_s_ = std::min(period_s_, gap);
    }
}

void WeatherSeries::check_coverage(std::int64_t begin, std::int64_t end) const {
    if (begin < first_timestamp() - period_s_ || end > last_timestamp() + period_s_) {
        throw DataCoverageError(
            "Weather forecast covers [" + std::to_string(first_timestamp()) + ", " +
            std::to_string(last_timestamp()) + "] but simulation needs [" +
            std::to_string(begin) + ", " + std::to_string(end) + "]");
    }
}

} // namespace sim
} // namespace helio
