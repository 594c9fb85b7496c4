#ifndef HELIOSTRATEGY_WEATHER_H
#define HELIOSTRATEGY_WEATHER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace helio {
namespace sim {

/**
 * @brief One forecast sample.
 */
struct WeatherRecord {
    std::int64_t timestamp = 0;           ///< Unix time (s)
    std::optional<double> ghi_wm2;        ///< Forecast irradiance; computed from solar geometry if absent
    double wind_speed_mps = 0.0;
    double wind_direction_deg = 0.0;      ///< Meteorological convention
    double cloud_cover_percent = 0.0;     ///< 0-100
    double temperature_c = 20.0;
};

/**
 * @brief Immutable, time-ordered weather forecast.
 */
class WeatherSeries {
public:
    /**
     * @throws PreconditionError if empty or timestamps are not strictly increasing.
     */
    explicit WeatherSeries(std::vector<WeatherRecord> records);

    std::size_t size() const { return records_.size(); }
    const WeatherRecord& record(std::size_t i) const { return records_[i]; }
    const std::vector<WeatherRecord>& records() const { return records_; }

    std::int64_t first_timestamp() const { return records_.front().timestamp; }
    std::int64_t last_timestamp() const { return records_.back().timestamp; }

    /**
     * @brief Forecast period (smallest spacing between samples), 3600 s for a single sample.
     */
    std::int64_t period_s() const { return period_s_; }

    /**
     * @brief Ensure [begin, end] is covered, allowing one period of clamping at each end.
     * @throws DataCoverageError otherwise.
     */
    void check_coverage(std::int64_t begin, std::int64_t end) const;

private:
    std::vector<WeatherRecord> records_;
    std::int64_t period_s_;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_WEATHER_H
