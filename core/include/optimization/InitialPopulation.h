#ifndef HELIOSTRATEGY_INITIAL_POPULATION_H
#define HELIOSTRATEGY_INITIAL_POPULATION_H

#include "simulation/SimulationModel.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace helio {
namespace optimization {

/**
 * @brief Shape of the smoothed random speed vectors used to seed the optimizer.
 *
 * Each vector is mean_kmh plus Gaussian noise (std_dev_kmh) blurred with a
 * Gaussian kernel of width smoothing_sigma genes, rounded to whole km/h and
 * clipped to [min_kmh, max_kmh].
 */
struct SmoothedPopulationSettings {
    double mean_kmh = 35.0;
    double std_dev_kmh = 3.0;
    double smoothing_sigma = 2.0;
    double min_kmh = 30.0;
    double max_kmh = 40.0;
    bool round_to_integer = true;
    std::size_t max_attempts = 1000;   ///< Candidate budget per requested individual
    std::uint64_t seed = 0;
};

using SpeedPredicate = std::function<bool(const std::vector<double>&)>;

/**
 * @brief 1-D Gaussian blur with mirrored edges, kernel truncated at 4 sigma.
 *
 * sigma <= 0 returns the input unchanged.
 */
std::vector<double> gaussian_smooth(const std::vector<double>& values, double sigma);

/**
 * @brief Draw count smoothed speed vectors of the given length that pass is_valid.
 *
 * @param is_valid May be empty, in which case every candidate is accepted.
 * @throws PreconditionError on an empty or inverted speed band.
 * @throws std::runtime_error if the candidate budget runs out first.
 */
std::vector<std::vector<double>> generate_smoothed_population(std::size_t count,
                                                              std::size_t length,
                                                              const SmoothedPopulationSettings& settings,
                                                              const SpeedPredicate& is_valid = SpeedPredicate());

/**
 * @brief Predicate accepting speed vectors the car can drive without exhausting its battery.
 */
SpeedPredicate completes_without_exhaustion(const sim::SimulationModel& model);

} // namespace optimization
} // namespace helio

#endif // HELIOSTRATEGY_INITIAL_POPULATION_H
