#include "optimization/InitialPopulation.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace helio {
namespace optimization {

namespace {

// Half-sample symmetric reflection: d c b a | a b c d | d c b a
std::size_t reflect_index(long i, long n) {
    const long period = 2 * n;
    long m = i % period;
    if (m < 0) m += period;
    return static_cast<std::size_t>(m < n ? m : period - 1 - m);
}

} // anonymous namespace

std::vector<double> gaussian_smooth(const std::vector<double>& values, double sigma) {
    if (sigma <= 0.0 || values.empty()) {
        return values;
    }

    const long radius = static_cast<long>(4.0 * sigma + 0.5);
    std::vector<double> kernel(static_cast<std::size_t>(2 * radius + 1));
    double total = 0.0;
    for (long k = -radius; k <= radius; ++k) {
        const double w = std::exp(-0.5 * static_cast<double>(k * k) / (sigma * sigma));
        kernel[static_cast<std::size_t>(k + radius)] = w;
        total += w;
    }
    for (double& w : kernel) w /= total;

    const long n = static_cast<long>(values.size());
    std::vector<double> smoothed(values.size(), 0.0);
    for (long i = 0; i < n; ++i) {
        double acc = 0.0;
        for (long k = -radius; k <= radius; ++k) {
            acc += kernel[static_cast<std::size_t>(k + radius)] * values[reflect_index(i + k, n)];
        }
        smoothed[static_cast<std::size_t>(i)] = acc;
    }
    return smoothed;
}

std::vector<std::vector<double>> generate_smoothed_population(std::size_t count,
                                                              std::size_t length,
                                                              const SmoothedPopulationSettings& settings,
                                                              const SpeedPredicate& is_valid) {
    if (!(settings.min_kmh <= settings.max_kmh) || settings.std_dev_kmh < 0.0) {
        throw PreconditionError("Smoothed population needs min_kmh <= max_kmh and a non-negative spread");
    }

    std::mt19937_64 rng(settings.seed);
    std::normal_distribution<double> noise(0.0, settings.std_dev_kmh > 0.0 ? settings.std_dev_kmh : 1.0);

    std::vector<std::vector<double>> population;
    population.reserve(count);

    const std::size_t budget = settings.max_attempts * std::max<std::size_t>(count, 1);
    std::size_t attempts = 0;
    while (population.size() < count) {
        if (attempts++ >= budget) {
            throw std::runtime_error("Generated only " + std::to_string(population.size()) + " of " +
                                     std::to_string(count) + " valid speed vectors in " +
                                     std::to_string(budget) + " attempts");
        }

        std::vector<double> raw(length);
        for (double& v : raw) {
            v = settings.std_dev_kmh > 0.0 ? noise(rng) : 0.0;
        }
        std::vector<double> speeds = gaussian_smooth(raw, settings.smoothing_sigma);
        for (double& v : speeds) {
            v += settings.mean_kmh;
            if (settings.round_to_integer) v = std::round(v);
            v = std::clamp(v, settings.min_kmh, settings.max_kmh);
        }

        if (!is_valid || is_valid(speeds)) {
            population.push_back(std::move(speeds));
        }
    }
    return population;
}

SpeedPredicate completes_without_exhaustion(const sim::SimulationModel& model) {
    return [&model](const std::vector<double>& speeds) {
        return model.simulate(speeds, false).summary().was_successful;
    };
}

} // namespace optimization
} // namespace helio
