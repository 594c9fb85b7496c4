#ifndef HELIOSTRATEGY_GENETIC_OPTIMIZER_H
#define HELIOSTRATEGY_GENETIC_OPTIMIZER_H

#include "optimization/InputBounds.h"
#include "utils/ConfigManager.h"
#include "utils/ThreadPool.h"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace helio {
namespace optimization {

enum class ParentSelection {
    SteadyState,     ///< "sss": the fittest num_parents individuals
    Tournament,      ///< "tournament": best of k_tournament random draws
    RouletteWheel,   ///< "rws": fitness-proportional
    Rank             ///< "rank": proportional to fitness rank
};

enum class CrossoverType {
    SinglePoint,     ///< "single_point"
    TwoPoints,       ///< "two_points"
    Uniform,         ///< "uniform": independent coin flip per gene
    Scattered        ///< "scattered": a random-sized random subset of genes from parent B
};

enum class MutationType {
    Random,          ///< Replace with a uniform value in the gene's bound
    Perturb          ///< Add a uniform delta in [-max_mutation, max_mutation]
};

/**
 * @brief What a failed fitness evaluation does to the generation.
 */
enum class FailurePolicy {
    Raise,             ///< Finish the generation, then throw EvaluationError with every failure
    NegativeInfinity   ///< Score the individual -inf and carry on
};

ParentSelection parse_parent_selection(const std::string& name);
CrossoverType parse_crossover_type(const std::string& name);
MutationType parse_mutation_type(const std::string& name);
FailurePolicy parse_failure_policy(const std::string& name);

/**
 * @brief Early stopping rule.
 *
 * "saturate_N" stops once the best fitness has not improved for N
 * consecutive generations; "reach_X" stops once the best fitness is >= X.
 */
struct StoppingCriterion {
    enum class Kind { Saturate, Reach };

    Kind kind = Kind::Saturate;
    double value = 0.0;
};

/**
 * @brief Parse a whitespace or comma separated list such as "saturate_10 reach_4.5".
 * An empty string yields no criteria.
 * @throws PreconditionError on a malformed entry.
 */
std::vector<StoppingCriterion> parse_stopping_criteria(const std::string& text);

/**
 * @brief Hyperparameters of one optimization run.
 */
struct GeneticSettings {
    std::size_t population_size = 20;
    ParentSelection parent_selection = ParentSelection::SteadyState;
    std::size_t generation_limit = 10;
    std::size_t num_parents = 8;
    std::size_t k_tournament = 3;
    CrossoverType crossover = CrossoverType::SinglePoint;
    std::size_t elitism = 1;
    MutationType mutation = MutationType::Random;
    double mutation_percent = 10.0;
    double max_mutation = 1.0;
    std::vector<StoppingCriterion> stopping_criteria;
    FailurePolicy failure_policy = FailurePolicy::Raise;
    std::uint64_t seed = 0;
    std::size_t num_threads = 0;      ///< 0 = hardware concurrency, 1 = evaluate inline

    /**
     * @throws PreconditionError if the combination is unusable.
     */
    void validate() const;

    /**
     * @brief Read settings from an "optimization" YAML map; missing keys keep their defaults.
     * @throws PreconditionError on unknown enum names.
     */
    static GeneticSettings from_yaml(const YAML::Node& node);

    /**
     * @brief Read the "optimization" section of simulation.yaml.
     */
    static GeneticSettings from_config(const ConfigManager& config = ConfigManager::instance());
};

struct Individual {
    std::vector<double> genes;
    double fitness = 0.0;
};

/**
 * @brief Statistics of one evaluated population. Generation 0 is the initial population.
 */
struct GenerationReport {
    std::size_t generation = 0;
    double best_fitness = 0.0;        ///< Best of this population
    double best_so_far = 0.0;         ///< Best across every population so far
    double mean_fitness = 0.0;        ///< Over individuals with finite fitness
    double diversity = 0.0;           ///< Mean per-gene standard deviation
};

struct BestSolution {
    std::vector<double> genes;
    double fitness = 0.0;
    std::size_t index = 0;            ///< Population index at the time it was found
};

/**
 * @brief Genetic algorithm maximizing a black-box fitness over bounded genes.
 *
 * All random decisions are drawn on the calling thread from one seeded
 * engine, so a fixed seed replays the same populations regardless of how
 * many threads evaluate fitness.
 */
class GeneticOptimizer {
public:
    using FitnessFunction = std::function<double(const std::vector<double>&)>;
    using GenerationCallback = std::function<void(const GenerationReport&)>;

    /**
     * @param fitness Must be safe to call concurrently when num_threads != 1.
     * @throws PreconditionError on empty fitness or invalid settings.
     */
    GeneticOptimizer(FitnessFunction fitness, InputBounds bounds, GeneticSettings settings);

    /**
     * @brief Seed the first population. Missing individuals are drawn uniformly.
     *
     * Genes are clamped to their bounds.
     * @throws PreconditionError on wrong gene count or more individuals than population_size.
     */
    void set_initial_population(std::vector<std::vector<double>> population);

    void set_generation_callback(GenerationCallback callback) { callback_ = std::move(callback); }

    /**
     * @brief Evolve until the generation limit, a stopping criterion or a stop request.
     *
     * Starts again from the initial population. A stop requested before the
     * call is honoured once generation 0 has been evaluated; the request is
     * consumed when run() returns.
     * @return The best solution found.
     * @throws EvaluationError under FailurePolicy::Raise when any evaluation fails.
     */
    BestSolution run();

    /**
     * @brief Ask a running optimization to stop after the current evaluation. Thread-safe.
     */
    void request_stop() { stop_requested_.store(true); }
    bool stop_requested() const { return stop_requested_.load(); }

    /**
     * @brief Whether the last run() ended because of request_stop().
     */
    bool stopped_by_request() const { return stopped_by_request_; }

    /**
     * @throws PrematureDataRecoveryError before the first population has been evaluated.
     */
    BestSolution best_solution() const;

    std::size_t generations_completed() const { return generations_completed_; }
    const std::vector<GenerationReport>& reports() const { return reports_; }

    /**
     * @brief Diversity of every evaluated population, in order.
     */
    std::vector<double> diversity() const;

    const std::vector<Individual>& population() const { return population_; }
    const InputBounds& bounds() const { return bounds_; }
    const GeneticSettings& settings() const { return settings_; }

private:
    std::vector<std::vector<double>> initial_population();
    void evaluate(std::vector<Individual>& population, std::size_t first_pending);
    void record_generation(std::size_t generation);
    bool should_stop() const;

    std::vector<std::size_t> select_parents();
    std::vector<double> crossover(const std::vector<double>& a, const std::vector<double>& b);
    void mutate(std::vector<double>& genes);
    std::vector<std::size_t> ranked_indices() const;
    std::size_t spin_wheel(const std::vector<double>& weights);

    FitnessFunction fitness_;
    InputBounds bounds_;
    GeneticSettings settings_;
    GenerationCallback callback_;
    std::unique_ptr<ThreadPool> pool_;

    std::mt19937_64 rng_;
    std::vector<std::vector<double>> seeded_population_;
    std::vector<Individual> population_;
    std::vector<GenerationReport> reports_;

    bool has_best_ = false;
    BestSolution best_;
    std::size_t generations_completed_ = 0;
    std::size_t stale_generations_ = 0;
    std::atomic<bool> stop_requested_{false};
    bool stopped_by_request_ = false;
};

} // namespace optimization
} // namespace helio

#endif // HELIOSTRATEGY_GENETIC_OPTIMIZER_H
