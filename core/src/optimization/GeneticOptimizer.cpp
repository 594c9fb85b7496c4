#include "optimization/GeneticOptimizer.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numeric>
#include <sstream>

namespace helio {
namespace optimization {

namespace {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

double parse_number(const std::string& text, const std::string& entry) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the precondition error below
    }
    throw PreconditionError("Malformed stopping criterion: " + entry);
}

} // anonymous namespace

// ============================================================================
// Settings
// ============================================================================

ParentSelection parse_parent_selection(const std::string& name) {
    if (name == "sss") return ParentSelection::SteadyState;
    if (name == "tournament") return ParentSelection::Tournament;
    if (name == "rws") return ParentSelection::RouletteWheel;
    if (name == "rank") return ParentSelection::Rank;
    throw PreconditionError("Unknown parent selection type: " + name);
}

CrossoverType parse_crossover_type(const std::string& name) {
    if (name == "single_point") return CrossoverType::SinglePoint;
    if (name == "two_points") return CrossoverType::TwoPoints;
    if (name == "uniform") return CrossoverType::Uniform;
    if (name == "scattered") return CrossoverType::Scattered;
    throw PreconditionError("Unknown crossover type: " + name);
}

MutationType parse_mutation_type(const std::string& name) {
    if (name == "random") return MutationType::Random;
    if (name == "perturb") return MutationType::Perturb;
    throw PreconditionError("Unknown mutation type: " + name);
}

FailurePolicy parse_failure_policy(const std::string& name) {
    if (name == "raise") return FailurePolicy::Raise;
    if (name == "negative_infinity") return FailurePolicy::NegativeInfinity;
    throw PreconditionError("Unknown failure policy: " + name);
}

std::vector<StoppingCriterion> parse_stopping_criteria(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');

    std::vector<StoppingCriterion> criteria;
    std::istringstream stream(normalized);
    std::string entry;
    while (stream >> entry) {
        StoppingCriterion c;
        if (starts_with(entry, "saturate_")) {
            c.kind = StoppingCriterion::Kind::Saturate;
            c.value = parse_number(entry.substr(9), entry);
            if (c.value < 1.0 || c.value != std::floor(c.value)) {
                throw PreconditionError("Saturation needs a positive whole number of generations: " + entry);
            }
        } else if (starts_with(entry, "reach_")) {
            c.kind = StoppingCriterion::Kind::Reach;
            c.value = parse_number(entry.substr(6), entry);
        } else {
            throw PreconditionError("Malformed stopping criterion: " + entry);
        }
        criteria.push_back(c);
    }
    return criteria;
}

void GeneticSettings::validate() const {
    if (population_size < 2) {
        throw PreconditionError("Population needs at least two individuals");
    }
    if (num_parents < 1 || num_parents > population_size) {
        throw PreconditionError("num_parents must lie in [1, population_size]");
    }
    if (k_tournament < 1) {
        throw PreconditionError("k_tournament must be at least 1");
    }
    if (elitism > population_size) {
        throw PreconditionError("elitism cannot exceed population_size");
    }
    if (mutation_percent < 0.0 || mutation_percent > 100.0) {
        throw PreconditionError("mutation_percent must lie in [0, 100]");
    }
    if (max_mutation < 0.0) {
        throw PreconditionError("max_mutation must be non-negative");
    }
}

GeneticSettings GeneticSettings::from_yaml(const YAML::Node& node) {
    GeneticSettings s;
    if (!node || !node.IsMap()) {
        return s;
    }
    if (node["population_size"]) s.population_size = node["population_size"].as<std::size_t>();
    if (node["parent_selection_type"]) {
        s.parent_selection = parse_parent_selection(node["parent_selection_type"].as<std::string>());
    }
    if (node["generation_limit"]) s.generation_limit = node["generation_limit"].as<std::size_t>();
    if (node["num_parents"]) s.num_parents = node["num_parents"].as<std::size_t>();
    if (node["k_tournament"]) s.k_tournament = node["k_tournament"].as<std::size_t>();
    if (node["crossover_type"]) {
        s.crossover = parse_crossover_type(node["crossover_type"].as<std::string>());
    }
    if (node["elitism"]) s.elitism = node["elitism"].as<std::size_t>();
    if (node["mutation_type"]) {
        s.mutation = parse_mutation_type(node["mutation_type"].as<std::string>());
    }
    if (node["mutation_percent"]) s.mutation_percent = node["mutation_percent"].as<double>();
    if (node["max_mutation"]) s.max_mutation = node["max_mutation"].as<double>();

    const YAML::Node stopping = node["stopping_criteria"];
    if (stopping && stopping.IsSequence()) {
        for (const auto& entry : stopping) {
            auto parsed = parse_stopping_criteria(entry.as<std::string>());
            s.stopping_criteria.insert(s.stopping_criteria.end(), parsed.begin(), parsed.end());
        }
    } else if (stopping && !stopping.IsNull()) {
        s.stopping_criteria = parse_stopping_criteria(stopping.as<std::string>());
    }

    if (node["failure_policy"]) {
        s.failure_policy = parse_failure_policy(node["failure_policy"].as<std::string>());
    }
    if (node["seed"]) s.seed = node["seed"].as<std::uint64_t>();
    if (node["num_threads"]) s.num_threads = node["num_threads"].as<std::size_t>();
    return s;
}

GeneticSettings GeneticSettings::from_config(const ConfigManager& config) {
    return from_yaml(config.get_section("optimization"));
}

// ============================================================================
// Optimizer
// ============================================================================

GeneticOptimizer::GeneticOptimizer(FitnessFunction fitness, InputBounds bounds, GeneticSettings settings)
    : fitness_(std::move(fitness))
    , bounds_(std::move(bounds))
    , settings_(std::move(settings))
    , rng_(settings_.seed) {
    if (!fitness_) {
        throw PreconditionError("GeneticOptimizer requires a fitness function");
    }
    settings_.validate();
    if (settings_.num_threads != 1) {
        pool_ = std::make_unique<ThreadPool>(settings_.num_threads);
    }
}

void GeneticOptimizer::set_initial_population(std::vector<std::vector<double>> population) {
    if (population.size() > settings_.population_size) {
        throw PreconditionError("Seeded population has " + std::to_string(population.size()) +
                                " individuals but population_size is " +
                                std::to_string(settings_.population_size));
    }
    for (auto& genes : population) {
        bounds_.clamp(genes);
    }
    seeded_population_ = std::move(population);
}

std::vector<std::vector<double>> GeneticOptimizer::initial_population() {
    std::vector<std::vector<double>> population = seeded_population_;
    while (population.size() < settings_.population_size) {
        std::vector<double> genes(bounds_.size());
        for (std::size_t g = 0; g < genes.size(); ++g) {
            const Bound& b = bounds_.bound(g);
            std::uniform_real_distribution<double> dist(b.low, b.high);
            genes[g] = dist(rng_);
        }
        population.push_back(std::move(genes));
    }
    return population;
}

void GeneticOptimizer::evaluate(std::vector<Individual>& population, std::size_t first_pending) {
    std::vector<std::string> failures;

    auto store = [&](std::size_t i, double value) {
        population[i].fitness = std::isnan(value) ? NEG_INF : value;
    };
    auto fail = [&](std::size_t i, const std::exception& e) {
        failures.push_back("individual " + std::to_string(i) + ": " + e.what());
        population[i].fitness = NEG_INF;
    };

    const std::size_t pending = population.size() - first_pending;
    std::vector<double> values(pending, NEG_INF);
    auto evaluate_one = [&](std::size_t k) { values[k] = fitness_(population[first_pending + k].genes); };

    std::vector<std::exception_ptr> errors(pending);
    if (pool_) {
        errors = pool_->parallel_for(pending, evaluate_one);
    } else {
        for (std::size_t k = 0; k < pending; ++k) {
            try {
                evaluate_one(k);
            } catch (...) {
                errors[k] = std::current_exception();
            }
        }
    }

    for (std::size_t k = 0; k < pending; ++k) {
        const std::size_t i = first_pending + k;
        if (!errors[k]) {
            store(i, values[k]);
            continue;
        }
        try {
            std::rethrow_exception(errors[k]);
        } catch (const std::exception& e) {
            fail(i, e);
        }
    }

    if (!failures.empty() && settings_.failure_policy == FailurePolicy::Raise) {
        throw EvaluationError(std::move(failures));
    }
}

void GeneticOptimizer::record_generation(std::size_t generation) {
    GenerationReport report;
    report.generation = generation;
    report.best_fitness = NEG_INF;

    bool improved = false;
    double sum = 0.0;
    std::size_t finite = 0;
    for (std::size_t i = 0; i < population_.size(); ++i) {
        const double f = population_[i].fitness;
        report.best_fitness = std::max(report.best_fitness, f);
        if (std::isfinite(f)) {
            sum += f;
            ++finite;
        }
        if (!has_best_ || f > best_.fitness) {
            improved = improved || has_best_;
            has_best_ = true;
            best_.genes = population_[i].genes;
            best_.fitness = f;
            best_.index = i;
        }
    }
    report.best_so_far = best_.fitness;
    report.mean_fitness = finite > 0 ? sum / static_cast<double>(finite) : NEG_INF;

    // Diversity: mean over genes of the population standard deviation of that gene
    const std::size_t n_genes = bounds_.size();
    double sum_sd = 0.0;
    for (std::size_t g = 0; g < n_genes; ++g) {
        double mean = 0.0;
        for (const auto& ind : population_) mean += ind.genes[g];
        mean /= static_cast<double>(population_.size());
        double sq = 0.0;
        for (const auto& ind : population_) sq += (ind.genes[g] - mean) * (ind.genes[g] - mean);
        sum_sd += std::sqrt(sq / static_cast<double>(population_.size()));
    }
    report.diversity = n_genes > 0 ? sum_sd / static_cast<double>(n_genes) : 0.0;

    if (generation > 0) {
        stale_generations_ = improved ? 0 : stale_generations_ + 1;
    }

    reports_.push_back(report);
    if (callback_) {
        callback_(report);
    }
}

bool GeneticOptimizer::should_stop() const {
    if (stop_requested_.load()) {
        return true;
    }
    for (const auto& c : settings_.stopping_criteria) {
        if (c.kind == StoppingCriterion::Kind::Reach && best_.fitness >= c.value) {
            return true;
        }
        if (c.kind == StoppingCriterion::Kind::Saturate &&
            static_cast<double>(stale_generations_) >= c.value) {
            return true;
        }
    }
    return false;
}

BestSolution GeneticOptimizer::run() {
    stopped_by_request_ = false;
    rng_.seed(settings_.seed);
    population_.clear();
    reports_.clear();
    has_best_ = false;
    best_ = BestSolution();
    generations_completed_ = 0;
    stale_generations_ = 0;

    std::vector<Individual> population;
    for (auto& genes : initial_population()) {
        Individual ind;
        ind.genes = std::move(genes);
        population.push_back(std::move(ind));
    }
    evaluate(population, 0);
    population_ = std::move(population);
    record_generation(0);

    while (generations_completed_ < settings_.generation_limit && !should_stop()) {
        std::vector<Individual> next;
        next.reserve(settings_.population_size);

        // Elites carry their fitness and are not re-evaluated
        const std::vector<std::size_t> ranked = ranked_indices();
        for (std::size_t e = 0; e < settings_.elitism; ++e) {
            next.push_back(population_[ranked[e]]);
        }
        const std::size_t first_pending = next.size();

        const std::vector<std::size_t> parents = select_parents();
        for (std::size_t k = 0; next.size() < settings_.population_size; ++k) {
            const auto& a = population_[parents[k % parents.size()]].genes;
            const auto& b = population_[parents[(k + 1) % parents.size()]].genes;
            Individual child;
            child.genes = crossover(a, b);
            mutate(child.genes);
            next.push_back(std::move(child));
        }

        evaluate(next, first_pending);
        population_ = std::move(next);
        ++generations_completed_;
        record_generation(generations_completed_);
    }

    stopped_by_request_ = stop_requested_.exchange(false);
    return best_;
}

BestSolution GeneticOptimizer::best_solution() const {
    if (!has_best_) {
        throw PrematureDataRecoveryError("best_solution() requested before any population was evaluated");
    }
    return best_;
}

std::vector<double> GeneticOptimizer::diversity() const {
    std::vector<double> values;
    values.reserve(reports_.size());
    for (const auto& r : reports_) {
        values.push_back(r.diversity);
    }
    return values;
}

// ============================================================================
// Genetic operators
// ============================================================================

std::vector<std::size_t> GeneticOptimizer::ranked_indices() const {
    std::vector<std::size_t> order(population_.size());
    std::iota(order.begin(), order.end(), 0);
    // Stable: equal fitness keeps population order
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return population_[a].fitness > population_[b].fitness;
    });
    return order;
}

std::size_t GeneticOptimizer::spin_wheel(const std::vector<double>& weights) {
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        std::uniform_int_distribution<std::size_t> pick(0, weights.size() - 1);
        return pick(rng_);
    }
    std::uniform_real_distribution<double> dist(0.0, total);
    const double target = dist(rng_);
    double cumulative = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        cumulative += weights[i];
        if (target < cumulative) {
            return i;
        }
    }
    // Rounding can leave target at the very top; the last non-zero weight owns it
    for (std::size_t i = weights.size(); i-- > 0;) {
        if (weights[i] > 0.0) return i;
    }
    return weights.size() - 1;
}

std::vector<std::size_t> GeneticOptimizer::select_parents() {
    const std::size_t n = population_.size();
    std::vector<std::size_t> parents;
    parents.reserve(settings_.num_parents);

    switch (settings_.parent_selection) {
        case ParentSelection::SteadyState: {
            const auto ranked = ranked_indices();
            parents.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(settings_.num_parents));
            break;
        }
        case ParentSelection::Tournament: {
            std::uniform_int_distribution<std::size_t> pick(0, n - 1);
            for (std::size_t p = 0; p < settings_.num_parents; ++p) {
                std::size_t winner = pick(rng_);
                for (std::size_t k = 1; k < settings_.k_tournament; ++k) {
                    const std::size_t challenger = pick(rng_);
                    const double fc = population_[challenger].fitness;
                    const double fw = population_[winner].fitness;
                    if (fc > fw || (fc == fw && challenger < winner)) {
                        winner = challenger;
                    }
                }
                parents.push_back(winner);
            }
            break;
        }
        case ParentSelection::RouletteWheel: {
            // Shift so the worst finite individual still has a small share
            double lowest = std::numeric_limits<double>::infinity();
            double highest = NEG_INF;
            for (const auto& ind : population_) {
                if (std::isfinite(ind.fitness)) {
                    lowest = std::min(lowest, ind.fitness);
                    highest = std::max(highest, ind.fitness);
                }
            }
            const double floor_share = std::isfinite(lowest)
                ? std::max(1e-9, 1e-6 * (highest - lowest)) : 0.0;
            std::vector<double> weights(n, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                if (std::isfinite(population_[i].fitness)) {
                    weights[i] = population_[i].fitness - lowest + floor_share;
                }
            }
            for (std::size_t p = 0; p < settings_.num_parents; ++p) {
                parents.push_back(spin_wheel(weights));
            }
            break;
        }
        case ParentSelection::Rank: {
            const auto ranked = ranked_indices();
            std::vector<double> weights(n, 0.0);
            for (std::size_t r = 0; r < n; ++r) {
                weights[ranked[r]] = static_cast<double>(n - r);
            }
            for (std::size_t p = 0; p < settings_.num_parents; ++p) {
                parents.push_back(spin_wheel(weights));
            }
            break;
        }
    }
    return parents;
}

std::vector<double> GeneticOptimizer::crossover(const std::vector<double>& a, const std::vector<double>& b) {
    const std::size_t length = a.size();
    std::vector<double> child = a;
    if (length < 2) {
        return child;
    }

    switch (settings_.crossover) {
        case CrossoverType::SinglePoint: {
            std::uniform_int_distribution<std::size_t> cut_dist(1, length - 1);
            const std::size_t cut = cut_dist(rng_);
            std::copy(b.begin() + static_cast<std::ptrdiff_t>(cut), b.end(),
                      child.begin() + static_cast<std::ptrdiff_t>(cut));
            break;
        }
        case CrossoverType::TwoPoints: {
            if (length < 3) {
                child[1] = b[1];
                break;
            }
            std::uniform_int_distribution<std::size_t> first_dist(1, length - 2);
            const std::size_t first = first_dist(rng_);
            std::uniform_int_distribution<std::size_t> second_dist(first + 1, length - 1);
            const std::size_t second = second_dist(rng_);
            std::copy(b.begin() + static_cast<std::ptrdiff_t>(first),
                      b.begin() + static_cast<std::ptrdiff_t>(second),
                      child.begin() + static_cast<std::ptrdiff_t>(first));
            break;
        }
        case CrossoverType::Uniform: {
            std::bernoulli_distribution coin(0.5);
            for (std::size_t g = 0; g < length; ++g) {
                if (coin(rng_)) child[g] = b[g];
            }
            break;
        }
        case CrossoverType::Scattered: {
            std::vector<std::size_t> genes(length);
            std::iota(genes.begin(), genes.end(), 0);
            std::uniform_int_distribution<std::size_t> count_dist(0, length);
            const std::size_t count = count_dist(rng_);
            for (std::size_t k = 0; k < count; ++k) {
                std::uniform_int_distribution<std::size_t> pick(k, length - 1);
                std::swap(genes[k], genes[pick(rng_)]);
                child[genes[k]] = b[genes[k]];
            }
            break;
        }
    }
    return child;
}

void GeneticOptimizer::mutate(std::vector<double>& genes) {
    const std::size_t length = genes.size();
    if (length == 0 || settings_.mutation_percent <= 0.0) {
        return;
    }
    std::size_t count = static_cast<std::size_t>(
        std::lround(settings_.mutation_percent / 100.0 * static_cast<double>(length)));
    count = std::min(std::max<std::size_t>(count, 1), length);

    // Partial Fisher-Yates picks count distinct genes
    std::vector<std::size_t> order(length);
    std::iota(order.begin(), order.end(), 0);
    for (std::size_t k = 0; k < count; ++k) {
        std::uniform_int_distribution<std::size_t> pick(k, length - 1);
        std::swap(order[k], order[pick(rng_)]);

        const std::size_t g = order[k];
        const Bound& b = bounds_.bound(g);
        if (settings_.mutation == MutationType::Random) {
            std::uniform_real_distribution<double> dist(b.low, b.high);
            genes[g] = dist(rng_);
        } else {
            std::uniform_real_distribution<double> delta(-settings_.max_mutation, settings_.max_mutation);
            genes[g] = bounds_.clamp(g, genes[g] + delta(rng_));
        }
    }
}

} // namespace optimization
} // namespace helio
