#include "genetic.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "../utils/log.h"
#include "analytics.h"

namespace sc {
namespace optimizer {

namespace {
constexpr f64 FITNESS_EPSILON = 1e-12;
constexpr int MIN_POPULATION = 20;
constexpr int MAX_POPULATION = 200;

usize fittestIndex(const std::vector<Individual>& population) {
    usize best = 0;
    for (usize i = 1; i < population.size(); ++i) {
        if (population[i].eval.fitness < population[best].eval.fitness) {
            best = i;
        }
    }
    return best;
}

GenerationStats statsOf(int generation, const std::vector<Individual>& population, f64 best) {
    GenerationStats stats;
    stats.generation = generation;
    stats.bestFitness = best;
    f64 sum = 0.0;
    for (const auto& individual : population) {
        sum += individual.eval.fitness;
    }
    stats.averageFitness = population.empty() ? 0.0 : sum / static_cast<f64>(population.size());
    stats.diversity = populationDiversity(population);
    return stats;
}

} // namespace

// ----------------------------------------------------------------------------
// LayoutDecoder

LayoutDecoder::LayoutDecoder(const std::vector<CutItem>& items, std::vector<UnitRequest> requests,
                             const std::vector<StockOption>& stock, const CuttingParams& cutting)
    : m_items(items), m_requests(std::move(requests)), m_stock(stock), m_cutting(cutting) {}

BarArena LayoutDecoder::decode(const Genome& genome) const {
    BarArena arena(m_items, m_stock, m_cutting);
    for (int index : genome) {
        arena.place(m_requests[static_cast<usize>(index)], FitRule::FirstFit);
    }
    if (m_cutting.rightSizeStock) {
        arena.rightSize();
    }
    return arena;
}

Genome LayoutDecoder::decreasingOrder() const {
    Genome order(m_requests.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
        return m_requests[static_cast<usize>(a)].length > m_requests[static_cast<usize>(b)].length;
    });
    return order;
}

Millimeters LayoutDecoder::demand() const {
    Millimeters total = 0.0;
    for (const auto& request : m_requests) {
        total += request.length;
    }
    return total;
}

int LayoutDecoder::barLowerBound() const {
    Millimeters longest = 0.0;
    for (const auto& option : m_stock) {
        longest = std::max(longest, option.stockLength - m_cutting.trimLoss());
    }
    if (longest <= 0.0 || m_requests.empty()) {
        return 1;
    }
    Millimeters content = demand() + m_cutting.kerf * static_cast<f64>(m_requests.size());
    return std::max(1, static_cast<int>(std::ceil(content / longest - 1e-9)));
}

// ----------------------------------------------------------------------------
// FitnessModel

FitnessModel::FitnessModel(const FitnessWeights& weights, const CostRates& rates,
                           const TimeModel& time, const WastePolicy& policy)
    : m_weights(weights), m_rates(rates), m_time(time), m_policy(policy) {}

void FitnessModel::calibrate(const LayoutDecoder& decoder) {
    m_demand = std::max(decoder.demand(), 1.0);
    m_lowerBound = static_cast<f64>(decoder.barLowerBound());

    BarArena reference = decoder.decode(decoder.decreasingOrder());
    CostBreakdown cost =
        computeCost(quantitiesOf(reference.measure(m_policy)), m_rates, m_time);
    m_referenceCost = cost.totalCost > 0.0 ? cost.totalCost : 1.0;
}

Evaluation FitnessModel::evaluate(const BarArena& layout) const {
    return evaluate(layout.measure(m_policy));
}

Evaluation FitnessModel::evaluate(const LayoutMetrics& metrics) const {
    CostBreakdown cost = computeCost(quantitiesOf(metrics), m_rates, m_time);

    Evaluation eval;
    eval.objectives.waste = metrics.waste;
    eval.objectives.cost = cost.totalCost;
    eval.objectives.barCount = static_cast<f64>(metrics.bars);
    eval.fitness = m_weights.waste * metrics.waste / m_demand +
                   m_weights.barCount * static_cast<f64>(metrics.bars) / m_lowerBound +
                   m_weights.cost * cost.totalCost / m_referenceCost -
                   m_weights.reclaimBonus * metrics.reclaimable / m_demand;
    return eval;
}

// ----------------------------------------------------------------------------
// Operators

std::pair<Genome, Genome> orderCrossover(const Genome& a, const Genome& b, Rng& rng) {
    const usize n = a.size();
    if (n < 2) {
        return {a, b};
    }

    usize first = rng.uniformIndex(n);
    usize last = rng.uniformIndex(n);
    if (first > last) {
        std::swap(first, last);
    }

    auto makeChild = [&](const Genome& keep, const Genome& other) {
        Genome child(n, -1);
        std::vector<bool> taken(n, false);
        for (usize i = first; i <= last; ++i) {
            child[i] = keep[i];
            taken[static_cast<usize>(keep[i])] = true;
        }
        usize write = (last + 1) % n;
        for (usize k = 0; k < n; ++k) {
            int gene = other[(last + 1 + k) % n];
            if (taken[static_cast<usize>(gene)]) {
                continue;
            }
            child[write] = gene;
            taken[static_cast<usize>(gene)] = true;
            write = (write + 1) % n;
        }
        return child;
    };

    return {makeChild(a, b), makeChild(b, a)};
}

void swapMutation(Genome& genome, Rng& rng) {
    if (genome.size() < 2) {
        return;
    }
    usize i = rng.uniformIndex(genome.size());
    usize j = rng.uniformIndex(genome.size());
    std::swap(genome[i], genome[j]);
}

void segmentShuffleMutation(Genome& genome, Rng& rng) {
    if (genome.size() < 2) {
        return;
    }
    usize first = rng.uniformIndex(genome.size());
    usize last = rng.uniformIndex(genome.size());
    if (first > last) {
        std::swap(first, last);
    }
    auto begin = genome.begin() + static_cast<std::ptrdiff_t>(first);
    auto end = genome.begin() + static_cast<std::ptrdiff_t>(last) + 1;
    rng.shuffle(begin, end);
}

void mutate(Genome& genome, Rng& rng) {
    if (rng.chance(0.5)) {
        swapMutation(genome, rng);
    } else {
        segmentShuffleMutation(genome, rng);
    }
}

usize tournamentSelect(const std::vector<Individual>& population, int size, Rng& rng) {
    usize best = rng.uniformIndex(population.size());
    for (int round = 1; round < size; ++round) {
        usize contender = rng.uniformIndex(population.size());
        const f64 a = population[contender].eval.fitness;
        const f64 b = population[best].eval.fitness;
        if (a < b || (a == b && contender < best)) {
            best = contender;
        }
    }
    return best;
}

f64 populationDiversity(const std::vector<Individual>& population) {
    if (population.empty()) {
        return 0.0;
    }
    std::vector<f64> values;
    values.reserve(population.size());
    for (const auto& individual : population) {
        values.push_back(individual.eval.fitness);
    }
    std::sort(values.begin(), values.end());
    usize distinct = 1;
    for (usize i = 1; i < values.size(); ++i) {
        if (values[i] - values[i - 1] > FITNESS_EPSILON) {
            distinct++;
        }
    }
    return static_cast<f64>(distinct) / static_cast<f64>(population.size());
}

int defaultPopulationSize(usize units) {
    usize size = units * 2;
    return static_cast<int>(
        std::clamp(size, static_cast<usize>(MIN_POPULATION), static_cast<usize>(MAX_POPULATION)));
}

// ----------------------------------------------------------------------------
// PopulationEvaluator

PopulationEvaluator::PopulationEvaluator(const LayoutDecoder& decoder, const FitnessModel& model,
                                         int threads)
    : m_decoder(decoder), m_model(model) {
    usize count = resolveThreadCount(threads);
    if (count > 1) {
        m_pool = std::make_unique<ThreadPool>(count);
    }
}

void PopulationEvaluator::evaluate(std::vector<Individual>& population) {
    if (!m_pool) {
        for (auto& individual : population) {
            if (!individual.evaluated) {
                individual.eval = m_model.evaluate(m_decoder.decode(individual.genome));
                individual.evaluated = true;
                m_evaluations++;
            }
        }
        return;
    }

    std::vector<Individual*> slots;
    for (auto& individual : population) {
        if (!individual.evaluated) {
            slots.push_back(&individual);
        }
    }
    m_pool->runAll(slots.size(), [this, &slots](usize i) {
        slots[i]->eval = m_model.evaluate(m_decoder.decode(slots[i]->genome));
        slots[i]->evaluated = true;
    });
    m_evaluations += static_cast<int>(slots.size());
}

std::vector<Individual> seedPopulation(const LayoutDecoder& decoder, int size, Rng& rng) {
    std::vector<Individual> population;
    population.reserve(static_cast<usize>(size));

    Individual seeded;
    seeded.genome = decoder.decreasingOrder();
    population.push_back(seeded);

    Genome identity(decoder.size());
    std::iota(identity.begin(), identity.end(), 0);
    while (static_cast<int>(population.size()) < size) {
        Individual random;
        random.genome = identity;
        rng.shuffle(random.genome.begin(), random.genome.end());
        population.push_back(std::move(random));
    }
    return population;
}

// ----------------------------------------------------------------------------
// Search loop

SearchResult runGeneticSearch(const LayoutDecoder& decoder, const FitnessModel& model,
                              const GeneticParams& params, u64 seed, const RunControl& control) {
    Rng rng(seed);
    const int populationSize =
        params.populationSize.value_or(defaultPopulationSize(decoder.size()));
    const int elites = std::min(params.eliteCount, populationSize - 1);

    PopulationEvaluator evaluator(decoder, model, params.evaluationThreads);
    std::vector<Individual> population = seedPopulation(decoder, populationSize, rng);
    evaluator.evaluate(population);

    SearchResult result;
    result.best = population[fittestIndex(population)];
    result.telemetry.populationSize = populationSize;
    result.telemetry.initialFitness = population.front().eval.fitness;
    result.telemetry.history.push_back(statsOf(0, population, result.best.eval.fitness));

    int generation = 0;
    int stall = 0;
    ConvergenceReason reason = ConvergenceReason::MaxGenerations;

    while (true) {
        if (generation >= params.maxGenerations) {
            reason = ConvergenceReason::MaxGenerations;
            break;
        }
        control.throwIfCancelled("genetic search");
        if (control.deadline.expired()) {
            reason = ConvergenceReason::TimeBudget;
            break;
        }

        std::vector<usize> ranked(population.size());
        std::iota(ranked.begin(), ranked.end(), 0);
        std::stable_sort(ranked.begin(), ranked.end(), [&](usize a, usize b) {
            return population[a].eval.fitness < population[b].eval.fitness;
        });

        std::vector<Individual> next;
        next.reserve(population.size());
        for (int e = 0; e < elites; ++e) {
            next.push_back(population[ranked[static_cast<usize>(e)]]);
        }

        while (static_cast<int>(next.size()) < populationSize) {
            const Individual& mother =
                population[tournamentSelect(population, params.tournamentSize, rng)];
            const Individual& father =
                population[tournamentSelect(population, params.tournamentSize, rng)];

            std::pair<Genome, Genome> children;
            if (rng.chance(params.crossoverRate)) {
                children = orderCrossover(mother.genome, father.genome, rng);
            } else {
                children = {mother.genome, father.genome};
            }

            for (Genome* genome : {&children.first, &children.second}) {
                if (static_cast<int>(next.size()) >= populationSize) {
                    break;
                }
                if (rng.chance(params.mutationRate)) {
                    mutate(*genome, rng);
                }
                Individual child;
                child.genome = std::move(*genome);
                next.push_back(std::move(child));
            }
        }

        evaluator.evaluate(next);
        population = std::move(next);
        generation++;

        const Individual& leader = population[fittestIndex(population)];
        if (leader.eval.fitness < result.best.eval.fitness - FITNESS_EPSILON) {
            result.best = leader;
            stall = 0;
        } else {
            stall++;
        }
        result.telemetry.history.push_back(
            statsOf(generation, population, result.best.eval.fitness));

        if (params.plateauGenerations > 0 && stall >= params.plateauGenerations) {
            reason = ConvergenceReason::FitnessPlateau;
            break;
        }
    }

    result.telemetry.generations = generation;
    result.telemetry.evaluations = evaluator.evaluations();
    result.telemetry.bestFitness = result.best.eval.fitness;
    result.telemetry.convergenceReason = reason;
    return result;
}

// ----------------------------------------------------------------------------
// GeneticOptimizer

GeneticOptimizer::GeneticOptimizer(const AlgorithmConfig& config) : CutOptimizer(config) {
    if (const auto* params = std::get_if<GeneticParams>(&config.strategy)) {
        m_params = *params;
    }
}

GeneticOptimizer::GeneticOptimizer(const AlgorithmConfig& config, const GeneticParams& params)
    : CutOptimizer(config), m_params(params) {}

StrategyOutcome GeneticOptimizer::optimize(const ProfileProblem& problem,
                                           const RunControl& control) {
    LayoutDecoder decoder(*problem.items, expandItems(*problem.items, problem.itemIndices),
                          problem.stock, m_config.cutting);
    FitnessModel model(m_params.weights, m_config.cost, m_config.time, m_config.waste);
    model.calibrate(decoder);

    SearchResult search = runGeneticSearch(decoder, model, m_params, problem.seed, control);

    log::infof("Genetic", "%s: %d generations, population %d, fitness %.4f -> %.4f (%s)",
               problem.profileType.c_str(), search.telemetry.generations,
               search.telemetry.populationSize, search.telemetry.initialFitness,
               search.telemetry.bestFitness,
               convergenceReasonLabel(search.telemetry.convergenceReason));

    StrategyOutcome outcome;
    outcome.cuts =
        decoder.decode(search.best.genome).buildCuts(problem.profileType, m_config.waste);
    outcome.telemetry = std::move(search.telemetry);
    return outcome;
}

} // namespace optimizer
} // namespace sc
