#include "nsga2.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "../utils/log.h"

namespace sc {
namespace optimizer {

namespace {
constexpr f64 REFERENCE_POINT = 1.1;
constexpr f64 SCALAR_EPSILON = 1e-12;

f64 component(const Objectives& o, int axis) {
    switch (axis) {
    case 0:
        return o.waste;
    case 1:
        return o.cost;
    default:
        return o.barCount;
    }
}

// Rank and crowding of every individual of a population
struct Ranking {
    std::vector<int> rank;
    std::vector<f64> crowding;
    std::vector<std::vector<usize>> fronts;
};

Ranking rankPopulation(const std::vector<Individual>& population) {
    std::vector<Objectives> points;
    points.reserve(population.size());
    for (const auto& individual : population) {
        points.push_back(individual.eval.objectives);
    }

    Ranking ranking;
    ranking.rank.assign(population.size(), 0);
    ranking.crowding.assign(population.size(), 0.0);
    ranking.fronts = fastNonDominatedSort(points);
    for (usize f = 0; f < ranking.fronts.size(); ++f) {
        const auto& front = ranking.fronts[f];
        std::vector<f64> distance = crowdingDistance(points, front);
        for (usize k = 0; k < front.size(); ++k) {
            ranking.rank[front[k]] = static_cast<int>(f);
            ranking.crowding[front[k]] = distance[k];
        }
    }
    return ranking;
}

// Lower rank wins, then larger crowding, then lower index
bool crowdedBetter(const Ranking& ranking, usize a, usize b) {
    if (ranking.rank[a] != ranking.rank[b]) {
        return ranking.rank[a] < ranking.rank[b];
    }
    if (ranking.crowding[a] != ranking.crowding[b]) {
        return ranking.crowding[a] > ranking.crowding[b];
    }
    return a < b;
}

usize crowdedTournament(const Ranking& ranking, usize populationSize, int size, Rng& rng) {
    usize best = rng.uniformIndex(populationSize);
    for (int round = 1; round < size; ++round) {
        usize contender = rng.uniformIndex(populationSize);
        if (crowdedBetter(ranking, contender, best)) {
            best = contender;
        }
    }
    return best;
}

// Environmental selection: fill by front, cut the last front by crowding
std::vector<Individual> selectSurvivors(std::vector<Individual>& combined, usize size) {
    Ranking ranking = rankPopulation(combined);

    std::vector<Individual> survivors;
    survivors.reserve(size);
    for (const auto& front : ranking.fronts) {
        if (survivors.size() + front.size() <= size) {
            for (usize index : front) {
                survivors.push_back(std::move(combined[index]));
            }
            continue;
        }
        std::vector<usize> ordered = front;
        std::stable_sort(ordered.begin(), ordered.end(), [&](usize a, usize b) {
            return ranking.crowding[a] > ranking.crowding[b];
        });
        for (usize index : ordered) {
            if (survivors.size() >= size) {
                break;
            }
            survivors.push_back(std::move(combined[index]));
        }
        break;
    }
    return survivors;
}

f64 bestScalar(const std::vector<Individual>& population) {
    f64 best = std::numeric_limits<f64>::max();
    for (const auto& individual : population) {
        best = std::min(best, individual.eval.fitness);
    }
    return best;
}

} // namespace

bool dominates(const Objectives& a, const Objectives& b) {
    bool strictlyBetter = false;
    for (int axis = 0; axis < 3; ++axis) {
        f64 va = component(a, axis);
        f64 vb = component(b, axis);
        if (va > vb) {
            return false;
        }
        if (va < vb) {
            strictlyBetter = true;
        }
    }
    return strictlyBetter;
}

std::vector<std::vector<usize>> fastNonDominatedSort(const std::vector<Objectives>& points) {
    const usize n = points.size();
    std::vector<std::vector<usize>> dominated(n);
    std::vector<int> dominationCount(n, 0);
    std::vector<std::vector<usize>> fronts;

    std::vector<usize> current;
    for (usize p = 0; p < n; ++p) {
        for (usize q = 0; q < n; ++q) {
            if (p == q) {
                continue;
            }
            if (dominates(points[p], points[q])) {
                dominated[p].push_back(q);
            } else if (dominates(points[q], points[p])) {
                dominationCount[p]++;
            }
        }
        if (dominationCount[p] == 0) {
            current.push_back(p);
        }
    }

    while (!current.empty()) {
        fronts.push_back(current);
        std::vector<usize> next;
        for (usize p : current) {
            for (usize q : dominated[p]) {
                if (--dominationCount[q] == 0) {
                    next.push_back(q);
                }
            }
        }
        std::sort(next.begin(), next.end());
        current = std::move(next);
    }
    return fronts;
}

std::vector<f64> crowdingDistance(const std::vector<Objectives>& points,
                                  const std::vector<usize>& front) {
    const usize n = front.size();
    std::vector<f64> distance(n, 0.0);
    if (n <= 2) {
        std::fill(distance.begin(), distance.end(), std::numeric_limits<f64>::infinity());
        return distance;
    }

    std::vector<usize> order(n);
    for (int axis = 0; axis < 3; ++axis) {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](usize a, usize b) {
            return component(points[front[a]], axis) < component(points[front[b]], axis);
        });

        f64 low = component(points[front[order.front()]], axis);
        f64 high = component(points[front[order.back()]], axis);
        distance[order.front()] = std::numeric_limits<f64>::infinity();
        distance[order.back()] = std::numeric_limits<f64>::infinity();
        if (high - low <= 0.0) {
            continue;
        }
        for (usize k = 1; k + 1 < n; ++k) {
            f64 gap = component(points[front[order[k + 1]]], axis) -
                      component(points[front[order[k - 1]]], axis);
            distance[order[k]] += gap / (high - low);
        }
    }
    return distance;
}

std::vector<Objectives> normalizeFront(const std::vector<Objectives>& front) {
    std::vector<Objectives> normalized = front;
    if (front.empty()) {
        return normalized;
    }

    for (int axis = 0; axis < 3; ++axis) {
        f64 low = std::numeric_limits<f64>::max();
        f64 high = std::numeric_limits<f64>::lowest();
        for (const auto& point : front) {
            low = std::min(low, component(point, axis));
            high = std::max(high, component(point, axis));
        }
        f64 range = high - low;
        for (usize i = 0; i < front.size(); ++i) {
            f64 value = range > 0.0 ? (component(front[i], axis) - low) / range : 0.0;
            switch (axis) {
            case 0:
                normalized[i].waste = value;
                break;
            case 1:
                normalized[i].cost = value;
                break;
            default:
                normalized[i].barCount = value;
                break;
            }
        }
    }
    return normalized;
}

f64 hypervolume(const std::vector<Objectives>& front) {
    std::vector<Objectives> points = normalizeFront(front);
    if (points.empty()) {
        return 0.0;
    }

    // Sweep slabs along the bar-count axis; each slab is a 2D union of boxes
    std::stable_sort(points.begin(), points.end(), [](const Objectives& a, const Objectives& b) {
        return a.barCount < b.barCount;
    });

    f64 volume = 0.0;
    std::vector<Objectives> active;
    for (usize i = 0; i < points.size(); ++i) {
        active.push_back(points[i]);
        f64 top = i + 1 < points.size() ? points[i + 1].barCount : REFERENCE_POINT;
        f64 depth = top - points[i].barCount;
        if (depth <= 0.0) {
            continue;
        }

        std::vector<Objectives> slab = active;
        std::stable_sort(slab.begin(), slab.end(), [](const Objectives& a, const Objectives& b) {
            return a.waste < b.waste;
        });
        f64 area = 0.0;
        f64 floor = REFERENCE_POINT;
        for (const auto& point : slab) {
            if (point.cost < floor) {
                area += (REFERENCE_POINT - point.waste) * (floor - point.cost);
                floor = point.cost;
            }
        }
        volume += area * depth;
    }
    return volume;
}

f64 spacing(const std::vector<Objectives>& front) {
    const usize n = front.size();
    if (n < 2) {
        return 0.0;
    }
    std::vector<Objectives> points = normalizeFront(front);

    std::vector<f64> nearest(n, std::numeric_limits<f64>::max());
    for (usize i = 0; i < n; ++i) {
        for (usize j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            f64 d = std::abs(points[i].waste - points[j].waste) +
                    std::abs(points[i].cost - points[j].cost) +
                    std::abs(points[i].barCount - points[j].barCount);
            nearest[i] = std::min(nearest[i], d);
        }
    }

    f64 mean = std::accumulate(nearest.begin(), nearest.end(), 0.0) / static_cast<f64>(n);
    f64 sum = 0.0;
    for (f64 d : nearest) {
        sum += (d - mean) * (d - mean);
    }
    return std::sqrt(sum / static_cast<f64>(n - 1));
}

usize selectRecommended(const std::vector<Objectives>& front, const ObjectiveWeights& weights,
                        FrontSelection selection) {
    std::vector<Objectives> points = normalizeFront(front);
    usize best = 0;
    f64 bestScore = std::numeric_limits<f64>::max();
    for (usize i = 0; i < points.size(); ++i) {
        const Objectives& p = points[i];
        f64 score = 0.0;
        if (selection == FrontSelection::WeightedSum) {
            score = weights.waste * p.waste + weights.cost * p.cost + weights.barCount * p.barCount;
        } else {
            score = std::sqrt(p.waste * p.waste + p.cost * p.cost + p.barCount * p.barCount);
        }
        if (score < bestScore - SCALAR_EPSILON) {
            bestScore = score;
            best = i;
        }
    }
    return best;
}

Nsga2Optimizer::Nsga2Optimizer(const AlgorithmConfig& config) : CutOptimizer(config) {
    if (const auto* params = std::get_if<Nsga2Params>(&config.strategy)) {
        m_params = *params;
    }
}

StrategyOutcome Nsga2Optimizer::optimize(const ProfileProblem& problem,
                                         const RunControl& control) {
    const GeneticParams& search = m_params.search;
    LayoutDecoder decoder(*problem.items, expandItems(*problem.items, problem.itemIndices),
                          problem.stock, m_config.cutting);

    // Scalarized view used for plateau detection only
    FitnessWeights scalar;
    scalar.waste = m_params.scalarization.waste;
    scalar.cost = m_params.scalarization.cost;
    scalar.barCount = m_params.scalarization.barCount;
    scalar.reclaimBonus = 0.0;
    FitnessModel model(scalar, m_config.cost, m_config.time, m_config.waste);
    model.calibrate(decoder);

    Rng rng(problem.seed);
    const int populationSize =
        search.populationSize.value_or(defaultPopulationSize(decoder.size()));
    const usize size = static_cast<usize>(populationSize);

    PopulationEvaluator evaluator(decoder, model, search.evaluationThreads);
    std::vector<Individual> population = seedPopulation(decoder, populationSize, rng);
    evaluator.evaluate(population);
    Ranking ranking = rankPopulation(population);

    f64 best = bestScalar(population);
    usize frontSize = ranking.fronts.front().size();
    int generation = 0;
    int stall = 0;
    ConvergenceReason reason = ConvergenceReason::MaxGenerations;

    while (true) {
        if (generation >= search.maxGenerations) {
            reason = ConvergenceReason::MaxGenerations;
            break;
        }
        control.throwIfCancelled("NSGA-II search");
        if (control.deadline.expired()) {
            reason = ConvergenceReason::TimeBudget;
            break;
        }

        std::vector<Individual> offspring;
        offspring.reserve(size);
        while (offspring.size() < size) {
            const Individual& mother =
                population[crowdedTournament(ranking, size, search.tournamentSize, rng)];
            const Individual& father =
                population[crowdedTournament(ranking, size, search.tournamentSize, rng)];

            std::pair<Genome, Genome> children;
            if (rng.chance(search.crossoverRate)) {
                children = orderCrossover(mother.genome, father.genome, rng);
            } else {
                children = {mother.genome, father.genome};
            }
            for (Genome* genome : {&children.first, &children.second}) {
                if (offspring.size() >= size) {
                    break;
                }
                if (rng.chance(search.mutationRate)) {
                    mutate(*genome, rng);
                }
                Individual child;
                child.genome = std::move(*genome);
                offspring.push_back(std::move(child));
            }
        }
        evaluator.evaluate(offspring);

        std::vector<Individual> combined = std::move(population);
        for (auto& child : offspring) {
            combined.push_back(std::move(child));
        }
        population = selectSurvivors(combined, size);
        ranking = rankPopulation(population);
        generation++;

        f64 scalarBest = bestScalar(population);
        usize currentFront = ranking.fronts.front().size();
        if (scalarBest < best - SCALAR_EPSILON || currentFront != frontSize) {
            best = std::min(best, scalarBest);
            frontSize = currentFront;
            stall = 0;
        } else {
            stall++;
        }
        if (search.plateauGenerations > 0 && stall >= search.plateauGenerations) {
            reason = ConvergenceReason::FitnessPlateau;
            break;
        }
    }

    // Rank-0 members with distinct objective vectors, in population order
    std::vector<usize> members;
    std::vector<Objectives> front;
    for (usize index : ranking.fronts.front()) {
        const Objectives& o = population[index].eval.objectives;
        bool duplicate = std::any_of(front.begin(), front.end(), [&](const Objectives& seen) {
            return seen.waste == o.waste && seen.cost == o.cost && seen.barCount == o.barCount;
        });
        if (!duplicate) {
            members.push_back(index);
            front.push_back(o);
        }
    }

    usize chosen = selectRecommended(front, m_params.scalarization, m_params.selection);

    Nsga2Telemetry telemetry;
    telemetry.generations = generation;
    telemetry.populationSize = populationSize;
    telemetry.evaluations = evaluator.evaluations();
    telemetry.convergenceReason = reason;
    telemetry.selection = m_params.selection;
    telemetry.bestScalarized = best;
    telemetry.pareto.recommendedIndex = static_cast<int>(chosen);
    telemetry.pareto.hypervolume = hypervolume(front);
    telemetry.pareto.spacing = spacing(front);

    std::vector<usize> all(front.size());
    std::iota(all.begin(), all.end(), 0);
    std::vector<f64> distance = crowdingDistance(front, all);
    for (usize i = 0; i < front.size(); ++i) {
        ParetoPoint point;
        point.objectives = front[i];
        point.crowdingDistance = distance[i];
        point.recommended = i == chosen;
        telemetry.pareto.front.push_back(point);
    }

    log::infof("NSGA-II", "%s: %d generations, front of %zu, hypervolume %.4f (%s)",
               problem.profileType.c_str(), generation, front.size(),
               telemetry.pareto.hypervolume, convergenceReasonLabel(reason));

    StrategyOutcome outcome;
    outcome.cuts = decoder.decode(population[members[chosen]].genome)
                       .buildCuts(problem.profileType, m_config.waste);
    outcome.telemetry = std::move(telemetry);
    return outcome;
}

} // namespace optimizer
} // namespace sc
