#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "../threading/thread_pool.h"
#include "bar_packer.h"
#include "cut_optimizer.h"
#include "rng.h"
#include "telemetry.h"

namespace sc {
namespace optimizer {

// A candidate is a permutation of unit request indices
using Genome = std::vector<int>;

// Replays the first-fit rule over a request order, so every genome decodes
// to a feasible layout
class LayoutDecoder {
  public:
    LayoutDecoder(const std::vector<CutItem>& items, std::vector<UnitRequest> requests,
                  const std::vector<StockOption>& stock, const CuttingParams& cutting);

    BarArena decode(const Genome& genome) const;

    // Longest-first order (the FFD individual)
    Genome decreasingOrder() const;

    usize size() const { return m_requests.size(); }
    const std::vector<UnitRequest>& requests() const { return m_requests; }
    const CuttingParams& cutting() const { return m_cutting; }

    // Sum of nominal request lengths
    Millimeters demand() const;

    // Fewest bars of the longest option that could hold every request
    int barLowerBound() const;

  private:
    const std::vector<CutItem>& m_items;
    std::vector<UnitRequest> m_requests;
    std::vector<StockOption> m_stock;
    CuttingParams m_cutting;
};

struct Evaluation {
    f64 fitness = 0.0; // Lower is better
    Objectives objectives;
};

// Weighted scalar fitness:
//   wWaste * waste / demand + wBars * bars / lowerBound
//   + wCost * cost / referenceCost - wReclaim * reclaimable / demand
// The reference cost comes from the FFD layout so the fitness of a layout
// does not depend on the population it sits in.
class FitnessModel {
  public:
    FitnessModel(const FitnessWeights& weights, const CostRates& rates, const TimeModel& time,
                 const WastePolicy& policy);

    void calibrate(const LayoutDecoder& decoder);

    Evaluation evaluate(const BarArena& layout) const;
    Evaluation evaluate(const LayoutMetrics& metrics) const;

    const WastePolicy& policy() const { return m_policy; }

  private:
    FitnessWeights m_weights;
    CostRates m_rates;
    TimeModel m_time;
    WastePolicy m_policy;
    Millimeters m_demand = 1.0;
    f64 m_lowerBound = 1.0;
    f64 m_referenceCost = 1.0;
};

struct Individual {
    Genome genome;
    Evaluation eval;
    bool evaluated = false;
};

// Order crossover (OX1): each child keeps a slice of one parent and takes
// the remaining genes in the other parent's order
std::pair<Genome, Genome> orderCrossover(const Genome& a, const Genome& b, Rng& rng);

void swapMutation(Genome& genome, Rng& rng);
void segmentShuffleMutation(Genome& genome, Rng& rng);

// Swap or segment shuffle with equal odds
void mutate(Genome& genome, Rng& rng);

// Index of the fittest of `size` random contestants (ties: lower index)
usize tournamentSelect(const std::vector<Individual>& population, int size, Rng& rng);

// Share of distinct fitness values in the population
f64 populationDiversity(const std::vector<Individual>& population);

// clamp(2 x units, 20, 200)
int defaultPopulationSize(usize units);

// Decodes and scores individuals, optionally on a worker pool. Each
// individual's result is written to its own slot, so parallel and serial
// evaluation produce identical populations.
class PopulationEvaluator {
  public:
    PopulationEvaluator(const LayoutDecoder& decoder, const FitnessModel& model, int threads);

    void evaluate(std::vector<Individual>& population);

    int evaluations() const { return m_evaluations; }
    usize threadCount() const { return m_pool ? m_pool->threadCount() : 1; }

  private:
    const LayoutDecoder& m_decoder;
    const FitnessModel& m_model;
    std::unique_ptr<ThreadPool> m_pool;
    int m_evaluations = 0;
};

// Initial population: the FFD individual followed by random permutations
std::vector<Individual> seedPopulation(const LayoutDecoder& decoder, int size, Rng& rng);

struct SearchResult {
    Individual best;
    GeneticTelemetry telemetry;
};

// Single-objective generational search with elitism
SearchResult runGeneticSearch(const LayoutDecoder& decoder, const FitnessModel& model,
                              const GeneticParams& params, u64 seed, const RunControl& control);

class GeneticOptimizer : public CutOptimizer {
  public:
    explicit GeneticOptimizer(const AlgorithmConfig& config);
    GeneticOptimizer(const AlgorithmConfig& config, const GeneticParams& params);

    Algorithm algorithm() const override { return Algorithm::Genetic; }
    StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) override;

  private:
    GeneticParams m_params;
};

} // namespace optimizer
} // namespace sc
