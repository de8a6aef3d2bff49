#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../types.h"
#include "algorithm_config.h"

namespace sc {
namespace optimizer {

// Why an evolutionary search stopped
enum class ConvergenceReason { MaxGenerations, FitnessPlateau, TimeBudget };

// "max_generations", "fitness_plateau", "time_budget"
const char* convergenceReasonLabel(ConvergenceReason reason);

struct GenerationStats {
    int generation = 0;
    f64 bestFitness = 0.0;
    f64 averageFitness = 0.0;
    f64 diversity = 0.0; // Share of distinct fitness values in the population
};

struct GeneticTelemetry {
    int generations = 0; // Completed generations after initialization
    int populationSize = 0;
    int evaluations = 0;
    f64 bestFitness = 0.0;
    f64 initialFitness = 0.0; // Fitness of the first-fit-decreasing seed individual
    ConvergenceReason convergenceReason = ConvergenceReason::MaxGenerations;
    std::vector<GenerationStats> history;
};

// Objective vector of one layout; every component is minimized
struct Objectives {
    f64 waste = 0.0; // mm of unused remainder
    f64 cost = 0.0;
    f64 barCount = 0.0;
};

struct ParetoPoint {
    Objectives objectives;
    f64 crowdingDistance = 0.0;
    bool recommended = false;
};

struct ParetoSummary {
    std::vector<ParetoPoint> front; // Rank-0 solutions, distinct objective vectors
    int recommendedIndex = -1;
    f64 hypervolume = 0.0; // Normalized to [0, 1.1^3]
    f64 spacing = 0.0;     // Schott spacing, 0 for evenly spread fronts
};

struct Nsga2Telemetry {
    int generations = 0;
    int populationSize = 0;
    int evaluations = 0;
    ConvergenceReason convergenceReason = ConvergenceReason::MaxGenerations;
    FrontSelection selection = FrontSelection::WeightedSum;
    f64 bestScalarized = 0.0;
    ParetoSummary pareto;
};

struct PoolingTelemetry {
    Algorithm inner = Algorithm::FirstFitDecreasing;
    bool pooled = false; // False: per-work-order baseline was kept
    int workOrders = 0;
    int demandLines = 0;
    int units = 0;
    Millimeters pooledWaste = 0.0;
    Millimeters baselineWaste = 0.0;
    f64 wasteReduction = 0.0; // (baseline - pooled) / baseline
    f64 mixedBarRatio = 0.0;
    std::string decision;
    // Inner genetic search behind the kept plan. For the per-order baseline this
    // is the order whose search stopped for the most significant reason.
    std::optional<GeneticTelemetry> search;
};

// Closed set of per-strategy telemetry; heuristics report none
using StrategyTelemetry =
    std::variant<std::monostate, GeneticTelemetry, Nsga2Telemetry, PoolingTelemetry>;

// Stop reason of an evolutionary search, including one nested in pooling.
// Heuristic telemetry has none.
std::optional<ConvergenceReason> convergenceReasonOf(const StrategyTelemetry& telemetry);

// TimeBudget outranks MaxGenerations, which outranks FitnessPlateau
ConvergenceReason dominantReason(ConvergenceReason a, ConvergenceReason b);

} // namespace optimizer
} // namespace sc
