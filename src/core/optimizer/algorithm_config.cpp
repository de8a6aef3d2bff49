#include "algorithm_config.h"

#include <cmath>

#include "errors.h"

namespace sc {
namespace optimizer {

namespace {

void requireRate(const std::string& field, f64 value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw InvalidConfigError(field, "must lie in [0, 1]");
    }
}

void requireNonNegative(const std::string& field, f64 value) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        throw InvalidConfigError(field, "must be a finite, non-negative number");
    }
}

void validateGenetic(const std::string& prefix, const GeneticParams& p) {
    if (p.populationSize && *p.populationSize < 2) {
        throw InvalidConfigError(prefix + ".population", "must be at least 2");
    }
    if (p.maxGenerations < 0) {
        throw InvalidConfigError(prefix + ".max_generations", "must not be negative");
    }
    if (p.plateauGenerations < 0) {
        throw InvalidConfigError(prefix + ".plateau_generations", "must not be negative");
    }
    if (p.tournamentSize < 1) {
        throw InvalidConfigError(prefix + ".tournament_size", "must be at least 1");
    }
    if (p.eliteCount < 0) {
        throw InvalidConfigError(prefix + ".elite_count", "must not be negative");
    }
    if (p.evaluationThreads < 0) {
        throw InvalidConfigError(prefix + ".evaluation_threads", "must not be negative");
    }
    requireRate(prefix + ".crossover_rate", p.crossoverRate);
    requireRate(prefix + ".mutation_rate", p.mutationRate);
    requireNonNegative(prefix + ".weight_waste", p.weights.waste);
    requireNonNegative(prefix + ".weight_bars", p.weights.barCount);
    requireNonNegative(prefix + ".weight_cost", p.weights.cost);
    requireNonNegative(prefix + ".weight_reclaim", p.weights.reclaimBonus);
}

} // namespace

const char* algorithmLabel(Algorithm algorithm) {
    switch (algorithm) {
    case Algorithm::FirstFitDecreasing:
        return "ffd";
    case Algorithm::BestFitDecreasing:
        return "bfd";
    case Algorithm::Genetic:
        return "genetic";
    case Algorithm::Nsga2:
        return "nsga-ii";
    case Algorithm::Pooling:
        return "pooling";
    }
    return "ffd";
}

bool parseAlgorithm(std::string_view label, Algorithm& out) {
    if (label == "ffd") {
        out = Algorithm::FirstFitDecreasing;
    } else if (label == "bfd") {
        out = Algorithm::BestFitDecreasing;
    } else if (label == "genetic" || label == "ga") {
        out = Algorithm::Genetic;
    } else if (label == "nsga-ii" || label == "nsga2") {
        out = Algorithm::Nsga2;
    } else if (label == "pooling") {
        out = Algorithm::Pooling;
    } else {
        return false;
    }
    return true;
}

const char* stockSelectionLabel(StockSelection selection) {
    switch (selection) {
    case StockSelection::Priority:
        return "priority";
    case StockSelection::WastePerPiece:
        return "waste_per_piece";
    }
    return "priority";
}

bool parseStockSelection(std::string_view label, StockSelection& out) {
    if (label == "priority") {
        out = StockSelection::Priority;
    } else if (label == "waste_per_piece") {
        out = StockSelection::WastePerPiece;
    } else {
        return false;
    }
    return true;
}

const char* frontSelectionLabel(FrontSelection selection) {
    switch (selection) {
    case FrontSelection::WeightedSum:
        return "weighted_sum";
    case FrontSelection::ClosestToIdeal:
        return "closest_to_ideal";
    }
    return "weighted_sum";
}

bool parseFrontSelection(std::string_view label, FrontSelection& out) {
    if (label == "weighted_sum") {
        out = FrontSelection::WeightedSum;
    } else if (label == "closest_to_ideal") {
        out = FrontSelection::ClosestToIdeal;
    } else {
        return false;
    }
    return true;
}

Algorithm AlgorithmConfig::mode() const {
    struct Visitor {
        Algorithm operator()(const FfdParams&) const { return Algorithm::FirstFitDecreasing; }
        Algorithm operator()(const BfdParams&) const { return Algorithm::BestFitDecreasing; }
        Algorithm operator()(const GeneticParams&) const { return Algorithm::Genetic; }
        Algorithm operator()(const Nsga2Params&) const { return Algorithm::Nsga2; }
        Algorithm operator()(const PoolingParams&) const { return Algorithm::Pooling; }
    };
    return std::visit(Visitor{}, strategy);
}

AlgorithmConfig AlgorithmConfig::ffd(Millimeters kerf) {
    AlgorithmConfig config;
    config.strategy = FfdParams{};
    config.cutting.kerf = kerf;
    return config;
}

AlgorithmConfig AlgorithmConfig::bfd(Millimeters kerf) {
    AlgorithmConfig config;
    config.strategy = BfdParams{};
    config.cutting.kerf = kerf;
    return config;
}

AlgorithmConfig AlgorithmConfig::genetic(const GeneticParams& params, Millimeters kerf) {
    AlgorithmConfig config;
    config.strategy = params;
    config.cutting.kerf = kerf;
    return config;
}

AlgorithmConfig AlgorithmConfig::nsga2(const Nsga2Params& params, Millimeters kerf) {
    AlgorithmConfig config;
    config.strategy = params;
    config.cutting.kerf = kerf;
    return config;
}

AlgorithmConfig AlgorithmConfig::pooling(const PoolingParams& params, Millimeters kerf) {
    AlgorithmConfig config;
    config.strategy = params;
    config.cutting.kerf = kerf;
    return config;
}

void validateConfig(const AlgorithmConfig& config) {
    requireNonNegative("cutting.kerf", config.cutting.kerf);
    requireNonNegative("cutting.start_safety", config.cutting.startSafety);
    requireNonNegative("cutting.end_safety", config.cutting.endSafety);
    requireNonNegative("algorithm.time_budget_ms", config.timeBudgetMs);
    if (config.profileThreads < 0) {
        throw InvalidConfigError("algorithm.profile_threads", "must not be negative");
    }

    const WastePolicy& w = config.waste;
    if (!(w.minimalBelow > 0.0 && w.minimalBelow <= w.smallBelow &&
          w.smallBelow <= w.mediumBelow && w.mediumBelow <= w.largeUpTo)) {
        throw InvalidConfigError("waste", "category thresholds must be positive and ascending");
    }
    requireNonNegative("waste.reclaim_floor", w.reclaimFloor);
    requireRate("waste.excessive_ratio_warning", w.excessiveBarRatioWarning);

    const CostRates& c = config.cost;
    requireNonNegative("cost.material_per_meter", c.materialPerMeter);
    requireNonNegative("cost.labor_per_hour", c.laborPerHour);
    requireNonNegative("cost.waste_per_meter", c.wastePerMeter);
    requireNonNegative("cost.setup_per_event", c.setupPerEvent);
    requireNonNegative("cost.cutting_per_cut", c.cuttingPerCut);
    requireNonNegative("cost.machine_per_hour", c.machinePerHour);
    requireNonNegative("time.load_minutes_per_bar", config.time.loadMinutesPerBar);
    requireNonNegative("time.minutes_per_cut", config.time.minutesPerCut);

    if (const auto* genetic = std::get_if<GeneticParams>(&config.strategy)) {
        validateGenetic("genetic", *genetic);
    } else if (const auto* nsga = std::get_if<Nsga2Params>(&config.strategy)) {
        validateGenetic("genetic", nsga->search);
        requireNonNegative("nsga2.weight_waste", nsga->scalarization.waste);
        requireNonNegative("nsga2.weight_cost", nsga->scalarization.cost);
        requireNonNegative("nsga2.weight_bars", nsga->scalarization.barCount);
    } else if (const auto* pooling = std::get_if<PoolingParams>(&config.strategy)) {
        if (pooling->inner != Algorithm::FirstFitDecreasing &&
            pooling->inner != Algorithm::BestFitDecreasing &&
            pooling->inner != Algorithm::Genetic) {
            throw InvalidConfigError("pooling.inner", "must be ffd, bfd or genetic");
        }
        if (pooling->inner == Algorithm::Genetic) {
            validateGenetic("genetic", pooling->genetic);
        }
        requireRate("pooling.min_waste_reduction", pooling->minWasteReduction);
        requireRate("pooling.max_mixed_bar_ratio", pooling->maxMixedBarRatio);
    }
}

} // namespace optimizer
} // namespace sc
