#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../types.h"

namespace sc {
namespace optimizer {

// Strategy selector (mode of a run)
enum class Algorithm { FirstFitDecreasing, BestFitDecreasing, Genetic, Nsga2, Pooling };

// URL-safe labels: "ffd", "bfd", "genetic", "nsga-ii", "pooling"
const char* algorithmLabel(Algorithm algorithm);
bool parseAlgorithm(std::string_view label, Algorithm& out);

// How a new bar's stock length is chosen
enum class StockSelection {
    Priority,      // Smallest priority value, then shortest stock that holds the request
    WastePerPiece, // Least waste per piece if the bar were filled with the request
};

const char* stockSelectionLabel(StockSelection selection);
bool parseStockSelection(std::string_view label, StockSelection& out);

// Physical cutting parameters shared by every strategy
struct CuttingParams {
    Millimeters kerf = 0.0;        // Blade loss per piece
    Millimeters startSafety = 0.0; // Trim at the bar start
    Millimeters endSafety = 0.0;   // Trim at the bar end
    bool allowToleranceSqueeze = false;
    bool rightSizeStock = false;
    StockSelection stockSelection = StockSelection::Priority;

    Millimeters trimLoss() const { return startSafety + endSafety; }
};

// Single-objective fitness weights (fitness is minimized)
struct FitnessWeights {
    f64 waste = 0.5;
    f64 barCount = 0.3;
    f64 cost = 0.2;
    f64 reclaimBonus = 0.1;
};

struct GeneticParams {
    std::optional<int> populationSize; // Unset: derived from the number of pieces
    int maxGenerations = 200;
    int plateauGenerations = 30;       // 0 disables plateau detection
    int tournamentSize = 3;
    int eliteCount = 2;
    f64 crossoverRate = 0.85;
    f64 mutationRate = 0.15;
    int evaluationThreads = 1;         // 1 evaluates inline, 0 derives from core count
    FitnessWeights weights;
};

// How NSGA-II picks the recommended member of the Pareto front
enum class FrontSelection { WeightedSum, ClosestToIdeal };

const char* frontSelectionLabel(FrontSelection selection);
bool parseFrontSelection(std::string_view label, FrontSelection& out);

struct ObjectiveWeights {
    f64 waste = 0.5;
    f64 cost = 0.3;
    f64 barCount = 0.2;
};

struct Nsga2Params {
    GeneticParams search;
    ObjectiveWeights scalarization;
    FrontSelection selection = FrontSelection::WeightedSum;
};

struct FfdParams {};
struct BfdParams {};

struct PoolingParams {
    Algorithm inner = Algorithm::FirstFitDecreasing; // ffd, bfd or genetic
    GeneticParams genetic;                           // Used when inner == Genetic
    f64 minWasteReduction = 0.01;                    // Relative to the per-order baseline
    f64 maxMixedBarRatio = 0.3;
};

// Closed set of per-mode parameters; the active alternative is the mode
using StrategyParams =
    std::variant<FfdParams, BfdParams, GeneticParams, Nsga2Params, PoolingParams>;

// Waste categorization thresholds (mm of unused remainder per bar)
struct WastePolicy {
    Millimeters minimalBelow = 50.0;
    Millimeters smallBelow = 150.0;
    Millimeters mediumBelow = 300.0;
    Millimeters largeUpTo = 500.0;      // Above this: excessive
    Millimeters reclaimFloor = 300.0;   // Minimum reusable remainder
    f64 excessiveBarRatioWarning = 0.2; // Recommendation trigger
};

// Unit rates of the cost model. Defaults price only the material at one unit
// per metre of stock so that cost equals consumed stock metres until a real
// price list is configured.
struct CostRates {
    f64 materialPerMeter = 1.0;
    f64 laborPerHour = 0.0;
    f64 wastePerMeter = 0.0;
    f64 setupPerEvent = 0.0;
    f64 cuttingPerCut = 0.0;
    f64 machinePerHour = 0.0;
};

// Machine time estimate used by the labour and time cost terms
struct TimeModel {
    f64 loadMinutesPerBar = 1.0;
    f64 minutesPerCut = 0.5;
};

inline constexpr u64 kDefaultSeed = 12345;

struct AlgorithmConfig {
    StrategyParams strategy = FfdParams{};
    CuttingParams cutting;
    WastePolicy waste;
    CostRates cost;
    TimeModel time;
    f64 timeBudgetMs = 0.0;  // 0 = unlimited
    std::optional<u64> seed; // Unset: kDefaultSeed
    int profileThreads = 1;  // Concurrent profile sub-problems, 0 = derive from core count

    Algorithm mode() const;
    u64 effectiveSeed() const { return seed.value_or(kDefaultSeed); }

    // Convenience constructors for the common modes
    static AlgorithmConfig ffd(Millimeters kerf = 0.0);
    static AlgorithmConfig bfd(Millimeters kerf = 0.0);
    static AlgorithmConfig genetic(const GeneticParams& params = {}, Millimeters kerf = 0.0);
    static AlgorithmConfig nsga2(const Nsga2Params& params = {}, Millimeters kerf = 0.0);
    static AlgorithmConfig pooling(const PoolingParams& params = {}, Millimeters kerf = 0.0);
};

// Throws InvalidConfigError naming the first offending field
void validateConfig(const AlgorithmConfig& config);

} // namespace optimizer
} // namespace sc
