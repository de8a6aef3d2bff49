#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "../types.h"
#include "algorithm_config.h"
#include "cut.h"
#include "telemetry.h"

namespace sc {
namespace optimizer {

struct WasteHistogram {
    std::array<int, kWasteCategoryCount> counts{};
    std::array<Millimeters, kWasteCategoryCount> lengths{};

    int count(WasteCategory c) const { return counts[static_cast<usize>(c)]; }
    Millimeters length(WasteCategory c) const { return lengths[static_cast<usize>(c)]; }
};

struct CostBreakdown {
    f64 materialCost = 0.0;
    f64 laborCost = 0.0;
    f64 wasteCost = 0.0;
    f64 setupCost = 0.0;
    f64 cuttingCost = 0.0;
    f64 timeCost = 0.0;
    f64 totalCost = 0.0;
    f64 costPerMeter = 0.0; // totalCost / usable metres

    // Quantities the rates were applied to
    f64 stockMeters = 0.0;
    f64 wasteMeters = 0.0;
    int setupEvents = 0;
    int cutCount = 0;
    f64 machineHours = 0.0;
};

enum class QualityGrade { Excellent, Good, Average, Poor };

const char* qualityGradeLabel(QualityGrade grade);

struct QualityAssessment {
    f64 score = 0.0; // [0, 1]
    QualityGrade grade = QualityGrade::Poor;
    f64 efficiencyScore = 0.0;
    f64 distributionScore = 0.0; // 1 when no waste sits in dead (non-reclaimable) offcuts
    f64 constraintScore = 0.0;   // 1 when no piece was forced into its tolerance band
    int toleranceAdjustedSegments = 0;
};

enum class RecommendationType {
    StockLength,
    AlgorithmChange,
    ParameterAdjustment,
    ReclaimOffcuts,
    ToleranceReview,
    PatternConsolidation,
};

enum class Severity { Info, Warning, Critical };
enum class Effort { Low, Medium, High };

const char* recommendationTypeLabel(RecommendationType type);
const char* severityLabel(Severity severity);
const char* effortLabel(Effort effort);

// Advisory post-analysis output; never alters the cuts
struct Recommendation {
    RecommendationType type = RecommendationType::StockLength;
    Severity severity = Severity::Info;
    std::string message;
    f64 potentialSavings = 0.0; // Cost units
    Effort implementationEffort = Effort::Low;
    std::string profileType;    // Empty for run-wide advice
};

// Bars drawn from one stock length of one profile
struct StockSummary {
    Millimeters stockLength = 0.0;
    int barCount = 0;
    int patternCount = 0; // Distinct cutting patterns
    int pieceCount = 0;
    Millimeters usedLength = 0.0;
    Millimeters wasteLength = 0.0;
};

struct ProfileSummary {
    std::string profileType;
    u64 seed = 0;
    int barCount = 0;
    int pieceCount = 0;
    Millimeters totalStockLength = 0.0;
    Millimeters totalUsedLength = 0.0;
    Millimeters totalWaste = 0.0;
    f64 efficiency = 0.0;
    f64 executionTimeMs = 0.0;
    std::vector<StockSummary> stock;
    StrategyTelemetry telemetry;
};

struct WorkOrderYield {
    std::string workOrderId;
    int pieces = 0;
    Millimeters pieceLength = 0.0;
    Millimeters stockShare = 0.0; // Bar length attributed in proportion to piece length
    f64 yield = 0.0;              // pieceLength / stockShare
};

struct OptimizationResult {
    Algorithm algorithm = Algorithm::FirstFitDecreasing;
    u64 seed = kDefaultSeed;
    std::vector<Cut> cuts;

    Millimeters totalStockLength = 0.0;
    Millimeters totalUsedLength = 0.0;
    Millimeters totalKerfLoss = 0.0;
    Millimeters totalTrimLoss = 0.0;
    Millimeters totalWaste = 0.0;   // Sum of unused remainders
    f64 wastePercentage = 0.0;      // totalWaste / totalStockLength x 100
    f64 efficiency = 0.0;           // totalUsedLength / totalStockLength
    Millimeters reclaimableLength = 0.0;

    WasteHistogram histogram;
    CostBreakdown cost;
    QualityAssessment quality;
    std::vector<Recommendation> recommendations;

    std::vector<ProfileSummary> profiles;
    std::vector<WorkOrderYield> workOrders;

    f64 executionTimeMs = 0.0;

    int barCount() const { return static_cast<int>(cuts.size()); }
    const ProfileSummary* profile(const std::string& profileType) const;

    // Run-level roll-up of the per-profile search telemetry. Unset for the
    // heuristics; time_budget when any profile ran out of time, then
    // max_generations when any profile hit the cap, else fitness_plateau.
    std::optional<ConvergenceReason> convergenceReason() const;
};

} // namespace optimizer
} // namespace sc
