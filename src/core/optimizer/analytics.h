#pragma once

#include <string>
#include <vector>

#include "algorithm_config.h"
#include "bar_packer.h"
#include "cut.h"
#include "result.h"
#include "stock.h"

namespace sc {
namespace optimizer {

// Quantities the cost model prices
struct CostQuantities {
    Millimeters stockLength = 0.0;
    Millimeters usedLength = 0.0;
    Millimeters waste = 0.0;
    int bars = 0;
    int cuts = 0;        // Blade passes, one per segment
    int setupEvents = 0; // Distinct cutting patterns
};

CostQuantities quantitiesOf(const std::vector<Cut>& cuts);
CostQuantities quantitiesOf(const LayoutMetrics& metrics);

// total = material + labor + waste + setup + cutting + time
CostBreakdown computeCost(const CostQuantities& quantities, const CostRates& rates,
                          const TimeModel& time);

// Number of distinct patterns among the cuts (one machine setup each)
int countSetupEvents(const std::vector<Cut>& cuts);

// Re-derive category and reclaim flag of every cut under a policy
void classifyCuts(std::vector<Cut>& cuts, const WastePolicy& policy);

WasteHistogram buildHistogram(const std::vector<Cut>& cuts);

// 0.7 efficiency + 0.15 waste distribution + 0.15 tolerance respect.
// Dead waste is a remainder that is neither minimal nor reclaimable.
QualityAssessment assessQuality(const std::vector<Cut>& cuts);
QualityGrade gradeFor(f64 score);

// Bars per stock length of one profile's cuts, shortest stock first
std::vector<StockSummary> summarizeStock(const std::vector<Cut>& cuts);

// Totals of one profile; telemetry and timing are left to the caller
ProfileSummary summarizeProfile(const std::string& profileType, const std::vector<Cut>& cuts);

// Per work order: pieces, piece length and a length-proportional share of
// every bar it appears on. Items without a work order are not listed.
std::vector<WorkOrderYield> workOrderYields(const std::vector<Cut>& cuts);

// Fewest bars that could hold the profile's pieces on its longest stock
int barLowerBound(const std::vector<Cut>& cuts, const std::vector<StockOption>& options,
                  const CuttingParams& cutting);

// Rule-based advisory output over an aggregated result
std::vector<Recommendation> recommend(const OptimizationResult& result,
                                      const AlgorithmConfig& config,
                                      const StockCatalog& catalog);

// Fill totals, histogram, cost, quality, yields and recommendations of a
// result whose cuts and profile summaries are already set
void aggregate(OptimizationResult& result, const AlgorithmConfig& config,
               const StockCatalog& catalog);

} // namespace optimizer
} // namespace sc
