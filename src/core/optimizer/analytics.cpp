#include "analytics.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>

#include "../utils/string_utils.h"

namespace sc {
namespace optimizer {

namespace {
constexpr f64 MM_PER_METER = 1000.0;
constexpr f64 MINUTES_PER_HOUR = 60.0;

// Recommendation triggers
constexpr f64 PATTERN_RATIO_HINT = 0.5; // Distinct patterns per bar
constexpr int PATTERN_MIN_BARS = 4;

bool isDeadWaste(const Cut& cut) {
    return cut.wasteCategory != WasteCategory::Minimal && !cut.isReclaimable;
}

std::string describeCount(int count, const char* noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace

CostQuantities quantitiesOf(const std::vector<Cut>& cuts) {
    CostQuantities q;
    for (const auto& cut : cuts) {
        q.stockLength += cut.stockLength;
        q.usedLength += cut.usedLength;
        q.waste += cut.remainingLength;
        q.cuts += cut.segmentCount();
    }
    q.bars = static_cast<int>(cuts.size());
    q.setupEvents = countSetupEvents(cuts);
    return q;
}

CostQuantities quantitiesOf(const LayoutMetrics& metrics) {
    CostQuantities q;
    q.stockLength = metrics.stockLength;
    q.usedLength = metrics.usedLength;
    q.waste = metrics.waste;
    q.bars = metrics.bars;
    q.cuts = metrics.pieces;
    q.setupEvents = metrics.patterns;
    return q;
}

CostBreakdown computeCost(const CostQuantities& q, const CostRates& rates, const TimeModel& time) {
    CostBreakdown cost;
    cost.stockMeters = q.stockLength / MM_PER_METER;
    cost.wasteMeters = q.waste / MM_PER_METER;
    cost.setupEvents = q.setupEvents;
    cost.cutCount = q.cuts;
    cost.machineHours = (static_cast<f64>(q.bars) * time.loadMinutesPerBar +
                         static_cast<f64>(q.cuts) * time.minutesPerCut) /
                        MINUTES_PER_HOUR;

    cost.materialCost = cost.stockMeters * rates.materialPerMeter;
    cost.laborCost = cost.machineHours * rates.laborPerHour;
    cost.wasteCost = cost.wasteMeters * rates.wastePerMeter;
    cost.setupCost = static_cast<f64>(q.setupEvents) * rates.setupPerEvent;
    cost.cuttingCost = static_cast<f64>(q.cuts) * rates.cuttingPerCut;
    cost.timeCost = cost.machineHours * rates.machinePerHour;
    cost.totalCost = cost.materialCost + cost.laborCost + cost.wasteCost + cost.setupCost +
                     cost.cuttingCost + cost.timeCost;

    f64 usableMeters = q.usedLength / MM_PER_METER;
    cost.costPerMeter = usableMeters > 0.0 ? cost.totalCost / usableMeters : 0.0;
    return cost;
}

int countSetupEvents(const std::vector<Cut>& cuts) {
    std::set<std::string> patterns;
    for (const auto& cut : cuts) {
        patterns.insert(cut.profileType + "|" + cut.patternKey());
    }
    return static_cast<int>(patterns.size());
}

void classifyCuts(std::vector<Cut>& cuts, const WastePolicy& policy) {
    for (auto& cut : cuts) {
        cut.wasteCategory = categorizeWaste(cut.remainingLength, policy);
        cut.isReclaimable = isReclaimableWaste(cut.remainingLength, policy);
    }
}

WasteHistogram buildHistogram(const std::vector<Cut>& cuts) {
    WasteHistogram histogram;
    for (const auto& cut : cuts) {
        auto slot = static_cast<usize>(cut.wasteCategory);
        histogram.counts[slot]++;
        histogram.lengths[slot] += cut.remainingLength;
    }
    return histogram;
}

QualityGrade gradeFor(f64 score) {
    if (score >= 0.9) {
        return QualityGrade::Excellent;
    }
    if (score >= 0.8) {
        return QualityGrade::Good;
    }
    if (score >= 0.6) {
        return QualityGrade::Average;
    }
    return QualityGrade::Poor;
}

QualityAssessment assessQuality(const std::vector<Cut>& cuts) {
    QualityAssessment quality;

    Millimeters stock = 0.0;
    Millimeters used = 0.0;
    Millimeters waste = 0.0;
    Millimeters deadWaste = 0.0;
    int segments = 0;

    for (const auto& cut : cuts) {
        stock += cut.stockLength;
        used += cut.usedLength;
        waste += cut.remainingLength;
        if (isDeadWaste(cut)) {
            deadWaste += cut.remainingLength;
        }
        for (const auto& segment : cut.segments) {
            segments++;
            if (segment.toleranceAdjusted) {
                quality.toleranceAdjustedSegments++;
            }
        }
    }

    quality.efficiencyScore = stock > 0.0 ? used / stock : 0.0;
    quality.distributionScore = waste > 0.0 ? 1.0 - deadWaste / waste : 1.0;
    quality.constraintScore =
        segments > 0
            ? 1.0 - static_cast<f64>(quality.toleranceAdjustedSegments) / static_cast<f64>(segments)
            : 1.0;

    quality.score = 0.7 * quality.efficiencyScore + 0.15 * quality.distributionScore +
                    0.15 * quality.constraintScore;
    quality.score = std::clamp(quality.score, 0.0, 1.0);
    quality.grade = gradeFor(quality.score);
    return quality;
}

std::vector<StockSummary> summarizeStock(const std::vector<Cut>& cuts) {
    std::map<Millimeters, StockSummary> byLength;
    std::map<Millimeters, std::set<std::string>> patterns;

    for (const auto& cut : cuts) {
        StockSummary& summary = byLength[cut.stockLength];
        summary.stockLength = cut.stockLength;
        summary.barCount++;
        summary.pieceCount += cut.segmentCount();
        summary.usedLength += cut.usedLength;
        summary.wasteLength += cut.remainingLength;
        patterns[cut.stockLength].insert(cut.patternKey());
    }

    std::vector<StockSummary> result;
    result.reserve(byLength.size());
    for (auto& [length, summary] : byLength) {
        summary.patternCount = static_cast<int>(patterns[length].size());
        result.push_back(summary);
    }
    return result;
}

ProfileSummary summarizeProfile(const std::string& profileType, const std::vector<Cut>& cuts) {
    ProfileSummary summary;
    summary.profileType = profileType;
    for (const auto& cut : cuts) {
        summary.barCount++;
        summary.pieceCount += cut.segmentCount();
        summary.totalStockLength += cut.stockLength;
        summary.totalUsedLength += cut.usedLength;
        summary.totalWaste += cut.remainingLength;
    }
    summary.efficiency =
        summary.totalStockLength > 0.0 ? summary.totalUsedLength / summary.totalStockLength : 0.0;
    summary.stock = summarizeStock(cuts);
    return summary;
}

std::vector<WorkOrderYield> workOrderYields(const std::vector<Cut>& cuts) {
    std::vector<WorkOrderYield> yields;
    std::map<std::string, usize> slots;

    for (const auto& cut : cuts) {
        if (cut.usedLength <= 0.0) {
            continue;
        }
        for (const auto& segment : cut.segments) {
            if (segment.workOrderId.empty()) {
                continue;
            }
            auto it = slots.find(segment.workOrderId);
            if (it == slots.end()) {
                it = slots.emplace(segment.workOrderId, yields.size()).first;
                WorkOrderYield entry;
                entry.workOrderId = segment.workOrderId;
                yields.push_back(entry);
            }
            WorkOrderYield& entry = yields[it->second];
            entry.pieces++;
            entry.pieceLength += segment.length;
            entry.stockShare += cut.stockLength * segment.length / cut.usedLength;
        }
    }

    for (auto& entry : yields) {
        entry.yield = entry.stockShare > 0.0 ? entry.pieceLength / entry.stockShare : 0.0;
    }
    return yields;
}

int barLowerBound(const std::vector<Cut>& cuts, const std::vector<StockOption>& options,
                  const CuttingParams& cutting) {
    Millimeters longest = 0.0;
    for (const auto& option : options) {
        longest = std::max(longest, option.stockLength - cutting.trimLoss());
    }
    if (longest <= 0.0) {
        return static_cast<int>(cuts.size());
    }

    Millimeters content = 0.0;
    for (const auto& cut : cuts) {
        content += cut.usedLength + cut.kerfLoss;
    }
    return static_cast<int>(std::ceil(content / longest - 1e-9));
}

std::vector<Recommendation> recommend(const OptimizationResult& result,
                                      const AlgorithmConfig& config,
                                      const StockCatalog& catalog) {
    std::vector<Recommendation> recommendations;
    const f64 materialRate = config.cost.materialPerMeter;
    const Algorithm mode = result.algorithm;
    const bool heuristic =
        mode == Algorithm::FirstFitDecreasing || mode == Algorithm::BestFitDecreasing;

    for (const auto& profile : result.profiles) {
        std::vector<Cut> cuts;
        for (const auto& cut : result.cuts) {
            if (cut.profileType == profile.profileType) {
                cuts.push_back(cut);
            }
        }
        if (cuts.empty()) {
            continue;
        }

        // Bars leaving more than the largest category bound
        int excessive = 0;
        Millimeters excessLength = 0.0;
        for (const auto& cut : cuts) {
            if (cut.wasteCategory == WasteCategory::Excessive) {
                excessive++;
                excessLength += cut.remainingLength - config.waste.largeUpTo;
            }
        }
        f64 excessiveRatio = static_cast<f64>(excessive) / static_cast<f64>(cuts.size());
        if (excessive > 0 && excessiveRatio > config.waste.excessiveBarRatioWarning) {
            Recommendation r;
            r.type = RecommendationType::StockLength;
            r.severity = excessiveRatio > 2.0 * config.waste.excessiveBarRatioWarning
                             ? Severity::Critical
                             : Severity::Warning;
            r.message = describeCount(excessive, "bar") + " of " + profile.profileType +
                        " leave more than " + str::formatLength(config.waste.largeUpTo) +
                        "; consider adding a shorter stock length";
            r.potentialSavings = excessLength / MM_PER_METER * materialRate;
            r.implementationEffort = Effort::Medium;
            r.profileType = profile.profileType;
            recommendations.push_back(r);
        }

        int lowerBound =
            barLowerBound(cuts, catalog.optionsFor(profile.profileType), config.cutting);
        if (heuristic && static_cast<int>(cuts.size()) > lowerBound) {
            int gap = static_cast<int>(cuts.size()) - lowerBound;
            Recommendation r;
            r.type = RecommendationType::AlgorithmChange;
            r.severity = Severity::Info;
            r.message = profile.profileType + " uses " + describeCount(gap, "bar") +
                        " above the theoretical minimum; a genetic search may close the gap";
            r.potentialSavings = static_cast<f64>(gap) *
                                 (profile.totalStockLength / static_cast<f64>(cuts.size())) /
                                 MM_PER_METER * materialRate;
            r.implementationEffort = Effort::Low;
            r.profileType = profile.profileType;
            recommendations.push_back(r);
        }

        std::optional<ConvergenceReason> reason = convergenceReasonOf(profile.telemetry);
        if (reason && *reason == ConvergenceReason::TimeBudget) {
            Recommendation r;
            r.type = RecommendationType::ParameterAdjustment;
            r.severity = Severity::Warning;
            r.message = "Search for " + profile.profileType +
                        " stopped on the time budget before converging; raise time_budget_ms";
            r.implementationEffort = Effort::Low;
            r.profileType = profile.profileType;
            recommendations.push_back(r);
        }
    }

    if (result.reclaimableLength > 0.0) {
        int offcuts = 0;
        for (const auto& cut : result.cuts) {
            if (cut.isReclaimable) {
                offcuts++;
            }
        }
        Recommendation r;
        r.type = RecommendationType::ReclaimOffcuts;
        r.severity = Severity::Info;
        r.message = describeCount(offcuts, "offcut") + " totalling " +
                    str::formatLength(result.reclaimableLength) + " can return to stock";
        r.potentialSavings = result.reclaimableLength / MM_PER_METER * materialRate;
        r.implementationEffort = Effort::Low;
        recommendations.push_back(r);
    }

    if (result.quality.toleranceAdjustedSegments > 0) {
        Recommendation r;
        r.type = RecommendationType::ToleranceReview;
        r.severity = Severity::Warning;
        r.message = describeCount(result.quality.toleranceAdjustedSegments, "piece") +
                    " were cut short within tolerance; review before release";
        r.implementationEffort = Effort::Medium;
        recommendations.push_back(r);
    }

    const int bars = result.barCount();
    const int setups = result.cost.setupEvents;
    if (bars >= PATTERN_MIN_BARS &&
        static_cast<f64>(setups) / static_cast<f64>(bars) > PATTERN_RATIO_HINT) {
        std::set<std::string> stockLengths;
        for (const auto& cut : result.cuts) {
            stockLengths.insert(cut.profileType + "|" + std::to_string(cut.stockLength));
        }
        int avoidable = setups - static_cast<int>(stockLengths.size());
        Recommendation r;
        r.type = RecommendationType::PatternConsolidation;
        r.severity = Severity::Info;
        r.message = describeCount(setups, "distinct pattern") + " across " +
                    describeCount(bars, "bar") + "; grouping similar pieces reduces setups";
        r.potentialSavings = static_cast<f64>(std::max(0, avoidable)) * config.cost.setupPerEvent;
        r.implementationEffort = Effort::High;
        recommendations.push_back(r);
    }

    return recommendations;
}

void aggregate(OptimizationResult& result, const AlgorithmConfig& config,
               const StockCatalog& catalog) {
    result.totalStockLength = 0.0;
    result.totalUsedLength = 0.0;
    result.totalKerfLoss = 0.0;
    result.totalTrimLoss = 0.0;
    result.totalWaste = 0.0;
    result.reclaimableLength = 0.0;

    for (const auto& cut : result.cuts) {
        result.totalStockLength += cut.stockLength;
        result.totalUsedLength += cut.usedLength;
        result.totalKerfLoss += cut.kerfLoss;
        result.totalTrimLoss += cut.trimLoss;
        result.totalWaste += cut.remainingLength;
        if (cut.isReclaimable) {
            result.reclaimableLength += cut.remainingLength;
        }
    }

    if (result.totalStockLength > 0.0) {
        result.wastePercentage = result.totalWaste / result.totalStockLength * 100.0;
        result.efficiency = result.totalUsedLength / result.totalStockLength;
    } else {
        result.wastePercentage = 0.0;
        result.efficiency = 0.0;
    }

    result.histogram = buildHistogram(result.cuts);
    result.cost = computeCost(quantitiesOf(result.cuts), config.cost, config.time);
    result.quality = assessQuality(result.cuts);
    result.workOrders = workOrderYields(result.cuts);
    result.recommendations = recommend(result, config, catalog);
}

} // namespace optimizer
} // namespace sc
