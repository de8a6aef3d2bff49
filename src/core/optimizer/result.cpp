#include "result.h"

namespace sc {
namespace optimizer {

const char* convergenceReasonLabel(ConvergenceReason reason) {
    switch (reason) {
    case ConvergenceReason::MaxGenerations:
        return "max_generations";
    case ConvergenceReason::FitnessPlateau:
        return "fitness_plateau";
    case ConvergenceReason::TimeBudget:
        return "time_budget";
    }
    return "max_generations";
}

namespace {

int reasonRank(ConvergenceReason reason) {
    switch (reason) {
    case ConvergenceReason::TimeBudget:
        return 2;
    case ConvergenceReason::MaxGenerations:
        return 1;
    case ConvergenceReason::FitnessPlateau:
        return 0;
    }
    return 0;
}

} // namespace

ConvergenceReason dominantReason(ConvergenceReason a, ConvergenceReason b) {
    return reasonRank(b) > reasonRank(a) ? b : a;
}

std::optional<ConvergenceReason> convergenceReasonOf(const StrategyTelemetry& telemetry) {
    if (const auto* ga = std::get_if<GeneticTelemetry>(&telemetry)) {
        return ga->convergenceReason;
    }
    if (const auto* nsga = std::get_if<Nsga2Telemetry>(&telemetry)) {
        return nsga->convergenceReason;
    }
    if (const auto* pool = std::get_if<PoolingTelemetry>(&telemetry)) {
        if (pool->search) {
            return pool->search->convergenceReason;
        }
    }
    return std::nullopt;
}

const char* qualityGradeLabel(QualityGrade grade) {
    switch (grade) {
    case QualityGrade::Excellent:
        return "excellent";
    case QualityGrade::Good:
        return "good";
    case QualityGrade::Average:
        return "average";
    case QualityGrade::Poor:
        return "poor";
    }
    return "poor";
}

const char* recommendationTypeLabel(RecommendationType type) {
    switch (type) {
    case RecommendationType::StockLength:
        return "stock_length";
    case RecommendationType::AlgorithmChange:
        return "algorithm_change";
    case RecommendationType::ParameterAdjustment:
        return "parameter_adjustment";
    case RecommendationType::ReclaimOffcuts:
        return "reclaim_offcuts";
    case RecommendationType::ToleranceReview:
        return "tolerance_review";
    case RecommendationType::PatternConsolidation:
        return "pattern_consolidation";
    }
    return "stock_length";
}

const char* severityLabel(Severity severity) {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Critical:
        return "critical";
    }
    return "info";
}

const char* effortLabel(Effort effort) {
    switch (effort) {
    case Effort::Low:
        return "low";
    case Effort::Medium:
        return "medium";
    case Effort::High:
        return "high";
    }
    return "low";
}

const ProfileSummary* OptimizationResult::profile(const std::string& profileType) const {
    for (const auto& summary : profiles) {
        if (summary.profileType == profileType) {
            return &summary;
        }
    }
    return nullptr;
}

std::optional<ConvergenceReason> OptimizationResult::convergenceReason() const {
    std::optional<ConvergenceReason> rolled;
    for (const auto& summary : profiles) {
        if (auto reason = convergenceReasonOf(summary.telemetry)) {
            rolled = rolled ? dominantReason(*rolled, *reason) : *reason;
        }
    }
    return rolled;
}

} // namespace optimizer
} // namespace sc
