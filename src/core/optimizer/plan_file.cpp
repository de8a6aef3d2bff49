#include "plan_file.h"

#include <cmath>

#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace sc {
namespace optimizer {

using json = nlohmann::json;

namespace {

json historyToJson(const std::vector<GenerationStats>& history) {
    json arr = json::array();
    for (const auto& g : history) {
        arr.push_back({{"generation", g.generation},
                       {"best_fitness", g.bestFitness},
                       {"average_fitness", g.averageFitness},
                       {"diversity", g.diversity}});
    }
    return arr;
}

json objectivesToJson(const Objectives& o) {
    return {{"waste", o.waste}, {"cost", o.cost}, {"bar_count", o.barCount}};
}

json telemetryToJson(const StrategyTelemetry& telemetry) {
    if (const auto* ga = std::get_if<GeneticTelemetry>(&telemetry)) {
        json t;
        t["kind"] = "genetic";
        t["generations"] = ga->generations;
        t["population_size"] = ga->populationSize;
        t["evaluations"] = ga->evaluations;
        t["best_fitness"] = ga->bestFitness;
        t["initial_fitness"] = ga->initialFitness;
        t["convergence_reason"] = convergenceReasonLabel(ga->convergenceReason);
        t["history"] = historyToJson(ga->history);
        return t;
    }
    if (const auto* nsga = std::get_if<Nsga2Telemetry>(&telemetry)) {
        json t;
        t["kind"] = "nsga-ii";
        t["generations"] = nsga->generations;
        t["population_size"] = nsga->populationSize;
        t["evaluations"] = nsga->evaluations;
        t["convergence_reason"] = convergenceReasonLabel(nsga->convergenceReason);
        t["selection"] = frontSelectionLabel(nsga->selection);
        t["best_scalarized"] = nsga->bestScalarized;

        json front = json::array();
        for (const auto& point : nsga->pareto.front) {
            json p;
            p["objectives"] = objectivesToJson(point.objectives);
            // Boundary points have infinite crowding distance
            if (std::isfinite(point.crowdingDistance)) {
                p["crowding_distance"] = point.crowdingDistance;
            } else {
                p["crowding_distance"] = nullptr;
            }
            p["recommended"] = point.recommended;
            front.push_back(p);
        }
        t["pareto"] = {{"front", front},
                       {"recommended_index", nsga->pareto.recommendedIndex},
                       {"hypervolume", nsga->pareto.hypervolume},
                       {"spacing", nsga->pareto.spacing}};
        return t;
    }
    if (const auto* pool = std::get_if<PoolingTelemetry>(&telemetry)) {
        json t;
        t["kind"] = "pooling";
        t["inner"] = algorithmLabel(pool->inner);
        t["pooled"] = pool->pooled;
        t["work_orders"] = pool->workOrders;
        t["demand_lines"] = pool->demandLines;
        t["units"] = pool->units;
        t["pooled_waste"] = pool->pooledWaste;
        t["baseline_waste"] = pool->baselineWaste;
        t["waste_reduction"] = pool->wasteReduction;
        t["mixed_bar_ratio"] = pool->mixedBarRatio;
        t["decision"] = pool->decision;
        if (pool->search) {
            t["search"] = telemetryToJson(StrategyTelemetry(*pool->search));
        } else {
            t["search"] = nullptr;
        }
        return t;
    }
    return nullptr;
}

json cutToJson(const Cut& cut) {
    json c;
    c["profile_type"] = cut.profileType;
    c["stock_length"] = cut.stockLength;
    c["used_length"] = cut.usedLength;
    c["kerf_loss"] = cut.kerfLoss;
    c["trim_loss"] = cut.trimLoss;
    c["remaining_length"] = cut.remainingLength;
    c["waste_category"] = wasteCategoryLabel(cut.wasteCategory);
    c["is_reclaimable"] = cut.isReclaimable;
    c["is_mixed"] = cut.isMixed;
    c["pattern_key"] = cut.patternKey();

    auto& segments = c["segments"];
    segments = json::array();
    for (const auto& s : cut.segments) {
        segments.push_back({{"item_id", s.itemId},
                            {"work_order_id", s.workOrderId},
                            {"length", s.length},
                            {"position", s.position},
                            {"end_position", s.endPosition},
                            {"sequence_number", s.sequenceNumber},
                            {"tolerance_adjusted", s.toleranceAdjusted}});
    }

    auto& orders = c["work_orders"];
    orders = json::array();
    for (const auto& share : cut.workOrderBreakdown) {
        orders.push_back({{"work_order_id", share.workOrderId},
                          {"pieces", share.pieces},
                          {"length", share.length}});
    }
    return c;
}

json profileToJson(const ProfileSummary& profile) {
    json p;
    p["profile_type"] = profile.profileType;
    p["seed"] = profile.seed;
    p["bar_count"] = profile.barCount;
    p["piece_count"] = profile.pieceCount;
    p["total_stock_length"] = profile.totalStockLength;
    p["total_used_length"] = profile.totalUsedLength;
    p["total_waste"] = profile.totalWaste;
    p["efficiency"] = profile.efficiency;
    p["execution_time_ms"] = profile.executionTimeMs;

    auto& stock = p["stock"];
    stock = json::array();
    for (const auto& s : profile.stock) {
        stock.push_back({{"stock_length", s.stockLength},
                         {"bar_count", s.barCount},
                         {"pattern_count", s.patternCount},
                         {"piece_count", s.pieceCount},
                         {"used_length", s.usedLength},
                         {"waste_length", s.wasteLength}});
    }
    p["telemetry"] = telemetryToJson(profile.telemetry);
    return p;
}

CutItem itemFromJson(const json& j, usize index) {
    CutItem item;
    item.id = j.value("id", "item-" + std::to_string(index + 1));
    item.profileType = j.at("profile_type").get<std::string>();
    item.workOrderId = j.value("work_order_id", std::string{});
    item.length = j.at("length").get<f64>();
    item.quantity = j.value("quantity", 1);
    item.tolerance = j.value("tolerance", 0.0);
    if (j.contains("priority") && !j["priority"].is_null()) {
        item.priority = j["priority"].get<int>();
    }
    return item;
}

StockOption stockFromJson(const json& j) {
    StockOption option;
    option.profileType = j.at("profile_type").get<std::string>();
    option.stockLength = j.at("stock_length").get<f64>();
    option.priority = j.value("priority", 0);
    option.isDefault = j.value("is_default", false);
    option.name = j.value("name", std::string{});
    return option;
}

// False when the algorithm label is unknown
bool settingsFromJson(const json& j, JobSettings& out) {
    if (j.contains("algorithm")) {
        Algorithm algorithm;
        std::string label = j["algorithm"].get<std::string>();
        if (!parseAlgorithm(label, algorithm)) {
            log::errorf("PlanFile", "Unknown algorithm '%s'", label.c_str());
            return false;
        }
        out.algorithm = algorithm;
    }
    if (j.contains("kerf")) {
        out.kerf = j["kerf"].get<f64>();
    }
    if (j.contains("start_safety")) {
        out.startSafety = j["start_safety"].get<f64>();
    }
    if (j.contains("end_safety")) {
        out.endSafety = j["end_safety"].get<f64>();
    }
    if (j.contains("time_budget_ms")) {
        out.timeBudgetMs = j["time_budget_ms"].get<f64>();
    }
    if (j.contains("seed")) {
        out.seed = j["seed"].get<u64>();
    }
    return true;
}

} // namespace

Result<JobFile> PlanFile::loadJob(const Path& filePath) {
    auto textResult = file::readText(filePath);
    if (!textResult) {
        log::errorf("PlanFile", "Failed to read %s", filePath.string().c_str());
        return std::nullopt;
    }

    auto job = parseJob(*textResult, filePath.string());
    if (job && job->name.empty()) {
        job->name = filePath.stem().string();
    }
    return job;
}

Result<JobFile> PlanFile::parseJob(std::string_view text, const std::string& source) {
    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        log::errorf("PlanFile", "JSON parse error in %s: %s", source.c_str(), e.what());
        return std::nullopt;
    }

    if (!doc.is_object() || !doc.contains("items") || !doc["items"].is_array()) {
        log::errorf("PlanFile", "%s has no items array", source.c_str());
        return std::nullopt;
    }

    JobFile job;
    try {
        int version = doc.value("format_version", FORMAT_VERSION);
        if (version > FORMAT_VERSION) {
            log::errorf("PlanFile", "%s has unsupported format version %d", source.c_str(),
                        version);
            return std::nullopt;
        }

        job.name = doc.value("name", std::string{});

        const auto& items = doc["items"];
        for (usize i = 0; i < items.size(); ++i) {
            job.items.push_back(itemFromJson(items[i], i));
        }

        if (doc.contains("stock") && doc["stock"].is_array()) {
            for (const auto& s : doc["stock"]) {
                job.stock.add(stockFromJson(s));
            }
        }

        if (doc.contains("settings") && doc["settings"].is_object()) {
            if (!settingsFromJson(doc["settings"], job.settings)) {
                return std::nullopt;
            }
        }
    } catch (const json::exception& e) {
        log::errorf("PlanFile", "Malformed job %s: %s", source.c_str(), e.what());
        return std::nullopt;
    }

    log::debugf("PlanFile", "Loaded %zu items and %zu stock options from %s",
                job.items.size(), job.stock.size(), source.c_str());
    return job;
}

json PlanFile::jobToJson(const JobFile& job) {
    json doc;
    doc["format_version"] = FORMAT_VERSION;
    doc["name"] = job.name;

    auto& items = doc["items"];
    items = json::array();
    for (const auto& item : job.items) {
        json i = {{"id", item.id},
                  {"profile_type", item.profileType},
                  {"length", item.length},
                  {"quantity", item.quantity},
                  {"tolerance", item.tolerance}};
        if (!item.workOrderId.empty()) {
            i["work_order_id"] = item.workOrderId;
        }
        if (item.priority) {
            i["priority"] = *item.priority;
        }
        items.push_back(i);
    }

    auto& stock = doc["stock"];
    stock = json::array();
    for (const auto& profile : job.stock.profiles()) {
        for (const auto& option : job.stock.optionsFor(profile)) {
            stock.push_back({{"profile_type", option.profileType},
                             {"stock_length", option.stockLength},
                             {"priority", option.priority},
                             {"is_default", option.isDefault},
                             {"name", option.name}});
        }
    }

    json settings = json::object();
    const JobSettings& s = job.settings;
    if (s.algorithm) {
        settings["algorithm"] = algorithmLabel(*s.algorithm);
    }
    if (s.kerf) {
        settings["kerf"] = *s.kerf;
    }
    if (s.startSafety) {
        settings["start_safety"] = *s.startSafety;
    }
    if (s.endSafety) {
        settings["end_safety"] = *s.endSafety;
    }
    if (s.timeBudgetMs) {
        settings["time_budget_ms"] = *s.timeBudgetMs;
    }
    if (s.seed) {
        settings["seed"] = *s.seed;
    }
    if (!settings.empty()) {
        doc["settings"] = settings;
    }
    return doc;
}

json PlanFile::resultToJson(const OptimizationResult& result, const std::string& name) {
    json doc;
    doc["format_version"] = FORMAT_VERSION;
    doc["name"] = name;
    doc["algorithm"] = algorithmLabel(result.algorithm);
    doc["seed"] = result.seed;
    doc["execution_time_ms"] = result.executionTimeMs;

    json summary;
    summary["bar_count"] = result.barCount();
    summary["total_stock_length"] = result.totalStockLength;
    summary["total_used_length"] = result.totalUsedLength;
    summary["total_kerf_loss"] = result.totalKerfLoss;
    summary["total_trim_loss"] = result.totalTrimLoss;
    summary["total_waste"] = result.totalWaste;
    summary["waste_percentage"] = result.wastePercentage;
    summary["efficiency"] = result.efficiency;
    summary["reclaimable_length"] = result.reclaimableLength;
    if (auto reason = result.convergenceReason()) {
        summary["convergence_reason"] = convergenceReasonLabel(*reason);
    } else {
        summary["convergence_reason"] = nullptr;
    }
    doc["summary"] = summary;

    json histogram = json::object();
    for (int c = 0; c < kWasteCategoryCount; ++c) {
        auto category = static_cast<WasteCategory>(c);
        histogram[wasteCategoryLabel(category)] = {{"count", result.histogram.count(category)},
                                                   {"length", result.histogram.length(category)}};
    }
    doc["waste_histogram"] = histogram;

    const CostBreakdown& cost = result.cost;
    doc["cost"] = {{"material", cost.materialCost},   {"labor", cost.laborCost},
                   {"waste", cost.wasteCost},         {"setup", cost.setupCost},
                   {"cutting", cost.cuttingCost},     {"time", cost.timeCost},
                   {"total", cost.totalCost},         {"cost_per_meter", cost.costPerMeter},
                   {"stock_meters", cost.stockMeters}, {"waste_meters", cost.wasteMeters},
                   {"setup_events", cost.setupEvents}, {"cut_count", cost.cutCount},
                   {"machine_hours", cost.machineHours}};

    const QualityAssessment& quality = result.quality;
    doc["quality"] = {{"score", quality.score},
                      {"grade", qualityGradeLabel(quality.grade)},
                      {"efficiency_score", quality.efficiencyScore},
                      {"distribution_score", quality.distributionScore},
                      {"constraint_score", quality.constraintScore},
                      {"tolerance_adjusted_segments", quality.toleranceAdjustedSegments}};

    auto& recommendations = doc["recommendations"];
    recommendations = json::array();
    for (const auto& r : result.recommendations) {
        recommendations.push_back({{"type", recommendationTypeLabel(r.type)},
                                   {"severity", severityLabel(r.severity)},
                                   {"message", r.message},
                                   {"potential_savings", r.potentialSavings},
                                   {"implementation_effort", effortLabel(r.implementationEffort)},
                                   {"profile_type", r.profileType}});
    }

    auto& cuts = doc["cuts"];
    cuts = json::array();
    for (const auto& cut : result.cuts) {
        cuts.push_back(cutToJson(cut));
    }

    auto& profiles = doc["profiles"];
    profiles = json::array();
    for (const auto& profile : result.profiles) {
        profiles.push_back(profileToJson(profile));
    }

    auto& orders = doc["work_orders"];
    orders = json::array();
    for (const auto& y : result.workOrders) {
        orders.push_back({{"work_order_id", y.workOrderId},
                          {"pieces", y.pieces},
                          {"piece_length", y.pieceLength},
                          {"stock_share", y.stockShare},
                          {"yield", y.yield}});
    }
    return doc;
}

bool PlanFile::saveJob(const Path& filePath, const JobFile& job) {
    if (!file::writeText(filePath, jobToJson(job).dump(2))) {
        log::errorf("PlanFile", "Failed to write %s", filePath.string().c_str());
        return false;
    }
    log::infof("PlanFile", "Saved job: %s", filePath.string().c_str());
    return true;
}

bool PlanFile::saveResult(const Path& filePath, const OptimizationResult& result,
                          const std::string& name) {
    if (!file::writeText(filePath, resultToJson(result, name).dump(2))) {
        log::errorf("PlanFile", "Failed to write %s", filePath.string().c_str());
        return false;
    }
    log::infof("PlanFile", "Saved cut plan: %s", filePath.string().c_str());
    return true;
}

} // namespace optimizer
} // namespace sc
