// StockCut - Plan File Tests

#include <gtest/gtest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "core/optimizer/engine.h"
#include "core/optimizer/plan_file.h"
#include "core/utils/file_utils.h"

using namespace sc::optimizer;

namespace {

// RAII temp directory for test isolation
class TempDir {
  public:
    TempDir() {
        m_path = std::filesystem::temp_directory_path() / "sc_test_plan_file";
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() { std::filesystem::remove_all(m_path); }

    sc::Path operator/(const std::string& name) const { return m_path / name; }

  private:
    sc::Path m_path;
};

const char* JOB_TEXT = R"({
  "format_version": 1,
  "name": "Facade lot 7",
  "items": [
    {"id": "transom", "profile_type": "AL-50", "length": 1480, "quantity": 6,
     "work_order_id": "WO-17", "tolerance": 1.5},
    {"profile_type": "AL-50", "length": 920, "quantity": 4, "priority": 2}
  ],
  "stock": [
    {"profile_type": "AL-50", "stock_length": 6000, "is_default": true, "name": "6m bar"},
    {"profile_type": "AL-50", "stock_length": 4500, "priority": 1}
  ],
  "settings": {"algorithm": "bfd", "kerf": 4, "seed": 77, "time_budget_ms": 250}
})";

} // namespace

// --- Parsing ---

TEST(PlanFile, ParseJob_ReadsItemsStockAndSettings) {
    auto job = PlanFile::parseJob(JOB_TEXT);
    ASSERT_TRUE(job.has_value());

    EXPECT_EQ(job->name, "Facade lot 7");
    ASSERT_EQ(job->items.size(), 2u);
    EXPECT_EQ(job->items[0].id, "transom");
    EXPECT_EQ(job->items[0].workOrderId, "WO-17");
    EXPECT_DOUBLE_EQ(job->items[0].tolerance, 1.5);
    EXPECT_EQ(job->items[0].quantity, 6);
    EXPECT_FALSE(job->items[0].priority.has_value());

    // Missing ids are numbered by position
    EXPECT_EQ(job->items[1].id, "item-2");
    ASSERT_TRUE(job->items[1].priority.has_value());
    EXPECT_EQ(*job->items[1].priority, 2);

    const auto& options = job->stock.optionsFor("AL-50");
    ASSERT_EQ(options.size(), 2u);
    EXPECT_TRUE(options[0].isDefault);
    EXPECT_EQ(options[0].name, "6m bar");
    EXPECT_EQ(options[1].priority, 1);

    ASSERT_TRUE(job->settings.algorithm.has_value());
    EXPECT_EQ(*job->settings.algorithm, Algorithm::BestFitDecreasing);
    EXPECT_DOUBLE_EQ(*job->settings.kerf, 4.0);
    EXPECT_EQ(*job->settings.seed, 77u);
    EXPECT_DOUBLE_EQ(*job->settings.timeBudgetMs, 250.0);
    EXPECT_FALSE(job->settings.startSafety.has_value());
}

TEST(PlanFile, ParseJob_Defaults) {
    auto job = PlanFile::parseJob(R"({"items": [{"profile_type": "P", "length": 500}]})");
    ASSERT_TRUE(job.has_value());
    ASSERT_EQ(job->items.size(), 1u);
    EXPECT_EQ(job->items[0].quantity, 1);
    EXPECT_DOUBLE_EQ(job->items[0].tolerance, 0.0);
    EXPECT_TRUE(job->stock.empty());
    EXPECT_FALSE(job->settings.algorithm.has_value());
}

TEST(PlanFile, ParseJob_RejectsBadDocuments) {
    EXPECT_FALSE(PlanFile::parseJob("not json").has_value());
    EXPECT_FALSE(PlanFile::parseJob(R"({"stock": []})").has_value());
    EXPECT_FALSE(PlanFile::parseJob(R"({"items": {}})").has_value());
    EXPECT_FALSE(PlanFile::parseJob(R"({"format_version": 2, "items": []})").has_value());
    EXPECT_FALSE(PlanFile::parseJob(R"({"items": [{"length": 500}]})").has_value());
    EXPECT_FALSE(
        PlanFile::parseJob(R"({"items": [{"profile_type": "P", "length": "long"}]})").has_value());
    EXPECT_FALSE(
        PlanFile::parseJob(R"({"items": [], "settings": {"algorithm": "simplex"}})").has_value());
}

TEST(PlanFile, ParseJob_TextFormatVersionIsRejected) {
    std::optional<JobFile> job;
    EXPECT_NO_THROW(job = PlanFile::parseJob(R"({"format_version": "1", "items": []})"));
    EXPECT_FALSE(job.has_value());
}

TEST(PlanFile, ParseJob_EmptyItemsIsAValidDocument) {
    auto job = PlanFile::parseJob(R"({"items": []})");
    ASSERT_TRUE(job.has_value());
    EXPECT_TRUE(job->items.empty());
}

// --- Files ---

TEST(PlanFile, SaveAndLoadJob) {
    TempDir tmp;
    auto original = PlanFile::parseJob(JOB_TEXT);
    ASSERT_TRUE(original.has_value());
    original->name.clear();

    auto path = tmp / "lot7.json";
    ASSERT_TRUE(PlanFile::saveJob(path, *original));

    auto loaded = PlanFile::loadJob(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, "lot7");
    ASSERT_EQ(loaded->items.size(), 2u);
    EXPECT_EQ(loaded->items[1].id, "item-2");
    EXPECT_EQ(loaded->stock.size(), 2u);
    EXPECT_EQ(*loaded->settings.seed, 77u);
}

TEST(PlanFile, LoadJob_MissingFile) {
    EXPECT_FALSE(PlanFile::loadJob("/nonexistent/job.json").has_value());
}

// --- Result documents ---

TEST(PlanFile, ResultJsonCarriesSummaryAndCuts) {
    auto job = PlanFile::parseJob(JOB_TEXT);
    ASSERT_TRUE(job.has_value());
    auto result = optimize(job->items, job->stock, AlgorithmConfig::ffd(4.0));

    nlohmann::json doc = PlanFile::resultToJson(result, "lot7");

    EXPECT_EQ(doc["format_version"], PlanFile::FORMAT_VERSION);
    EXPECT_EQ(doc["name"], "lot7");
    EXPECT_EQ(doc["algorithm"], "ffd");
    EXPECT_EQ(doc["summary"]["bar_count"], result.barCount());
    EXPECT_TRUE(doc["summary"]["convergence_reason"].is_null());
    EXPECT_TRUE(doc["waste_histogram"].contains("excessive"));
    EXPECT_DOUBLE_EQ(doc["cost"]["total"].get<double>(), result.cost.totalCost);
    ASSERT_EQ(doc["cuts"].size(), result.cuts.size());
    EXPECT_EQ(doc["cuts"][0]["pattern_key"], result.cuts[0].patternKey());
    EXPECT_EQ(doc["cuts"][0]["segments"][0]["sequence_number"], 1);
    ASSERT_EQ(doc["profiles"].size(), 1u);
    EXPECT_TRUE(doc["profiles"][0]["telemetry"].is_null());
    ASSERT_EQ(doc["work_orders"].size(), 1u);
    EXPECT_EQ(doc["work_orders"][0]["work_order_id"], "WO-17");
}

TEST(PlanFile, ResultJsonOfMultiObjectiveRun) {
    std::vector<CutItem> items = {CutItem("a", "P", 1900.0, 3), CutItem("b", "P", 1300.0, 4)};
    Nsga2Params params;
    params.search.maxGenerations = 5;
    params.search.populationSize = 12;
    auto result = optimize(items, StockCatalog({StockOption("P", 6000.0)}),
                           AlgorithmConfig::nsga2(params));

    nlohmann::json doc = PlanFile::resultToJson(result, "nsga");

    const auto& telemetry = doc["profiles"][0]["telemetry"];
    EXPECT_EQ(telemetry["kind"], "nsga-ii");
    EXPECT_EQ(telemetry["generations"], 5);
    ASSERT_FALSE(telemetry["pareto"]["front"].empty());
    // Boundary members have no finite crowding distance
    bool boundary = false;
    for (const auto& point : telemetry["pareto"]["front"]) {
        boundary = boundary || point["crowding_distance"].is_null();
    }
    EXPECT_TRUE(boundary);
    EXPECT_EQ(doc["summary"]["convergence_reason"], "max_generations");
}

TEST(PlanFile, ResultJsonOfPoolingKeepsInnerSearch) {
    std::vector<CutItem> items = {CutItem("a", "P", 2100.0, 3), CutItem("b", "P", 900.0, 4)};
    PoolingParams params;
    params.inner = Algorithm::Genetic;
    params.genetic.maxGenerations = 3;
    params.genetic.plateauGenerations = 0;
    params.genetic.populationSize = 10;
    auto result = optimize(items, StockCatalog({StockOption("P", 6000.0)}),
                           AlgorithmConfig::pooling(params));

    nlohmann::json doc = PlanFile::resultToJson(result, "pooled");

    const auto& telemetry = doc["profiles"][0]["telemetry"];
    EXPECT_EQ(telemetry["kind"], "pooling");
    ASSERT_TRUE(telemetry["search"].is_object());
    EXPECT_EQ(telemetry["search"]["kind"], "genetic");
    EXPECT_EQ(telemetry["search"]["generations"], 3);
    EXPECT_EQ(doc["summary"]["convergence_reason"], "max_generations");
}

TEST(PlanFile, SaveResultWritesJson) {
    TempDir tmp;
    auto result = optimize({CutItem("a", "P", 1000.0, 2)}, StockCatalog({StockOption("P", 3000.0)}),
                           AlgorithmConfig::ffd());
    auto path = tmp / "out" / "plan.json";

    ASSERT_TRUE(PlanFile::saveResult(path, result, "plan"));

    auto text = sc::file::readText(path);
    ASSERT_TRUE(text.has_value());
    auto doc = nlohmann::json::parse(*text);
    EXPECT_EQ(doc["summary"]["bar_count"], 1);
    EXPECT_DOUBLE_EQ(doc["summary"]["total_waste"].get<double>(), 1000.0);
}
