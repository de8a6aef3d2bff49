// StockCut - Engine Config Tests

#include <gtest/gtest.h>

#include <filesystem>

#include "core/config/engine_config.h"
#include "core/utils/file_utils.h"

using sc::EngineConfig;
using namespace sc::optimizer;

namespace {

// RAII temp directory for test isolation
class TempDir {
  public:
    TempDir() {
        m_path = std::filesystem::temp_directory_path() / "sc_test_engine_config";
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() { std::filesystem::remove_all(m_path); }

    sc::Path operator/(const std::string& name) const { return m_path / name; }

  private:
    sc::Path m_path;
};

} // namespace

// --- Defaults ---

TEST(EngineConfig, DefaultsMatchTheRunConfiguration) {
    EngineConfig config;
    AlgorithmConfig run = config.algorithmConfig();

    EXPECT_EQ(run.mode(), Algorithm::FirstFitDecreasing);
    EXPECT_DOUBLE_EQ(run.cutting.kerf, 0.0);
    EXPECT_FALSE(run.seed.has_value());
    EXPECT_EQ(run.effectiveSeed(), kDefaultSeed);
    EXPECT_DOUBLE_EQ(run.cost.materialPerMeter, 1.0);
    EXPECT_EQ(run.profileThreads, 1);
    EXPECT_NO_THROW(validateConfig(run));
}

// --- Parsing ---

TEST(EngineConfig, ParsesEverySection) {
    EngineConfig config;
    config.loadFromString(R"(
# shop floor defaults
[Algorithm]
mode = Genetic
time_budget_ms = 1500
seed = 4242
profile_threads = 2

[cutting]
kerf = 3.2
start_safety = 10
end_safety = 15
tolerance_squeeze = yes
right_size_stock = on
stock_selection = waste_per_piece

[genetic]
population = 80
generations = 120
plateau = 12
tournament = 4
elites = 3
crossover_rate = 0.9
mutation_rate = 0.2
threads = 0
weight_waste = 0.6
weight_reclaim = 0

[nsga2]
population = auto
selection = closest_to_ideal
weight_cost = 0.5

[pooling]
inner = bfd
min_waste_reduction = 0.05
max_mixed_bar_ratio = 0.5

[waste]
large_up_to = 600
reclaim_floor = 400

[cost]
material_per_meter = 7.5
setup_per_event = 12

[time]
minutes_per_cut = 0.25

[logging]
level = warning
)");

    EXPECT_EQ(config.mode, Algorithm::Genetic);
    EXPECT_DOUBLE_EQ(config.timeBudgetMs, 1500.0);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 4242u);
    EXPECT_EQ(config.profileThreads, 2);

    EXPECT_DOUBLE_EQ(config.cutting.kerf, 3.2);
    EXPECT_DOUBLE_EQ(config.cutting.trimLoss(), 25.0);
    EXPECT_TRUE(config.cutting.allowToleranceSqueeze);
    EXPECT_TRUE(config.cutting.rightSizeStock);
    EXPECT_EQ(config.cutting.stockSelection, StockSelection::WastePerPiece);

    ASSERT_TRUE(config.genetic.populationSize.has_value());
    EXPECT_EQ(*config.genetic.populationSize, 80);
    EXPECT_EQ(config.genetic.maxGenerations, 120);
    EXPECT_EQ(config.genetic.plateauGenerations, 12);
    EXPECT_EQ(config.genetic.tournamentSize, 4);
    EXPECT_EQ(config.genetic.eliteCount, 3);
    EXPECT_DOUBLE_EQ(config.genetic.crossoverRate, 0.9);
    EXPECT_EQ(config.genetic.evaluationThreads, 0);
    EXPECT_DOUBLE_EQ(config.genetic.weights.waste, 0.6);
    EXPECT_DOUBLE_EQ(config.genetic.weights.reclaimBonus, 0.0);

    EXPECT_FALSE(config.nsga2.search.populationSize.has_value());
    EXPECT_EQ(config.nsga2.selection, FrontSelection::ClosestToIdeal);
    EXPECT_DOUBLE_EQ(config.nsga2.scalarization.cost, 0.5);

    EXPECT_EQ(config.pooling.inner, Algorithm::BestFitDecreasing);
    EXPECT_DOUBLE_EQ(config.pooling.minWasteReduction, 0.05);

    EXPECT_DOUBLE_EQ(config.waste.largeUpTo, 600.0);
    EXPECT_DOUBLE_EQ(config.waste.reclaimFloor, 400.0);
    EXPECT_DOUBLE_EQ(config.cost.materialPerMeter, 7.5);
    EXPECT_DOUBLE_EQ(config.cost.setupPerEvent, 12.0);
    EXPECT_DOUBLE_EQ(config.time.minutesPerCut, 0.25);
    EXPECT_EQ(config.logLevel, sc::log::Level::Warning);
}

TEST(EngineConfig, MalformedValuesKeepDefaults) {
    EngineConfig config;
    config.loadFromString(R"(
[algorithm]
mode = simplex
time_budget_ms = soon
seed = -3
[cutting]
kerf = 3mm
tolerance_squeeze = perhaps
[genetic]
generations = many
[logging]
level = loud
no equals sign here
)");

    EXPECT_EQ(config.mode, Algorithm::FirstFitDecreasing);
    EXPECT_DOUBLE_EQ(config.timeBudgetMs, 0.0);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_DOUBLE_EQ(config.cutting.kerf, 0.0);
    EXPECT_FALSE(config.cutting.allowToleranceSqueeze);
    EXPECT_EQ(config.genetic.maxGenerations, 200);
    EXPECT_EQ(config.logLevel, sc::log::Level::Info);
}

TEST(EngineConfig, AutoSeedClearsAnEarlierSeed) {
    EngineConfig config;
    config.loadFromString("[algorithm]\nseed=9\n");
    ASSERT_TRUE(config.seed.has_value());
    config.loadFromString("[algorithm]\nseed=auto\n");
    EXPECT_FALSE(config.seed.has_value());
}

TEST(EngineConfig, PoolingCarriesGeneticSettings) {
    EngineConfig config;
    config.loadFromString("[algorithm]\nmode=pooling\n[pooling]\ninner=genetic\n"
                          "[genetic]\ngenerations=7\n");

    AlgorithmConfig run = config.algorithmConfig();
    ASSERT_EQ(run.mode(), Algorithm::Pooling);
    const auto& params = std::get<PoolingParams>(run.strategy);
    EXPECT_EQ(params.inner, Algorithm::Genetic);
    EXPECT_EQ(params.genetic.maxGenerations, 7);
}

TEST(EngineConfig, Nsga2ModeUsesItsOwnSection) {
    EngineConfig config;
    config.loadFromString("[algorithm]\nmode=nsga-ii\n[nsga2]\ngenerations=9\n"
                          "[genetic]\ngenerations=50\n");

    AlgorithmConfig run = config.algorithmConfig();
    ASSERT_EQ(run.mode(), Algorithm::Nsga2);
    EXPECT_EQ(std::get<Nsga2Params>(run.strategy).search.maxGenerations, 9);
}

// --- Persistence ---

TEST(EngineConfig, SerializeThenLoadKeepsSettings) {
    EngineConfig original;
    original.mode = Algorithm::Nsga2;
    original.seed = 31337;
    original.cutting.kerf = 2.5;
    original.cutting.stockSelection = StockSelection::WastePerPiece;
    original.nsga2.selection = FrontSelection::ClosestToIdeal;
    original.pooling.inner = Algorithm::Genetic;
    original.cost.laborPerHour = 42.0;
    original.logLevel = sc::log::Level::Debug;

    std::string text = original.serialize();
    EXPECT_EQ(text.rfind("# StockCut engine configuration", 0), 0u);

    EngineConfig copy;
    copy.loadFromString(text);
    EXPECT_EQ(copy.mode, Algorithm::Nsga2);
    ASSERT_TRUE(copy.seed.has_value());
    EXPECT_EQ(*copy.seed, 31337u);
    EXPECT_DOUBLE_EQ(copy.cutting.kerf, 2.5);
    EXPECT_EQ(copy.cutting.stockSelection, StockSelection::WastePerPiece);
    EXPECT_EQ(copy.nsga2.selection, FrontSelection::ClosestToIdeal);
    EXPECT_EQ(copy.pooling.inner, Algorithm::Genetic);
    EXPECT_DOUBLE_EQ(copy.cost.laborPerHour, 42.0);
    EXPECT_EQ(copy.logLevel, sc::log::Level::Debug);
    EXPECT_FALSE(copy.genetic.populationSize.has_value());
}

TEST(EngineConfig, LogLevelIsWrittenLowercase) {
    EngineConfig config;
    config.logLevel = sc::log::Level::Warning;
    std::string text = config.serialize();

    EXPECT_NE(text.find("[logging]\nlevel=warning\n"), std::string::npos);
}

TEST(EngineConfig, UnsetSeedIsWrittenAsAuto) {
    EngineConfig config;
    EXPECT_NE(config.serialize().find("seed=auto"), std::string::npos);
}

TEST(EngineConfig, SaveAndLoadFile) {
    TempDir tmp;
    auto path = tmp / "engine.ini";

    EngineConfig original;
    original.timeBudgetMs = 800.0;
    original.profileThreads = 3;
    ASSERT_TRUE(original.save(path));
    EXPECT_TRUE(sc::file::isFile(path));

    EngineConfig loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_DOUBLE_EQ(loaded.timeBudgetMs, 800.0);
    EXPECT_EQ(loaded.profileThreads, 3);
}

TEST(EngineConfig, MissingFileMeansDefaults) {
    EngineConfig config;
    EXPECT_TRUE(config.load("/nonexistent/dir/engine.ini"));
    EXPECT_EQ(config.mode, Algorithm::FirstFitDecreasing);
}
