// StockCut - Genetic Search Tests

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <numeric>
#include <set>
#include <thread>

#include "core/optimizer/genetic.h"
#include "test_helpers.h"

using namespace sc::optimizer;

namespace {

std::vector<CutItem> sampleItems() {
    return {
        CutItem("a", "P", 1500.0, 3), CutItem("b", "P", 1100.0, 4), CutItem("c", "P", 870.0, 5),
        CutItem("d", "P", 640.0, 6),  CutItem("e", "P", 410.0, 4),
    };
}

std::vector<StockOption> sampleStock() {
    return {StockOption("P", 6000.0)};
}

CuttingParams sampleCutting() {
    CuttingParams cutting;
    cutting.kerf = 3.0;
    return cutting;
}

bool isPermutation(const Genome& genome, size_t n) {
    if (genome.size() != n) {
        return false;
    }
    Genome sorted = genome;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < n; ++i) {
        if (sorted[i] != static_cast<int>(i)) {
            return false;
        }
    }
    return true;
}

Genome identity(size_t n) {
    Genome genome(n);
    std::iota(genome.begin(), genome.end(), 0);
    return genome;
}

} // namespace

// --- Operators ---

TEST(GeneticOperators, OrderCrossoverProducesPermutations) {
    Genome a = identity(12);
    Genome b(a.rbegin(), a.rend());
    Rng rng(7);

    for (int round = 0; round < 50; ++round) {
        auto children = orderCrossover(a, b, rng);
        EXPECT_TRUE(isPermutation(children.first, 12));
        EXPECT_TRUE(isPermutation(children.second, 12));
    }
}

TEST(GeneticOperators, CrossoverOfIdenticalParentsIsIdentity) {
    Genome a = {3, 1, 4, 0, 2};
    Rng rng(99);

    auto children = orderCrossover(a, a, rng);

    EXPECT_EQ(children.first, a);
    EXPECT_EQ(children.second, a);
}

TEST(GeneticOperators, MutationsKeepPermutation) {
    Rng rng(1);
    Genome genome = identity(20);

    for (int round = 0; round < 100; ++round) {
        swapMutation(genome, rng);
        EXPECT_TRUE(isPermutation(genome, 20));
        segmentShuffleMutation(genome, rng);
        EXPECT_TRUE(isPermutation(genome, 20));
        mutate(genome, rng);
        EXPECT_TRUE(isPermutation(genome, 20));
    }
}

TEST(GeneticOperators, SingleGeneIsUntouched) {
    Rng rng(5);
    Genome genome = {0};
    mutate(genome, rng);
    EXPECT_EQ(genome, Genome{0});

    auto children = orderCrossover(genome, genome, rng);
    EXPECT_EQ(children.first, Genome{0});
}

TEST(GeneticOperators, DefaultPopulationSizeIsClamped) {
    EXPECT_EQ(defaultPopulationSize(3), 20);
    EXPECT_EQ(defaultPopulationSize(10), 20);
    EXPECT_EQ(defaultPopulationSize(50), 100);
    EXPECT_EQ(defaultPopulationSize(1000), 200);
}

TEST(GeneticOperators, DiversityCountsDistinctFitness) {
    std::vector<Individual> population(4);
    population[0].eval.fitness = 1.0;
    population[1].eval.fitness = 1.0;
    population[2].eval.fitness = 2.0;
    population[3].eval.fitness = 3.0;

    EXPECT_DOUBLE_EQ(populationDiversity(population), 0.75);
    EXPECT_DOUBLE_EQ(populationDiversity({}), 0.0);
}

TEST(GeneticOperators, LargeTournamentFindsFittest) {
    std::vector<Individual> population(5);
    const double fitness[] = {0.9, 0.7, 0.1, 0.5, 0.3};
    for (size_t i = 0; i < population.size(); ++i) {
        population[i].eval.fitness = fitness[i];
    }
    Rng rng(3);

    EXPECT_EQ(tournamentSelect(population, 200, rng), 2u);
}

TEST(GeneticOperators, TournamentTieGoesToLowerIndex) {
    std::vector<Individual> population(3);
    for (auto& individual : population) {
        individual.eval.fitness = 1.0;
    }
    Rng rng(11);

    EXPECT_EQ(tournamentSelect(population, 200, rng), 0u);
}

// --- Search ---

class GeneticSearchTest : public ::testing::Test {
  protected:
    GeneticSearchTest()
        : m_items(sampleItems()),
          m_decoder(m_items, expandItems(m_items, {0, 1, 2, 3, 4}), sampleStock(),
                    sampleCutting()),
          m_model(FitnessWeights{}, CostRates{}, TimeModel{}, WastePolicy{}) {
        m_model.calibrate(m_decoder);
    }

    GeneticParams quickParams() const {
        GeneticParams params;
        params.maxGenerations = 15;
        params.plateauGenerations = 0;
        return params;
    }

    std::vector<CutItem> m_items;
    LayoutDecoder m_decoder;
    FitnessModel m_model;
};

TEST_F(GeneticSearchTest, DecoderReportsDemandAndBound) {
    EXPECT_EQ(m_decoder.size(), 22u);
    EXPECT_DOUBLE_EQ(m_decoder.demand(), 4500.0 + 4400.0 + 4350.0 + 3840.0 + 1640.0);
    // (18730 + 22 x 3) / 6000 rounded up
    EXPECT_EQ(m_decoder.barLowerBound(), 4);
}

TEST_F(GeneticSearchTest, SeedPopulationStartsWithDecreasingOrder) {
    Rng rng(1);
    auto population = seedPopulation(m_decoder, 30, rng);

    ASSERT_EQ(population.size(), 30u);
    EXPECT_EQ(population[0].genome, m_decoder.decreasingOrder());
    for (const auto& individual : population) {
        EXPECT_TRUE(isPermutation(individual.genome, m_decoder.size()));
        EXPECT_FALSE(individual.evaluated);
    }
}

TEST_F(GeneticSearchTest, EveryGenomeDecodesToFeasibleLayout) {
    Rng rng(21);
    auto population = seedPopulation(m_decoder, 10, rng);

    for (const auto& individual : population) {
        auto cuts = m_decoder.decode(individual.genome).buildCuts("P", WastePolicy{});
        sc_test::expectConservation(m_items, cuts);
        sc_test::expectFeasible(m_items, cuts, sampleCutting());
    }
}

TEST_F(GeneticSearchTest, NeverWorseThanFirstFitDecreasing) {
    GeneticParams params = quickParams();
    auto result = runGeneticSearch(m_decoder, m_model, params, 12345, RunControl{});

    Evaluation ffd = m_model.evaluate(m_decoder.decode(m_decoder.decreasingOrder()));
    EXPECT_DOUBLE_EQ(result.telemetry.initialFitness, ffd.fitness);
    EXPECT_LE(result.telemetry.bestFitness, ffd.fitness);
    EXPECT_DOUBLE_EQ(result.best.eval.fitness, result.telemetry.bestFitness);
}

TEST_F(GeneticSearchTest, SameSeedIsBitIdentical) {
    GeneticParams params = quickParams();
    auto first = runGeneticSearch(m_decoder, m_model, params, 42, RunControl{});
    auto second = runGeneticSearch(m_decoder, m_model, params, 42, RunControl{});

    EXPECT_EQ(first.best.genome, second.best.genome);
    EXPECT_EQ(first.telemetry.bestFitness, second.telemetry.bestFitness);
    ASSERT_EQ(first.telemetry.history.size(), second.telemetry.history.size());
    for (size_t i = 0; i < first.telemetry.history.size(); ++i) {
        EXPECT_EQ(first.telemetry.history[i].averageFitness,
                  second.telemetry.history[i].averageFitness);
    }
}

TEST_F(GeneticSearchTest, ParallelEvaluationMatchesSerial) {
    GeneticParams serial = quickParams();
    GeneticParams parallel = quickParams();
    parallel.evaluationThreads = 4;

    auto a = runGeneticSearch(m_decoder, m_model, serial, 8, RunControl{});
    auto b = runGeneticSearch(m_decoder, m_model, parallel, 8, RunControl{});

    EXPECT_EQ(a.best.genome, b.best.genome);
    EXPECT_EQ(a.telemetry.bestFitness, b.telemetry.bestFitness);
    EXPECT_EQ(a.telemetry.evaluations, b.telemetry.evaluations);
}

TEST_F(GeneticSearchTest, MoreGenerationsNeverWorse) {
    GeneticParams shortRun = quickParams();
    shortRun.maxGenerations = 5;
    GeneticParams longRun = quickParams();
    longRun.maxGenerations = 25;

    auto a = runGeneticSearch(m_decoder, m_model, shortRun, 77, RunControl{});
    auto b = runGeneticSearch(m_decoder, m_model, longRun, 77, RunControl{});

    EXPECT_LE(b.telemetry.bestFitness, a.telemetry.bestFitness);
}

TEST_F(GeneticSearchTest, HistoryIsMonotone) {
    auto result = runGeneticSearch(m_decoder, m_model, quickParams(), 5, RunControl{});

    const auto& history = result.telemetry.history;
    ASSERT_EQ(history.size(), static_cast<size_t>(result.telemetry.generations) + 1);
    for (size_t i = 1; i < history.size(); ++i) {
        EXPECT_EQ(history[i].generation, static_cast<int>(i));
        EXPECT_LE(history[i].bestFitness, history[i - 1].bestFitness);
        EXPECT_GT(history[i].diversity, 0.0);
    }
}

TEST_F(GeneticSearchTest, StopsAtGenerationCap) {
    GeneticParams params = quickParams();
    params.maxGenerations = 3;
    params.populationSize = 24;
    params.eliteCount = 2;

    auto result = runGeneticSearch(m_decoder, m_model, params, 1, RunControl{});

    EXPECT_EQ(result.telemetry.convergenceReason, ConvergenceReason::MaxGenerations);
    EXPECT_EQ(result.telemetry.generations, 3);
    EXPECT_EQ(result.telemetry.populationSize, 24);
    // Elites carry their evaluation over
    EXPECT_EQ(result.telemetry.evaluations, 24 + 3 * (24 - 2));
}

TEST_F(GeneticSearchTest, ZeroGenerationsReturnsBestInitial) {
    GeneticParams params = quickParams();
    params.maxGenerations = 0;

    auto result = runGeneticSearch(m_decoder, m_model, params, 1, RunControl{});

    EXPECT_EQ(result.telemetry.generations, 0);
    EXPECT_EQ(result.telemetry.convergenceReason, ConvergenceReason::MaxGenerations);
    EXPECT_LE(result.telemetry.bestFitness, result.telemetry.initialFitness);
}

TEST_F(GeneticSearchTest, PlateauEndsSearch) {
    GeneticParams params;
    params.maxGenerations = 100000;
    params.plateauGenerations = 3;

    auto result = runGeneticSearch(m_decoder, m_model, params, 9, RunControl{});

    EXPECT_EQ(result.telemetry.convergenceReason, ConvergenceReason::FitnessPlateau);
    EXPECT_LT(result.telemetry.generations, 100000);
}

TEST_F(GeneticSearchTest, ExpiredDeadlineReportsTimeBudget) {
    GeneticParams params;
    params.maxGenerations = 100000;
    params.plateauGenerations = 0;

    RunControl control;
    control.deadline = Deadline::after(0.001);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto result = runGeneticSearch(m_decoder, m_model, params, 9, control);

    EXPECT_EQ(result.telemetry.convergenceReason, ConvergenceReason::TimeBudget);
    EXPECT_EQ(result.telemetry.generations, 0);
    auto cuts = m_decoder.decode(result.best.genome).buildCuts("P", WastePolicy{});
    sc_test::expectConservation(m_items, cuts);
}

TEST(Deadline, HugeBudgetNeverExpires) {
    Deadline deadline = Deadline::after(1e300);

    EXPECT_TRUE(deadline.limited());
    EXPECT_FALSE(deadline.expired());
}

TEST_F(GeneticSearchTest, HugeTimeBudgetRunsAllGenerations) {
    GeneticParams params;
    params.maxGenerations = 5;
    params.plateauGenerations = 0;

    RunControl control;
    control.deadline = Deadline::after(1e300);

    auto result = runGeneticSearch(m_decoder, m_model, params, 9, control);

    EXPECT_EQ(result.telemetry.convergenceReason, ConvergenceReason::MaxGenerations);
    EXPECT_EQ(result.telemetry.generations, 5);
}

TEST_F(GeneticSearchTest, CancellationThrows) {
    CancellationToken token;
    token.requestStop();
    RunControl control;
    control.token = &token;

    EXPECT_THROW(runGeneticSearch(m_decoder, m_model, quickParams(), 1, control),
                 OptimizationCancelledError);
}

// --- Optimizer ---

TEST(GeneticOptimizer, ProducesValidLayoutAndTelemetry) {
    std::vector<CutItem> items = sampleItems();
    GeneticParams params;
    params.maxGenerations = 10;
    AlgorithmConfig config = AlgorithmConfig::genetic(params, 3.0);

    ProfileProblem problem;
    problem.profileType = "P";
    problem.items = &items;
    problem.itemIndices = {0, 1, 2, 3, 4};
    problem.stock = sampleStock();
    problem.seed = 2024;

    GeneticOptimizer optimizer(config);
    EXPECT_EQ(optimizer.algorithm(), Algorithm::Genetic);
    auto outcome = optimizer.optimize(problem, RunControl{});

    sc_test::expectConservation(items, outcome.cuts);
    sc_test::expectFeasible(items, outcome.cuts, config.cutting);

    const auto* telemetry = std::get_if<GeneticTelemetry>(&outcome.telemetry);
    ASSERT_NE(telemetry, nullptr);
    EXPECT_EQ(telemetry->populationSize, 44);
    EXPECT_LE(telemetry->generations, 10);
    EXPECT_LE(telemetry->bestFitness, telemetry->initialFitness);
}

TEST(GeneticOptimizer, FitnessRewardsFewerBars) {
    FitnessModel model(FitnessWeights{}, CostRates{}, TimeModel{}, WastePolicy{});

    LayoutMetrics tight;
    tight.bars = 2;
    tight.pieces = 6;
    tight.patterns = 1;
    tight.stockLength = 12000.0;
    tight.usedLength = 11800.0;
    tight.waste = 200.0;

    LayoutMetrics loose = tight;
    loose.bars = 3;
    loose.stockLength = 18000.0;
    loose.waste = 6200.0;

    EXPECT_LT(model.evaluate(tight).fitness, model.evaluate(loose).fitness);
    EXPECT_DOUBLE_EQ(model.evaluate(loose).objectives.barCount, 3.0);
    EXPECT_DOUBLE_EQ(model.evaluate(loose).objectives.waste, 6200.0);
}
