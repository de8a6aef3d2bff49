// StockCut - Analytics Tests

#include <gtest/gtest.h>

#include "core/optimizer/analytics.h"

using namespace sc::optimizer;

namespace {

// Lays pieces out left to right with the given kerf and classifies the rest
Cut makeCut(const std::string& profile, double stock, const std::vector<double>& lengths,
            double kerf = 0.0, const std::string& order = "") {
    Cut cut;
    cut.profileType = profile;
    cut.stockLength = stock;
    double position = 0.0;
    int sequence = 1;
    for (double length : lengths) {
        Segment s;
        s.itemIndex = 0;
        s.itemId = "x";
        s.workOrderId = order;
        s.length = length;
        s.position = position;
        s.endPosition = position + length;
        s.sequenceNumber = sequence++;
        cut.segments.push_back(s);
        cut.usedLength += length;
        position += length + kerf;
    }
    cut.kerfLoss = kerf * static_cast<double>(lengths.size());
    cut.remainingLength = stock - cut.usedLength - cut.kerfLoss;
    WastePolicy policy;
    cut.wasteCategory = categorizeWaste(cut.remainingLength, policy);
    cut.isReclaimable = isReclaimableWaste(cut.remainingLength, policy);
    return cut;
}

} // namespace

// --- Waste classification ---

TEST(Analytics, WasteCategoryBoundaries) {
    WastePolicy policy;
    EXPECT_EQ(categorizeWaste(0.0, policy), WasteCategory::Minimal);
    EXPECT_EQ(categorizeWaste(49.9, policy), WasteCategory::Minimal);
    EXPECT_EQ(categorizeWaste(50.0, policy), WasteCategory::Small);
    EXPECT_EQ(categorizeWaste(149.9, policy), WasteCategory::Small);
    EXPECT_EQ(categorizeWaste(150.0, policy), WasteCategory::Medium);
    EXPECT_EQ(categorizeWaste(300.0, policy), WasteCategory::Large);
    EXPECT_EQ(categorizeWaste(500.0, policy), WasteCategory::Large);
    EXPECT_EQ(categorizeWaste(500.1, policy), WasteCategory::Excessive);
}

TEST(Analytics, ReclaimableNeedsFloorAndLargeCategory) {
    WastePolicy policy;
    EXPECT_FALSE(isReclaimableWaste(299.0, policy));
    EXPECT_TRUE(isReclaimableWaste(300.0, policy));
    EXPECT_TRUE(isReclaimableWaste(2000.0, policy));

    // A floor below the large category still needs a large remainder
    policy.reclaimFloor = 100.0;
    EXPECT_FALSE(isReclaimableWaste(200.0, policy));
}

TEST(Analytics, ClassifyCutsFollowsPolicy) {
    std::vector<Cut> cuts = {makeCut("P", 1000, {600})};
    EXPECT_EQ(cuts[0].wasteCategory, WasteCategory::Large);

    WastePolicy strict;
    strict.largeUpTo = 350.0;
    classifyCuts(cuts, strict);
    EXPECT_EQ(cuts[0].wasteCategory, WasteCategory::Excessive);
    EXPECT_TRUE(cuts[0].isReclaimable);
}

TEST(Analytics, LabelsAreLowercase) {
    EXPECT_STREQ(wasteCategoryLabel(WasteCategory::Excessive), "excessive");
    EXPECT_STREQ(qualityGradeLabel(QualityGrade::Average), "average");
    EXPECT_STREQ(severityLabel(Severity::Critical), "critical");
}

// --- Histogram ---

TEST(Analytics, HistogramCountsAndLengths) {
    std::vector<Cut> cuts = {
        makeCut("P", 1000, {980}), // 20 minimal
        makeCut("P", 1000, {900}), // 100 small
        makeCut("P", 1000, {850}), // 150 medium
        makeCut("P", 1000, {200}), // 800 excessive
        makeCut("P", 1000, {100}), // 900 excessive
    };

    auto histogram = buildHistogram(cuts);

    EXPECT_EQ(histogram.count(WasteCategory::Minimal), 1);
    EXPECT_EQ(histogram.count(WasteCategory::Small), 1);
    EXPECT_EQ(histogram.count(WasteCategory::Medium), 1);
    EXPECT_EQ(histogram.count(WasteCategory::Large), 0);
    EXPECT_EQ(histogram.count(WasteCategory::Excessive), 2);
    EXPECT_DOUBLE_EQ(histogram.length(WasteCategory::Excessive), 1700.0);
}

// --- Cost ---

TEST(Analytics, SetupEventsCountDistinctPatterns) {
    std::vector<Cut> cuts = {
        makeCut("P", 3000, {1000, 1000}),
        makeCut("P", 3000, {1000, 1000}),
        makeCut("Q", 3000, {1000, 1000}),
        makeCut("P", 3000, {1000, 500}),
    };
    EXPECT_EQ(countSetupEvents(cuts), 3);
}

TEST(Analytics, DefaultCostIsStockMeters) {
    std::vector<Cut> cuts = {makeCut("P", 6000, {2000, 2000}, 5.0),
                             makeCut("P", 6000, {2000, 2000}, 5.0)};

    CostBreakdown cost = computeCost(quantitiesOf(cuts), CostRates{}, TimeModel{});

    EXPECT_DOUBLE_EQ(cost.stockMeters, 12.0);
    EXPECT_DOUBLE_EQ(cost.materialCost, 12.0);
    EXPECT_DOUBLE_EQ(cost.totalCost, 12.0);
    EXPECT_DOUBLE_EQ(cost.costPerMeter, 12.0 / 8.0);
    EXPECT_EQ(cost.cutCount, 4);
    EXPECT_EQ(cost.setupEvents, 1);
    // 2 bars x 1.0 min + 4 cuts x 0.5 min
    EXPECT_DOUBLE_EQ(cost.machineHours, 4.0 / 60.0);
}

TEST(Analytics, CostSumsEveryTerm) {
    CostQuantities q;
    q.stockLength = 6000.0;
    q.usedLength = 5000.0;
    q.waste = 1000.0;
    q.bars = 1;
    q.cuts = 4;
    q.setupEvents = 1;

    CostRates rates;
    rates.materialPerMeter = 10.0;
    rates.laborPerHour = 60.0;
    rates.wastePerMeter = 2.0;
    rates.setupPerEvent = 7.0;
    rates.cuttingPerCut = 0.5;
    rates.machinePerHour = 30.0;

    CostBreakdown cost = computeCost(q, rates, TimeModel{});

    EXPECT_DOUBLE_EQ(cost.materialCost, 60.0);
    EXPECT_DOUBLE_EQ(cost.machineHours, 3.0 / 60.0);
    EXPECT_DOUBLE_EQ(cost.laborCost, 3.0);
    EXPECT_DOUBLE_EQ(cost.wasteCost, 2.0);
    EXPECT_DOUBLE_EQ(cost.setupCost, 7.0);
    EXPECT_DOUBLE_EQ(cost.cuttingCost, 2.0);
    EXPECT_DOUBLE_EQ(cost.timeCost, 1.5);
    EXPECT_NEAR(cost.totalCost, 75.5, 1e-9);
    EXPECT_NEAR(cost.costPerMeter, 75.5 / 5.0, 1e-9);
}

TEST(Analytics, EmptyLayoutCostsNothing) {
    CostBreakdown cost = computeCost(quantitiesOf(std::vector<Cut>{}), CostRates{}, TimeModel{});
    EXPECT_DOUBLE_EQ(cost.totalCost, 0.0);
    EXPECT_DOUBLE_EQ(cost.costPerMeter, 0.0);
}

// --- Quality ---

TEST(Analytics, PerfectLayoutIsExcellent) {
    auto quality = assessQuality({makeCut("P", 2000, {1000, 1000})});
    EXPECT_DOUBLE_EQ(quality.efficiencyScore, 1.0);
    EXPECT_DOUBLE_EQ(quality.distributionScore, 1.0);
    EXPECT_DOUBLE_EQ(quality.constraintScore, 1.0);
    EXPECT_DOUBLE_EQ(quality.score, 1.0);
    EXPECT_EQ(quality.grade, QualityGrade::Excellent);
}

TEST(Analytics, QualityWeighsEfficiencyDistributionAndTolerance) {
    std::vector<Cut> cuts = {
        makeCut("P", 1000, {800}),  // 200 medium: dead waste
        makeCut("P", 1000, {600}),  // 400 large: reclaimable
    };
    cuts[0].segments[0].toleranceAdjusted = true;

    auto quality = assessQuality(cuts);

    EXPECT_DOUBLE_EQ(quality.efficiencyScore, 0.7);
    EXPECT_NEAR(quality.distributionScore, 1.0 - 200.0 / 600.0, 1e-12);
    EXPECT_DOUBLE_EQ(quality.constraintScore, 0.5);
    EXPECT_EQ(quality.toleranceAdjustedSegments, 1);
    double expected = 0.7 * 0.7 + 0.15 * (1.0 - 200.0 / 600.0) + 0.15 * 0.5;
    EXPECT_NEAR(quality.score, expected, 1e-12);
    EXPECT_EQ(quality.grade, QualityGrade::Average);
}

TEST(Analytics, GradeThresholds) {
    EXPECT_EQ(gradeFor(0.95), QualityGrade::Excellent);
    EXPECT_EQ(gradeFor(0.9), QualityGrade::Excellent);
    EXPECT_EQ(gradeFor(0.85), QualityGrade::Good);
    EXPECT_EQ(gradeFor(0.6), QualityGrade::Average);
    EXPECT_EQ(gradeFor(0.59), QualityGrade::Poor);
}

// --- Summaries ---

TEST(Analytics, StockSummaryGroupsByLength) {
    std::vector<Cut> cuts = {
        makeCut("P", 6000, {3000, 2900}),
        makeCut("P", 3000, {1500}),
        makeCut("P", 6000, {3000, 2900}),
    };

    auto summary = summarizeStock(cuts);

    ASSERT_EQ(summary.size(), 2u);
    EXPECT_DOUBLE_EQ(summary[0].stockLength, 3000.0);
    EXPECT_EQ(summary[0].barCount, 1);
    EXPECT_DOUBLE_EQ(summary[1].stockLength, 6000.0);
    EXPECT_EQ(summary[1].barCount, 2);
    EXPECT_EQ(summary[1].patternCount, 1);
    EXPECT_EQ(summary[1].pieceCount, 4);
    EXPECT_DOUBLE_EQ(summary[1].wasteLength, 200.0);

    auto profile = summarizeProfile("P", cuts);
    EXPECT_EQ(profile.barCount, 3);
    EXPECT_EQ(profile.pieceCount, 5);
    EXPECT_DOUBLE_EQ(profile.totalStockLength, 15000.0);
    EXPECT_DOUBLE_EQ(profile.efficiency, 13300.0 / 15000.0);
}

TEST(Analytics, WorkOrderYieldSharesBarsByLength) {
    Cut shared = makeCut("P", 2000, {1000, 600}, 0.0, "WO-1");
    shared.segments[1].workOrderId = "WO-2";
    Cut own = makeCut("P", 1000, {900}, 0.0, "WO-2");
    Cut anonymous = makeCut("P", 1000, {900});

    auto yields = workOrderYields({shared, own, anonymous});

    ASSERT_EQ(yields.size(), 2u);
    EXPECT_EQ(yields[0].workOrderId, "WO-1");
    EXPECT_EQ(yields[0].pieces, 1);
    EXPECT_DOUBLE_EQ(yields[0].stockShare, 1250.0);
    EXPECT_DOUBLE_EQ(yields[0].yield, 0.8);

    EXPECT_EQ(yields[1].workOrderId, "WO-2");
    EXPECT_EQ(yields[1].pieces, 2);
    EXPECT_DOUBLE_EQ(yields[1].pieceLength, 1500.0);
    EXPECT_DOUBLE_EQ(yields[1].stockShare, 750.0 + 1000.0);
}

TEST(Analytics, BarLowerBoundUsesLongestStock) {
    std::vector<Cut> cuts = {makeCut("P", 3000, {1000}, 5.0), makeCut("P", 3000, {1000}, 5.0),
                             makeCut("P", 3000, {1000}, 5.0)};
    std::vector<StockOption> options = {StockOption("P", 3000), StockOption("P", 6000)};
    EXPECT_EQ(barLowerBound(cuts, options, CuttingParams{}), 1);
    EXPECT_EQ(barLowerBound(cuts, {StockOption("P", 2000)}, CuttingParams{}), 2);
}

// --- Aggregation and recommendations ---

class AnalyticsAggregateTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_catalog.add(StockOption("P", 6000));
        m_result.algorithm = Algorithm::FirstFitDecreasing;
    }

    void setCuts(std::vector<Cut> cuts) {
        m_result.cuts = std::move(cuts);
        m_result.profiles = {summarizeProfile("P", m_result.cuts)};
    }

    bool hasRecommendation(RecommendationType type) const {
        for (const auto& r : m_result.recommendations) {
            if (r.type == type) {
                return true;
            }
        }
        return false;
    }

    StockCatalog m_catalog;
    AlgorithmConfig m_config;
    OptimizationResult m_result;
};

TEST_F(AnalyticsAggregateTest, TotalsAndPercentages) {
    setCuts({makeCut("P", 6000, {3000, 2990}), makeCut("P", 6000, {2000})});

    aggregate(m_result, m_config, m_catalog);

    EXPECT_DOUBLE_EQ(m_result.totalStockLength, 12000.0);
    EXPECT_DOUBLE_EQ(m_result.totalUsedLength, 7990.0);
    EXPECT_DOUBLE_EQ(m_result.totalWaste, 4010.0);
    EXPECT_DOUBLE_EQ(m_result.reclaimableLength, 4000.0);
    EXPECT_NEAR(m_result.wastePercentage, 4010.0 / 12000.0 * 100.0, 1e-9);
    EXPECT_NEAR(m_result.efficiency, 7990.0 / 12000.0, 1e-12);
    EXPECT_EQ(m_result.histogram.count(WasteCategory::Excessive), 1);
    EXPECT_DOUBLE_EQ(m_result.cost.totalCost, 12.0);
}

TEST_F(AnalyticsAggregateTest, ExcessiveBarsSuggestShorterStock) {
    setCuts({makeCut("P", 6000, {2000}), makeCut("P", 6000, {5990})});

    aggregate(m_result, m_config, m_catalog);

    ASSERT_TRUE(hasRecommendation(RecommendationType::StockLength));
    for (const auto& r : m_result.recommendations) {
        if (r.type == RecommendationType::StockLength) {
            // Half of the bars are excessive, more than twice the 20 % trigger
            EXPECT_EQ(r.severity, Severity::Critical);
            EXPECT_EQ(r.profileType, "P");
            EXPECT_DOUBLE_EQ(r.potentialSavings, 3.5);
        }
    }
    EXPECT_TRUE(hasRecommendation(RecommendationType::ReclaimOffcuts));
}

TEST_F(AnalyticsAggregateTest, HeuristicAboveLowerBoundSuggestsSearch) {
    setCuts({makeCut("P", 6000, {2000}), makeCut("P", 6000, {2000}),
             makeCut("P", 6000, {1900})});

    aggregate(m_result, m_config, m_catalog);
    EXPECT_TRUE(hasRecommendation(RecommendationType::AlgorithmChange));

    m_result.algorithm = Algorithm::Genetic;
    aggregate(m_result, m_config, m_catalog);
    EXPECT_FALSE(hasRecommendation(RecommendationType::AlgorithmChange));
}

TEST_F(AnalyticsAggregateTest, TimeBudgetSuggestsLongerSearch) {
    setCuts({makeCut("P", 6000, {3000, 3000})});
    GeneticTelemetry telemetry;
    telemetry.convergenceReason = ConvergenceReason::TimeBudget;
    m_result.profiles[0].telemetry = telemetry;
    m_result.algorithm = Algorithm::Genetic;

    aggregate(m_result, m_config, m_catalog);

    EXPECT_TRUE(hasRecommendation(RecommendationType::ParameterAdjustment));
}

TEST_F(AnalyticsAggregateTest, ToleranceAdjustedPiecesNeedReview) {
    Cut cut = makeCut("P", 6000, {3000, 2990});
    cut.segments[1].toleranceAdjusted = true;
    setCuts({cut});

    aggregate(m_result, m_config, m_catalog);

    EXPECT_TRUE(hasRecommendation(RecommendationType::ToleranceReview));
    EXPECT_FALSE(hasRecommendation(RecommendationType::ReclaimOffcuts));
}

TEST_F(AnalyticsAggregateTest, ManyPatternsSuggestConsolidation) {
    setCuts({makeCut("P", 6000, {5990}), makeCut("P", 6000, {5980}),
             makeCut("P", 6000, {5970}), makeCut("P", 6000, {5960})});

    aggregate(m_result, m_config, m_catalog);

    EXPECT_EQ(m_result.cost.setupEvents, 4);
    EXPECT_TRUE(hasRecommendation(RecommendationType::PatternConsolidation));
}

TEST_F(AnalyticsAggregateTest, TightLayoutNeedsNoAdvice) {
    setCuts({makeCut("P", 6000, {3000, 2990})});

    aggregate(m_result, m_config, m_catalog);

    EXPECT_TRUE(m_result.recommendations.empty());
    EXPECT_EQ(m_result.quality.grade, QualityGrade::Excellent);
}
