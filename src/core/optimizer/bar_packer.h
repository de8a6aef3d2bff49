#pragma once

#include <string>
#include <vector>

#include "cut_optimizer.h"
#include "errors.h"

namespace sc {
namespace optimizer {

// A single unit of demand, expanded from an item's quantity
struct UnitRequest {
    int itemIndex = -1;
    Millimeters length = 0.0;
    Millimeters minLength = 0.0;
};

// Expand the given items by quantity, in item order
std::vector<UnitRequest> expandItems(const std::vector<CutItem>& items,
                                     const std::vector<int>& itemIndices);

// Longest first; ties keep input order
void sortDecreasing(std::vector<UnitRequest>& requests);

enum class FitRule {
    FirstFit, // First open bar in creation order that holds the piece
    BestFit,  // Open bar left with the smallest remainder
};

struct PlacedPiece {
    int itemIndex = -1;
    Millimeters length = 0.0;
    bool toleranceAdjusted = false;
};

// An open bar of the arena
struct Bar {
    int optionIndex = 0;
    Millimeters stockLength = 0.0;
    Millimeters remaining = 0.0; // Capacity left after pieces, kerf and trim
    Millimeters used = 0.0;
    std::vector<PlacedPiece> pieces;
};

// Aggregate figures of a packed layout
struct LayoutMetrics {
    int bars = 0;
    int pieces = 0;
    int patterns = 0; // Distinct (stock length, piece sequence) pairs
    int toleranceAdjusted = 0;
    Millimeters stockLength = 0.0;
    Millimeters usedLength = 0.0;
    Millimeters waste = 0.0; // Sum of remainders
    Millimeters reclaimable = 0.0;
};

// Open bars of one profile, addressed by index. Holds its own copy of the
// stock options and only reads the caller's item list.
class BarArena {
  public:
    BarArena(const std::vector<CutItem>& items, const std::vector<StockOption>& options,
             const CuttingParams& cutting, const RunControl* control = nullptr);

    // Place one request, opening a new bar when no open bar holds it.
    // Throws ItemTooLongError when no stock option holds it either.
    void place(const UnitRequest& request, FitRule rule);

    // Move every bar to the shortest option that still holds its content
    void rightSize();

    const std::vector<Bar>& bars() const { return m_bars; }
    usize size() const { return m_bars.size(); }

    LayoutMetrics measure(const WastePolicy& policy) const;

    // Materialize the bars as Cuts with positioned, numbered segments
    std::vector<Cut> buildCuts(const std::string& profileType, const WastePolicy& policy) const;

  private:
    Millimeters capacityOf(const StockOption& option) const;
    int findOpenBar(Millimeters length, FitRule rule) const;
    int selectOption(const UnitRequest& request) const;
    int openBar(const UnitRequest& request);

    const std::vector<CutItem>& m_items;
    std::vector<StockOption> m_options; // Preference order
    CuttingParams m_cutting;
    const RunControl* m_control;
    std::vector<Bar> m_bars;
};

// Replay the given request order through an arena
BarArena packRequests(const std::vector<CutItem>& items,
                      const std::vector<UnitRequest>& ordered,
                      const std::vector<StockOption>& options, const CuttingParams& cutting,
                      FitRule rule, const RunControl* control = nullptr);

// Every item among itemIndices that no option holds, even squeezed
std::vector<ItemTooLongError::Offender>
findTooLongItems(const std::vector<CutItem>& items, const std::vector<int>& itemIndices,
                 const std::vector<StockOption>& options, const CuttingParams& cutting);

// Greedy packing of a whole item list, grouped by profile type.
// Throws MissingStockOptionError or ItemTooLongError.
std::vector<Cut> packFirstFit(const std::vector<CutItem>& items,
                              const std::vector<StockOption>& stock,
                              const CuttingParams& cutting = {},
                              const WastePolicy& policy = {});
std::vector<Cut> packBestFit(const std::vector<CutItem>& items,
                             const std::vector<StockOption>& stock,
                             const CuttingParams& cutting = {},
                             const WastePolicy& policy = {});

// First Fit Decreasing
// Simple and fast, good for general use
class FirstFitPacker : public CutOptimizer {
  public:
    explicit FirstFitPacker(const AlgorithmConfig& config) : CutOptimizer(config) {}

    Algorithm algorithm() const override { return Algorithm::FirstFitDecreasing; }
    StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) override;
};

// Best Fit Decreasing
// Tighter bars than first fit at the same cost
class BestFitPacker : public CutOptimizer {
  public:
    explicit BestFitPacker(const AlgorithmConfig& config) : CutOptimizer(config) {}

    Algorithm algorithm() const override { return Algorithm::BestFitDecreasing; }
    StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) override;
};

// Shared by both packers and by the inner passes of pooling
std::vector<Cut> packProblem(const ProfileProblem& problem, const AlgorithmConfig& config,
                             FitRule rule, const RunControl* control);

} // namespace optimizer
} // namespace sc
