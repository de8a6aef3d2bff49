#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cut_optimizer.h"

namespace sc {
namespace optimizer {

// Items of one work order (empty id: items without an order)
struct WorkOrderGroup {
    std::string workOrderId;
    std::vector<int> itemIndices;
};

// Work orders in first-seen order
std::vector<WorkOrderGroup> groupByWorkOrder(const std::vector<CutItem>& items,
                                             const std::vector<int>& itemIndices);

// Identical demands of several orders merged into one virtual item.
// sources holds the originating item index of every unit, in order.
struct DemandLine {
    CutItem demand;
    std::vector<int> sources;
};

struct ProfilePool {
    std::string profileType;
    std::vector<DemandLine> lines;
    int workOrders = 0;

    int units() const;

    // One virtual CutItem per line, index-aligned with lines
    std::vector<CutItem> virtualItems() const;
};

// Merge demands with the same (profile, length, tolerance) across work
// orders. Returns one pool per profile type, in first-seen order.
std::vector<ProfilePool> pool(const std::vector<CutItem>& items,
                              const std::vector<WorkOrderGroup>& groups);

// Hand each segment of a pooled layout back to its originating item: units
// of a line are consumed first-in first-out across bars, left to right.
void reattribute(std::vector<Cut>& cuts, const ProfilePool& pool,
                 const std::vector<CutItem>& items);

// Pools a profile's orders, solves the pool with the inner strategy and
// keeps the pooled plan only when it beats packing each order on its own
class PoolingOptimizer : public CutOptimizer {
  public:
    explicit PoolingOptimizer(const AlgorithmConfig& config);

    Algorithm algorithm() const override { return Algorithm::Pooling; }
    StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) override;

  private:
    std::unique_ptr<CutOptimizer> createInner() const;

    PoolingParams m_params;
};

} // namespace optimizer
} // namespace sc
