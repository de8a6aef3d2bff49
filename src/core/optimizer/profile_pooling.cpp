#include "profile_pooling.h"

#include <algorithm>
#include <deque>
#include <map>
#include <tuple>

#include "../utils/log.h"
#include "bar_packer.h"
#include "genetic.h"
#include "rng.h"

namespace sc {
namespace optimizer {

namespace {

std::optional<GeneticTelemetry> geneticOf(const StrategyTelemetry& telemetry) {
    if (const auto* ga = std::get_if<GeneticTelemetry>(&telemetry)) {
        return *ga;
    }
    return std::nullopt;
}

Millimeters totalWaste(const std::vector<Cut>& cuts) {
    Millimeters waste = 0.0;
    for (const auto& cut : cuts) {
        waste += cut.remainingLength;
    }
    return waste;
}

f64 mixedBarRatio(const std::vector<Cut>& cuts) {
    if (cuts.empty()) {
        return 0.0;
    }
    int mixed = 0;
    for (const auto& cut : cuts) {
        if (cut.isMixed) {
            mixed++;
        }
    }
    return static_cast<f64>(mixed) / static_cast<f64>(cuts.size());
}

void rebuildBreakdown(Cut& cut) {
    cut.workOrderBreakdown.clear();
    for (const auto& segment : cut.segments) {
        if (segment.workOrderId.empty()) {
            continue;
        }
        auto it = std::find_if(
            cut.workOrderBreakdown.begin(), cut.workOrderBreakdown.end(),
            [&](const WorkOrderShare& s) { return s.workOrderId == segment.workOrderId; });
        if (it == cut.workOrderBreakdown.end()) {
            cut.workOrderBreakdown.push_back({segment.workOrderId, 0, 0.0});
            it = cut.workOrderBreakdown.end() - 1;
        }
        it->pieces++;
        it->length += segment.length;
    }
    cut.isMixed = cut.workOrderBreakdown.size() > 1;
}

} // namespace

std::vector<WorkOrderGroup> groupByWorkOrder(const std::vector<CutItem>& items,
                                             const std::vector<int>& itemIndices) {
    std::vector<WorkOrderGroup> groups;
    std::map<std::string, usize> slots;
    for (int index : itemIndices) {
        const std::string& order = items[static_cast<usize>(index)].workOrderId;
        auto it = slots.find(order);
        if (it == slots.end()) {
            it = slots.emplace(order, groups.size()).first;
            groups.push_back({order, {}});
        }
        groups[it->second].itemIndices.push_back(index);
    }
    return groups;
}

int ProfilePool::units() const {
    int total = 0;
    for (const auto& line : lines) {
        total += static_cast<int>(line.sources.size());
    }
    return total;
}

std::vector<CutItem> ProfilePool::virtualItems() const {
    std::vector<CutItem> virtuals;
    virtuals.reserve(lines.size());
    for (const auto& line : lines) {
        virtuals.push_back(line.demand);
    }
    return virtuals;
}

std::vector<ProfilePool> pool(const std::vector<CutItem>& items,
                              const std::vector<WorkOrderGroup>& groups) {
    using LineKey = std::tuple<std::string, Millimeters, Millimeters>;

    std::vector<ProfilePool> pools;
    std::map<std::string, usize> poolSlots;
    std::map<LineKey, std::pair<usize, usize>> lineSlots; // -> (pool, line)
    std::map<std::string, std::vector<std::string>> ordersPerProfile;

    for (const auto& group : groups) {
        for (int index : group.itemIndices) {
            const CutItem& item = items[static_cast<usize>(index)];

            auto poolIt = poolSlots.find(item.profileType);
            if (poolIt == poolSlots.end()) {
                poolIt = poolSlots.emplace(item.profileType, pools.size()).first;
                ProfilePool fresh;
                fresh.profileType = item.profileType;
                pools.push_back(fresh);
            }
            ProfilePool& target = pools[poolIt->second];

            auto& orders = ordersPerProfile[item.profileType];
            if (std::find(orders.begin(), orders.end(), group.workOrderId) == orders.end()) {
                orders.push_back(group.workOrderId);
            }

            LineKey key{item.profileType, item.length, item.tolerance};
            auto lineIt = lineSlots.find(key);
            if (lineIt == lineSlots.end()) {
                DemandLine line;
                line.demand.id =
                    "pool:" + item.profileType + ":" + std::to_string(target.lines.size());
                line.demand.profileType = item.profileType;
                line.demand.length = item.length;
                line.demand.tolerance = item.tolerance;
                line.demand.quantity = 0;
                target.lines.push_back(line);
                auto slot = std::make_pair(poolIt->second, target.lines.size() - 1);
                lineIt = lineSlots.emplace(key, slot).first;
            }

            DemandLine& line = target.lines[lineIt->second.second];
            line.demand.quantity += item.quantity;
            for (int unit = 0; unit < item.quantity; ++unit) {
                line.sources.push_back(index);
            }
        }
    }

    for (auto& p : pools) {
        p.workOrders = static_cast<int>(ordersPerProfile[p.profileType].size());
    }
    return pools;
}

void reattribute(std::vector<Cut>& cuts, const ProfilePool& pool,
                 const std::vector<CutItem>& items) {
    std::vector<std::deque<int>> queues;
    queues.reserve(pool.lines.size());
    for (const auto& line : pool.lines) {
        queues.emplace_back(line.sources.begin(), line.sources.end());
    }

    for (auto& cut : cuts) {
        for (auto& segment : cut.segments) {
            auto& queue = queues[static_cast<usize>(segment.itemIndex)];
            int source = queue.front();
            queue.pop_front();

            const CutItem& item = items[static_cast<usize>(source)];
            segment.itemIndex = source;
            segment.itemId = item.id;
            segment.workOrderId = item.workOrderId;
        }
        rebuildBreakdown(cut);
    }
}

PoolingOptimizer::PoolingOptimizer(const AlgorithmConfig& config) : CutOptimizer(config) {
    if (const auto* params = std::get_if<PoolingParams>(&config.strategy)) {
        m_params = *params;
    }
}

std::unique_ptr<CutOptimizer> PoolingOptimizer::createInner() const {
    switch (m_params.inner) {
    case Algorithm::BestFitDecreasing:
        return std::make_unique<BestFitPacker>(m_config);
    case Algorithm::Genetic:
        return std::make_unique<GeneticOptimizer>(m_config, m_params.genetic);
    default:
        return std::make_unique<FirstFitPacker>(m_config);
    }
}

StrategyOutcome PoolingOptimizer::optimize(const ProfileProblem& problem,
                                           const RunControl& control) {
    const std::vector<CutItem>& items = *problem.items;
    std::vector<WorkOrderGroup> groups = groupByWorkOrder(items, problem.itemIndices);
    std::vector<ProfilePool> pools = pool(items, groups);
    const ProfilePool& pooled = pools.front();

    std::unique_ptr<CutOptimizer> inner = createInner();

    std::vector<CutItem> virtuals = pooled.virtualItems();
    ProfileProblem virtualProblem;
    virtualProblem.profileType = problem.profileType;
    virtualProblem.items = &virtuals;
    virtualProblem.stock = problem.stock;
    virtualProblem.seed = problem.seed;
    for (usize i = 0; i < virtuals.size(); ++i) {
        virtualProblem.itemIndices.push_back(static_cast<int>(i));
    }

    StrategyOutcome pooledOutcome = inner->optimize(virtualProblem, control);
    std::vector<Cut> pooledCuts = std::move(pooledOutcome.cuts);
    reattribute(pooledCuts, pooled, items);
    std::optional<GeneticTelemetry> pooledSearch = geneticOf(pooledOutcome.telemetry);

    PoolingTelemetry telemetry;
    telemetry.inner = m_params.inner;
    telemetry.workOrders = static_cast<int>(groups.size());
    telemetry.demandLines = static_cast<int>(pooled.lines.size());
    telemetry.units = pooled.units();
    telemetry.pooledWaste = totalWaste(pooledCuts);
    telemetry.mixedBarRatio = mixedBarRatio(pooledCuts);

    StrategyOutcome outcome;
    if (groups.size() <= 1) {
        telemetry.pooled = true;
        telemetry.baselineWaste = telemetry.pooledWaste;
        telemetry.decision = "single work order";
        telemetry.search = std::move(pooledSearch);
        outcome.cuts = std::move(pooledCuts);
        outcome.telemetry = telemetry;
        return outcome;
    }

    // Baseline: every work order packed on its own bars
    std::vector<Cut> baselineCuts;
    std::optional<GeneticTelemetry> baselineSearch;
    for (const auto& group : groups) {
        ProfileProblem orderProblem;
        orderProblem.profileType = problem.profileType;
        orderProblem.items = &items;
        orderProblem.itemIndices = group.itemIndices;
        orderProblem.stock = problem.stock;
        orderProblem.seed = deriveSeed(problem.seed, group.workOrderId);
        StrategyOutcome orderOutcome = inner->optimize(orderProblem, control);
        baselineCuts.insert(baselineCuts.end(), orderOutcome.cuts.begin(),
                            orderOutcome.cuts.end());
        auto orderSearch = geneticOf(orderOutcome.telemetry);
        if (orderSearch &&
            (!baselineSearch || dominantReason(baselineSearch->convergenceReason,
                                               orderSearch->convergenceReason) !=
                                    baselineSearch->convergenceReason)) {
            baselineSearch = std::move(orderSearch);
        }
    }

    telemetry.baselineWaste = totalWaste(baselineCuts);
    telemetry.wasteReduction =
        telemetry.baselineWaste > 0.0
            ? (telemetry.baselineWaste - telemetry.pooledWaste) / telemetry.baselineWaste
            : 0.0;

    if (telemetry.wasteReduction + 1e-12 < m_params.minWasteReduction) {
        telemetry.decision = "waste reduction below threshold";
    } else if (telemetry.mixedBarRatio > m_params.maxMixedBarRatio + 1e-12) {
        telemetry.decision = "too many mixed bars";
    } else {
        telemetry.pooled = true;
        telemetry.decision = "pooled";
    }

    log::infof("Pooling", "%s: %d orders, waste %.1f pooled vs %.1f separate, mixed %.0f%% -> %s",
               problem.profileType.c_str(), telemetry.workOrders, telemetry.pooledWaste,
               telemetry.baselineWaste, telemetry.mixedBarRatio * 100.0,
               telemetry.decision.c_str());

    outcome.cuts = telemetry.pooled ? std::move(pooledCuts) : std::move(baselineCuts);
    telemetry.search = telemetry.pooled ? std::move(pooledSearch) : std::move(baselineSearch);
    outcome.telemetry = telemetry;
    return outcome;
}

} // namespace optimizer
} // namespace sc
