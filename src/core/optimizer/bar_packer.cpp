#include "bar_packer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

#include "errors.h"

namespace sc {
namespace optimizer {

namespace {
constexpr Millimeters FIT_EPSILON = 1e-6;

std::vector<StockOption> optionsByLength(const std::vector<StockOption>& options) {
    std::vector<StockOption> sorted = options;
    std::stable_sort(sorted.begin(), sorted.end(), [](const StockOption& a, const StockOption& b) {
        if (a.stockLength != b.stockLength) {
            return a.stockLength < b.stockLength;
        }
        return a.priority < b.priority;
    });
    return sorted;
}

std::vector<StockOption> optionsFor(const std::vector<StockOption>& stock,
                                    const std::string& profileType) {
    std::vector<StockOption> options;
    for (const auto& option : stock) {
        if (option.profileType == profileType) {
            options.push_back(option);
        }
    }
    return options;
}

std::vector<Cut> packAll(const std::vector<CutItem>& items, const std::vector<StockOption>& stock,
                         const CuttingParams& cutting, const WastePolicy& policy, FitRule rule) {
    auto groups = groupByProfile(items);

    std::vector<std::string> missing;
    for (const auto& group : groups) {
        if (optionsFor(stock, group.first).empty()) {
            missing.push_back(group.first);
        }
    }
    if (!missing.empty()) {
        throw MissingStockOptionError(missing);
    }

    std::vector<ItemTooLongError::Offender> tooLong;
    for (const auto& group : groups) {
        auto offenders =
            findTooLongItems(items, group.second, optionsFor(stock, group.first), cutting);
        tooLong.insert(tooLong.end(), offenders.begin(), offenders.end());
    }
    if (!tooLong.empty()) {
        throw ItemTooLongError(tooLong);
    }

    std::vector<Cut> cuts;
    for (const auto& group : groups) {
        auto requests = expandItems(items, group.second);
        sortDecreasing(requests);
        BarArena arena =
            packRequests(items, requests, optionsFor(stock, group.first), cutting, rule);
        auto profileCuts = arena.buildCuts(group.first, policy);
        cuts.insert(cuts.end(), profileCuts.begin(), profileCuts.end());
    }
    return cuts;
}

} // namespace

std::vector<UnitRequest> expandItems(const std::vector<CutItem>& items,
                                     const std::vector<int>& itemIndices) {
    std::vector<UnitRequest> requests;
    for (int index : itemIndices) {
        const CutItem& item = items[static_cast<usize>(index)];
        for (int unit = 0; unit < item.quantity; ++unit) {
            requests.push_back({index, item.length, std::max(0.0, item.minLength())});
        }
    }
    return requests;
}

void sortDecreasing(std::vector<UnitRequest>& requests) {
    auto longerFirst = [](const UnitRequest& a, const UnitRequest& b) {
        return a.length > b.length;
    };
    std::stable_sort(requests.begin(), requests.end(), longerFirst);
}

BarArena::BarArena(const std::vector<CutItem>& items, const std::vector<StockOption>& options,
                   const CuttingParams& cutting, const RunControl* control)
    : m_items(items), m_options(sortByPreference(options)), m_cutting(cutting),
      m_control(control) {}

Millimeters BarArena::capacityOf(const StockOption& option) const {
    return option.stockLength - m_cutting.trimLoss();
}

int BarArena::findOpenBar(Millimeters length, FitRule rule) const {
    const Millimeters need = length + m_cutting.kerf;
    int best = -1;
    Millimeters bestSlack = std::numeric_limits<Millimeters>::max();

    for (usize i = 0; i < m_bars.size(); ++i) {
        Millimeters slack = m_bars[i].remaining - need;
        if (slack < -FIT_EPSILON) {
            continue;
        }
        if (rule == FitRule::FirstFit) {
            return static_cast<int>(i);
        }
        if (slack < bestSlack - FIT_EPSILON) {
            bestSlack = slack;
            best = static_cast<int>(i);
        }
    }
    return best;
}

int BarArena::selectOption(const UnitRequest& request) const {
    const Millimeters kerf = m_cutting.kerf;

    auto pick = [&](Millimeters length) -> int {
        const Millimeters need = length + kerf;
        if (m_cutting.stockSelection == StockSelection::Priority) {
            for (usize i = 0; i < m_options.size(); ++i) {
                if (capacityOf(m_options[i]) + FIT_EPSILON >= need) {
                    return static_cast<int>(i);
                }
            }
            return -1;
        }

        // Waste per piece if the whole bar were cut to this length
        int best = -1;
        f64 bestWaste = std::numeric_limits<f64>::max();
        for (usize i = 0; i < m_options.size(); ++i) {
            Millimeters capacity = capacityOf(m_options[i]);
            if (capacity + FIT_EPSILON < need || need <= 0.0) {
                continue;
            }
            f64 pieces = std::floor((capacity + FIT_EPSILON) / need);
            f64 wastePerPiece = (capacity - pieces * need) / pieces;
            if (wastePerPiece < bestWaste - FIT_EPSILON) {
                bestWaste = wastePerPiece;
                best = static_cast<int>(i);
            }
        }
        return best;
    };

    int option = pick(request.length);
    if (option < 0 && m_cutting.allowToleranceSqueeze && request.minLength < request.length) {
        option = pick(request.minLength);
    }
    return option;
}

int BarArena::openBar(const UnitRequest& request) {
    if (m_control != nullptr) {
        m_control->throwIfCancelled("bar packing");
    }

    int option = selectOption(request);
    if (option < 0) {
        const CutItem& item = m_items[static_cast<usize>(request.itemIndex)];
        Millimeters longest = 0.0;
        for (const auto& o : m_options) {
            longest = std::max(longest, capacityOf(o) - m_cutting.kerf);
        }
        throw ItemTooLongError({{item.id, item.profileType, item.length, longest}});
    }

    Bar bar;
    bar.optionIndex = option;
    bar.stockLength = m_options[static_cast<usize>(option)].stockLength;
    bar.remaining = capacityOf(m_options[static_cast<usize>(option)]);
    m_bars.push_back(bar);
    return static_cast<int>(m_bars.size()) - 1;
}

void BarArena::place(const UnitRequest& request, FitRule rule) {
    const Millimeters kerf = m_cutting.kerf;
    const bool canSqueeze = m_cutting.allowToleranceSqueeze && request.minLength < request.length;

    int target = findOpenBar(request.length, rule);
    if (target < 0 && canSqueeze) {
        target = findOpenBar(request.minLength, rule);
    }
    if (target < 0) {
        target = openBar(request);
    }

    Bar& bar = m_bars[static_cast<usize>(target)];
    Millimeters placed = request.length;
    if (bar.remaining + FIT_EPSILON < request.length + kerf) {
        // Only reachable with squeezing enabled
        placed = std::max(request.minLength, bar.remaining - kerf);
    }
    const bool adjusted = placed < request.length - FIT_EPSILON;

    bar.pieces.push_back({request.itemIndex, placed, adjusted});
    bar.used += placed;
    bar.remaining = std::max(0.0, bar.remaining - placed - kerf);
}

void BarArena::rightSize() {
    const std::vector<StockOption> byLength = optionsByLength(m_options);

    for (auto& bar : m_bars) {
        Millimeters content = bar.used + m_cutting.kerf * static_cast<f64>(bar.pieces.size());
        for (const auto& option : byLength) {
            if (capacityOf(option) + FIT_EPSILON < content) {
                continue;
            }
            if (option.stockLength < bar.stockLength) {
                bar.stockLength = option.stockLength;
                bar.remaining = std::max(0.0, capacityOf(option) - content);
                for (usize i = 0; i < m_options.size(); ++i) {
                    if (m_options[i].stockLength == option.stockLength &&
                        m_options[i].priority == option.priority) {
                        bar.optionIndex = static_cast<int>(i);
                        break;
                    }
                }
            }
            break;
        }
    }
}

LayoutMetrics BarArena::measure(const WastePolicy& policy) const {
    LayoutMetrics metrics;
    std::set<std::vector<Millimeters>> patterns;

    for (const auto& bar : m_bars) {
        metrics.bars++;
        metrics.stockLength += bar.stockLength;
        metrics.usedLength += bar.used;
        metrics.waste += bar.remaining;
        if (isReclaimableWaste(bar.remaining, policy)) {
            metrics.reclaimable += bar.remaining;
        }

        std::vector<Millimeters> pattern;
        pattern.reserve(bar.pieces.size() + 1);
        pattern.push_back(bar.stockLength);
        for (const auto& piece : bar.pieces) {
            metrics.pieces++;
            if (piece.toleranceAdjusted) {
                metrics.toleranceAdjusted++;
            }
            pattern.push_back(piece.length);
        }
        patterns.insert(std::move(pattern));
    }

    metrics.patterns = static_cast<int>(patterns.size());
    return metrics;
}

std::vector<Cut> BarArena::buildCuts(const std::string& profileType,
                                     const WastePolicy& policy) const {
    const Millimeters kerf = m_cutting.kerf;
    const Millimeters trim = m_cutting.trimLoss();

    std::vector<Cut> cuts;
    cuts.reserve(m_bars.size());

    for (const auto& bar : m_bars) {
        Cut cut;
        cut.profileType = profileType;
        cut.stockLength = bar.stockLength;
        cut.trimLoss = trim;

        Millimeters position = m_cutting.startSafety;
        int sequence = 1;
        for (const auto& piece : bar.pieces) {
            const CutItem& item = m_items[static_cast<usize>(piece.itemIndex)];

            Segment segment;
            segment.itemIndex = piece.itemIndex;
            segment.itemId = item.id;
            segment.workOrderId = item.workOrderId;
            segment.length = piece.length;
            segment.position = position;
            segment.endPosition = position + piece.length;
            segment.sequenceNumber = sequence++;
            segment.toleranceAdjusted = piece.toleranceAdjusted;
            position = segment.endPosition + kerf;

            cut.usedLength += piece.length;

            if (!item.workOrderId.empty()) {
                auto it = std::find_if(
                    cut.workOrderBreakdown.begin(), cut.workOrderBreakdown.end(),
                    [&](const WorkOrderShare& s) { return s.workOrderId == item.workOrderId; });
                if (it == cut.workOrderBreakdown.end()) {
                    cut.workOrderBreakdown.push_back({item.workOrderId, 0, 0.0});
                    it = cut.workOrderBreakdown.end() - 1;
                }
                it->pieces++;
                it->length += piece.length;
            }

            cut.segments.push_back(std::move(segment));
        }

        cut.kerfLoss = kerf * static_cast<f64>(cut.segments.size());
        cut.remainingLength =
            std::max(0.0, cut.stockLength - cut.usedLength - cut.kerfLoss - cut.trimLoss);
        cut.wasteCategory = categorizeWaste(cut.remainingLength, policy);
        cut.isReclaimable = isReclaimableWaste(cut.remainingLength, policy);
        cut.isMixed = cut.workOrderBreakdown.size() > 1;

        cuts.push_back(std::move(cut));
    }
    return cuts;
}

BarArena packRequests(const std::vector<CutItem>& items,
                      const std::vector<UnitRequest>& ordered,
                      const std::vector<StockOption>& options, const CuttingParams& cutting,
                      FitRule rule, const RunControl* control) {
    BarArena arena(items, options, cutting, control);
    for (const auto& request : ordered) {
        arena.place(request, rule);
    }
    if (cutting.rightSizeStock) {
        arena.rightSize();
    }
    return arena;
}

std::vector<ItemTooLongError::Offender>
findTooLongItems(const std::vector<CutItem>& items, const std::vector<int>& itemIndices,
                 const std::vector<StockOption>& options, const CuttingParams& cutting) {
    Millimeters longest = -std::numeric_limits<Millimeters>::max();
    for (const auto& option : options) {
        longest = std::max(longest, option.stockLength - cutting.trimLoss() - cutting.kerf);
    }

    std::vector<ItemTooLongError::Offender> offenders;
    for (int index : itemIndices) {
        const CutItem& item = items[static_cast<usize>(index)];
        Millimeters shortest = cutting.allowToleranceSqueeze ? item.minLength() : item.length;
        if (shortest > longest + FIT_EPSILON) {
            offenders.push_back({item.id, item.profileType, item.length, std::max(0.0, longest)});
        }
    }
    return offenders;
}

std::vector<Cut> packFirstFit(const std::vector<CutItem>& items,
                              const std::vector<StockOption>& stock,
                              const CuttingParams& cutting, const WastePolicy& policy) {
    return packAll(items, stock, cutting, policy, FitRule::FirstFit);
}

std::vector<Cut> packBestFit(const std::vector<CutItem>& items,
                             const std::vector<StockOption>& stock,
                             const CuttingParams& cutting, const WastePolicy& policy) {
    return packAll(items, stock, cutting, policy, FitRule::BestFit);
}

std::vector<Cut> packProblem(const ProfileProblem& problem, const AlgorithmConfig& config,
                             FitRule rule, const RunControl* control) {
    auto requests = expandItems(*problem.items, problem.itemIndices);
    sortDecreasing(requests);
    BarArena arena =
        packRequests(*problem.items, requests, problem.stock, config.cutting, rule, control);
    return arena.buildCuts(problem.profileType, config.waste);
}

StrategyOutcome FirstFitPacker::optimize(const ProfileProblem& problem,
                                         const RunControl& control) {
    StrategyOutcome outcome;
    outcome.cuts = packProblem(problem, m_config, FitRule::FirstFit, &control);
    return outcome;
}

StrategyOutcome BestFitPacker::optimize(const ProfileProblem& problem,
                                        const RunControl& control) {
    StrategyOutcome outcome;
    outcome.cuts = packProblem(problem, m_config, FitRule::BestFit, &control);
    return outcome;
}

} // namespace optimizer
} // namespace sc
