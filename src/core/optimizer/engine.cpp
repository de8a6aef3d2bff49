#include "engine.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

#include "../threading/thread_pool.h"
#include "../utils/log.h"
#include "analytics.h"
#include "bar_packer.h"
#include "cut_optimizer.h"
#include "errors.h"
#include "rng.h"

namespace sc {
namespace optimizer {

namespace {

using Clock = std::chrono::steady_clock;

f64 elapsedMs(Clock::time_point start) {
    return std::chrono::duration<f64, std::milli>(Clock::now() - start).count();
}

std::vector<InfeasibleConstraintError::Violation> checkFields(const OptimizationRequest& request) {
    std::vector<InfeasibleConstraintError::Violation> violations;

    for (const auto& item : request.items) {
        if (item.profileType.empty()) {
            violations.push_back({item.id, "profile type is empty"});
        }
        if (!(item.length > 0.0) || !std::isfinite(item.length)) {
            violations.push_back({item.id, "length must be positive"});
        }
        if (item.quantity <= 0) {
            violations.push_back({item.id, "quantity must be positive"});
        }
        if (!(item.tolerance >= 0.0) || !std::isfinite(item.tolerance)) {
            violations.push_back({item.id, "tolerance must not be negative"});
        } else if (item.length > 0.0 && item.tolerance >= item.length) {
            violations.push_back({item.id, "tolerance must be smaller than the length"});
        }
    }

    for (const auto& profile : request.stock.profiles()) {
        for (const auto& option : request.stock.optionsFor(profile)) {
            if (!(option.stockLength > 0.0) || !std::isfinite(option.stockLength)) {
                violations.push_back({"stock:" + profile, "stock length must be positive"});
            }
        }
    }
    return violations;
}

} // namespace

const char* runStageLabel(RunStage stage) {
    switch (stage) {
    case RunStage::Validating:
        return "validating";
    case RunStage::Running:
        return "running";
    case RunStage::Aggregating:
        return "aggregating";
    case RunStage::Done:
        return "done";
    case RunStage::Failed:
        return "failed";
    }
    return "failed";
}

void validateRequest(const OptimizationRequest& request) {
    validateConfig(request.config);

    if (request.items.empty()) {
        throw EmptyInputError();
    }

    auto violations = checkFields(request);
    if (!violations.empty()) {
        throw InfeasibleConstraintError(violations);
    }

    auto groups = groupByProfile(request.items);

    std::vector<std::string> missing;
    for (const auto& group : groups) {
        if (!request.stock.hasProfile(group.first)) {
            missing.push_back(group.first);
        }
    }
    if (!missing.empty()) {
        throw MissingStockOptionError(missing);
    }

    std::vector<ItemTooLongError::Offender> tooLong;
    for (const auto& group : groups) {
        auto offenders = findTooLongItems(request.items, group.second,
                                          request.stock.optionsFor(group.first),
                                          request.config.cutting);
        tooLong.insert(tooLong.end(), offenders.begin(), offenders.end());
    }
    if (!tooLong.empty()) {
        throw ItemTooLongError(tooLong);
    }
}

OptimizationRun::OptimizationRun(OptimizationRequest request) : m_request(std::move(request)) {}

void OptimizationRun::enter(RunStage stage) {
    m_stage = stage;
    log::debugf("Engine", "Stage: %s", runStageLabel(stage));
    if (m_listener) {
        m_listener(stage);
    }
}

std::vector<ProfileSummary> OptimizationRun::solveProfiles(std::vector<Cut>& cuts) {
    const AlgorithmConfig& config = m_request.config;
    const u64 seed = config.effectiveSeed();

    std::vector<ProfileProblem> problems;
    for (auto& group : groupByProfile(m_request.items)) {
        ProfileProblem problem;
        problem.profileType = group.first;
        problem.items = &m_request.items;
        problem.itemIndices = std::move(group.second);
        problem.stock = m_request.stock.optionsFor(group.first);
        problem.seed = deriveSeed(seed, group.first);
        problems.push_back(std::move(problem));
    }

    RunControl control;
    control.token = m_token;
    control.deadline = Deadline::after(config.timeBudgetMs);

    std::vector<StrategyOutcome> outcomes(problems.size());
    std::vector<f64> timings(problems.size(), 0.0);

    auto solve = [&](usize index) {
        Clock::time_point start = Clock::now();
        auto optimizer = CutOptimizer::create(config);
        outcomes[index] = optimizer->optimize(problems[index], control);
        timings[index] = elapsedMs(start);
    };

    usize threads = std::min(resolveThreadCount(config.profileThreads), problems.size());
    if (threads <= 1) {
        for (usize i = 0; i < problems.size(); ++i) {
            solve(i);
        }
    } else {
        // Every profile finishes before the first failure is rethrown
        ThreadPool pool(threads);
        pool.runAll(problems.size(), solve);
    }

    std::vector<ProfileSummary> summaries;
    summaries.reserve(problems.size());
    for (usize i = 0; i < problems.size(); ++i) {
        ProfileSummary summary = summarizeProfile(problems[i].profileType, outcomes[i].cuts);
        summary.seed = problems[i].seed;
        summary.executionTimeMs = timings[i];
        summary.telemetry = std::move(outcomes[i].telemetry);
        summaries.push_back(std::move(summary));

        for (auto& cut : outcomes[i].cuts) {
            cuts.push_back(std::move(cut));
        }
    }
    return summaries;
}

OptimizationResult OptimizationRun::execute() {
    Clock::time_point start = Clock::now();
    const AlgorithmConfig& config = m_request.config;

    try {
        enter(RunStage::Validating);
        validateRequest(m_request);

        enter(RunStage::Running);
        log::infof("Engine", "Optimizing %zu items over %zu profiles with %s",
                   m_request.items.size(), groupByProfile(m_request.items).size(),
                   algorithmLabel(config.mode()));

        OptimizationResult result;
        result.algorithm = config.mode();
        result.seed = config.effectiveSeed();
        result.profiles = solveProfiles(result.cuts);

        enter(RunStage::Aggregating);
        aggregate(result, config, m_request.stock);
        result.executionTimeMs = elapsedMs(start);

        enter(RunStage::Done);
        log::infof("Engine", "%d bars, efficiency %.1f%%, waste %.1f mm, quality %s in %.1f ms",
                   result.barCount(), result.efficiency * 100.0, result.totalWaste,
                   qualityGradeLabel(result.quality.grade), result.executionTimeMs);
        return result;
    } catch (const std::exception& e) {
        m_failure = e.what();
        enter(RunStage::Failed);
        log::warningf("Engine", "Run failed: %s", e.what());
        throw;
    }
}

OptimizationResult optimize(const std::vector<CutItem>& items, const StockCatalog& stock,
                            const AlgorithmConfig& config, const CancellationToken* token) {
    OptimizationRun run({items, stock, config});
    run.setCancellationToken(token);
    return run.execute();
}

} // namespace optimizer
} // namespace sc
