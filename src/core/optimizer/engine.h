#pragma once

#include <functional>
#include <string>
#include <vector>

#include "algorithm_config.h"
#include "cancellation.h"
#include "result.h"
#include "stock.h"

namespace sc {
namespace optimizer {

// Everything one run consumes
struct OptimizationRequest {
    std::vector<CutItem> items;
    StockCatalog stock;
    AlgorithmConfig config;
};

enum class RunStage { Validating, Running, Aggregating, Done, Failed };

const char* runStageLabel(RunStage stage);

using StageListener = std::function<void(RunStage)>;

// Reject a request before any search starts. Checks, in order: the
// configuration, an empty item list, item and stock fields, missing stock
// options and items longer than every option. Throws the matching error.
void validateRequest(const OptimizationRequest& request);

// One optimization run: Validating -> Running -> Aggregating -> Done | Failed.
// Owns its request and every buffer it creates; runs share nothing.
class OptimizationRun {
  public:
    explicit OptimizationRun(OptimizationRequest request);

    void setStageListener(StageListener listener) { m_listener = std::move(listener); }

    // Checked at generation boundaries and before each new bar.
    // The token must outlive execute().
    void setCancellationToken(const CancellationToken* token) { m_token = token; }

    // Throws OptimizationError subclasses; never returns a partial result
    OptimizationResult execute();

    RunStage stage() const { return m_stage; }
    const std::string& failureMessage() const { return m_failure; }

  private:
    void enter(RunStage stage);
    std::vector<ProfileSummary> solveProfiles(std::vector<Cut>& cuts);

    OptimizationRequest m_request;
    StageListener m_listener;
    const CancellationToken* m_token = nullptr;
    RunStage m_stage = RunStage::Validating;
    std::string m_failure;
};

// Stateless entry point
OptimizationResult optimize(const std::vector<CutItem>& items, const StockCatalog& stock,
                            const AlgorithmConfig& config,
                            const CancellationToken* token = nullptr);

} // namespace optimizer
} // namespace sc
