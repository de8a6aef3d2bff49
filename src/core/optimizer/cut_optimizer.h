#pragma once

#include <memory>
#include <string>
#include <vector>

#include "algorithm_config.h"
#include "cancellation.h"
#include "cut.h"
#include "stock.h"
#include "telemetry.h"

namespace sc {
namespace optimizer {

// One profile type's share of a run. Profiles never share bars, so each
// problem is solved independently and may run on its own worker.
struct ProfileProblem {
    std::string profileType;
    const std::vector<CutItem>* items = nullptr; // The run's full input list
    std::vector<int> itemIndices;                // Items of this profile
    std::vector<StockOption> stock;              // Options of this profile
    u64 seed = kDefaultSeed;                     // Derived per profile
};

struct StrategyOutcome {
    std::vector<Cut> cuts;
    StrategyTelemetry telemetry;
};

// Abstract optimizer interface
class CutOptimizer {
  public:
    explicit CutOptimizer(const AlgorithmConfig& config) : m_config(config) {}
    virtual ~CutOptimizer() = default;

    virtual Algorithm algorithm() const = 0;

    // Solve one profile. Throws ItemTooLongError or OptimizationCancelledError.
    virtual StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) = 0;

    const AlgorithmConfig& config() const { return m_config; }

    // Factory: strategy for config.mode()
    static std::unique_ptr<CutOptimizer> create(const AlgorithmConfig& config);

  protected:
    AlgorithmConfig m_config;
};

} // namespace optimizer
} // namespace sc
