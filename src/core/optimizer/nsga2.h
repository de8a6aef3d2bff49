#pragma once

#include <vector>

#include "genetic.h"

namespace sc {
namespace optimizer {

// a is no worse in every objective and strictly better in at least one
bool dominates(const Objectives& a, const Objectives& b);

// Fronts of indices into points; front 0 is non-dominated. Indices keep
// ascending order inside each front.
std::vector<std::vector<usize>> fastNonDominatedSort(const std::vector<Objectives>& points);

// Crowding distance of each member of front (aligned with front).
// Boundary members of every objective get infinity.
std::vector<f64> crowdingDistance(const std::vector<Objectives>& points,
                                  const std::vector<usize>& front);

// Objectives rescaled to [0, 1] by the front's own minimum and maximum
std::vector<Objectives> normalizeFront(const std::vector<Objectives>& front);

// Volume dominated by the normalized front up to the point (1.1, 1.1, 1.1)
f64 hypervolume(const std::vector<Objectives>& front);

// Schott spacing over normalized objectives (0 = evenly spread)
f64 spacing(const std::vector<Objectives>& front);

// Index of the recommended front member (ties: lower index)
usize selectRecommended(const std::vector<Objectives>& front, const ObjectiveWeights& weights,
                        FrontSelection selection);

// Multi-objective search over (waste, cost, bar count). Shares encoding,
// decoding and operators with the single-objective search.
class Nsga2Optimizer : public CutOptimizer {
  public:
    explicit Nsga2Optimizer(const AlgorithmConfig& config);

    Algorithm algorithm() const override { return Algorithm::Nsga2; }
    StrategyOutcome optimize(const ProfileProblem& problem, const RunControl& control) override;

  private:
    Nsga2Params m_params;
};

} // namespace optimizer
} // namespace sc
