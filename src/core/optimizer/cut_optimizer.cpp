#include "cut_optimizer.h"

#include "bar_packer.h"
#include "genetic.h"
#include "nsga2.h"
#include "profile_pooling.h"

namespace sc {
namespace optimizer {

std::unique_ptr<CutOptimizer> CutOptimizer::create(const AlgorithmConfig& config) {
    switch (config.mode()) {
    case Algorithm::FirstFitDecreasing:
        return std::make_unique<FirstFitPacker>(config);
    case Algorithm::BestFitDecreasing:
        return std::make_unique<BestFitPacker>(config);
    case Algorithm::Genetic:
        return std::make_unique<GeneticOptimizer>(config);
    case Algorithm::Nsga2:
        return std::make_unique<Nsga2Optimizer>(config);
    case Algorithm::Pooling:
        return std::make_unique<PoolingOptimizer>(config);
    }
    return std::make_unique<FirstFitPacker>(config); // Default
}

} // namespace optimizer
} // namespace sc
