#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../optimizer/algorithm_config.h"
#include "../types.h"
#include "../utils/log.h"

namespace sc {

// Engine settings persisted as an INI file:
//
//   [algorithm]  mode, time_budget_ms, seed, profile_threads
//   [cutting]    kerf, start_safety, end_safety, tolerance_squeeze,
//                right_size_stock, stock_selection
//   [genetic]    population, generations, plateau, tournament, elites,
//                crossover_rate, mutation_rate, threads,
//                weight_waste, weight_bars, weight_cost, weight_reclaim
//   [nsga2]      population, generations, plateau, tournament, crossover_rate,
//                mutation_rate, threads, weight_waste, weight_cost,
//                weight_bars, selection
//   [pooling]    inner, min_waste_reduction, max_mixed_bar_ratio
//   [waste]      minimal_below, small_below, medium_below, large_up_to,
//                reclaim_floor, excessive_bar_ratio
//   [cost]       material_per_meter, labor_per_hour, waste_per_meter,
//                setup_per_event, cutting_per_cut, machine_per_hour
//   [time]       load_minutes_per_bar, minutes_per_cut
//   [logging]    level, file
//
// Unknown keys are ignored; malformed values are logged and keep defaults.
class EngineConfig {
  public:
    // Missing file: defaults, returns true. Unreadable file: false.
    bool load(const Path& path);
    void loadFromString(std::string_view text);

    [[nodiscard]] bool save(const Path& path) const;
    std::string serialize() const;

    // Assemble the run configuration for the selected mode
    optimizer::AlgorithmConfig algorithmConfig() const;

    // Apply level and log file to the logger
    void applyLogging() const;

    optimizer::Algorithm mode = optimizer::Algorithm::FirstFitDecreasing;
    f64 timeBudgetMs = 0.0;
    std::optional<u64> seed;
    int profileThreads = 1;

    optimizer::CuttingParams cutting;
    optimizer::GeneticParams genetic;
    optimizer::Nsga2Params nsga2;
    optimizer::PoolingParams pooling;
    optimizer::WastePolicy waste;
    optimizer::CostRates cost;
    optimizer::TimeModel time;

    log::Level logLevel = log::Level::Info;
    std::string logFile;

  private:
    void apply(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace sc
