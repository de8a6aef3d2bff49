#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../types.h"
#include "algorithm_config.h"
#include "result.h"
#include "stock.h"

namespace sc {
namespace optimizer {

// Per-job overrides carried in a job file's "settings" object
struct JobSettings {
    std::optional<Algorithm> algorithm;
    std::optional<Millimeters> kerf;
    std::optional<Millimeters> startSafety;
    std::optional<Millimeters> endSafety;
    std::optional<f64> timeBudgetMs;
    std::optional<u64> seed;
};

// A cutting job: demand plus the stock it may be cut from
struct JobFile {
    std::string name;
    std::vector<CutItem> items;
    StockCatalog stock;
    JobSettings settings;
};

// Job and result files. Load failures are logged and reported as nullopt,
// write failures as false.
class PlanFile {
  public:
    static constexpr int FORMAT_VERSION = 1;

    static Result<JobFile> loadJob(const Path& filePath);
    static Result<JobFile> parseJob(std::string_view text, const std::string& source = "job");

    static nlohmann::json jobToJson(const JobFile& job);
    static nlohmann::json resultToJson(const OptimizationResult& result, const std::string& name);

    [[nodiscard]] static bool saveJob(const Path& filePath, const JobFile& job);
    [[nodiscard]] static bool saveResult(const Path& filePath, const OptimizationResult& result,
                                         const std::string& name);
};

} // namespace optimizer
} // namespace sc
