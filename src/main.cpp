// StockCut - Command Line Entry Point
//
// Usage: stockcut JOB.json [-c CONFIG.ini] [-o RESULT.json] [-m MODE] [-s SEED]
//                          [-t BUDGET_MS] [-k KERF] [-v] [--write-config FILE]

#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "core/config/engine_config.h"
#include "core/optimizer/engine.h"
#include "core/optimizer/errors.h"
#include "core/optimizer/plan_file.h"
#include "core/utils/log.h"
#include "core/utils/string_utils.h"

namespace {

sc::optimizer::CancellationToken g_cancel;

void signalHandler(int /*sig*/) {
    g_cancel.requestStop();
}

struct Options {
    std::string jobPath;
    std::string configPath;
    std::string outputPath;
    std::string writeConfigPath;
    std::string mode;
    std::string seed;
    std::string budget;
    std::string kerf;
    bool verbose = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " JOB.json [options]\n"
              << "  -c, --config FILE        engine settings (INI)\n"
              << "  -o, --output FILE        write the cut plan as JSON\n"
              << "  -m, --mode MODE          ffd | bfd | genetic | nsga-ii | pooling\n"
              << "  -s, --seed N             random seed\n"
              << "  -t, --time-budget MS     wall-clock budget of the search\n"
              << "  -k, --kerf MM            blade kerf\n"
              << "  -v, --verbose            debug logging\n"
              << "      --write-config FILE  write the effective settings and exit\n";
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!next(opts.configPath)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!next(opts.outputPath)) return false;
        } else if (arg == "-m" || arg == "--mode") {
            if (!next(opts.mode)) return false;
        } else if (arg == "-s" || arg == "--seed") {
            if (!next(opts.seed)) return false;
        } else if (arg == "-t" || arg == "--time-budget") {
            if (!next(opts.budget)) return false;
        } else if (arg == "-k" || arg == "--kerf") {
            if (!next(opts.kerf)) return false;
        } else if (arg == "--write-config") {
            if (!next(opts.writeConfigPath)) return false;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        } else if (opts.jobPath.empty()) {
            opts.jobPath = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            return false;
        }
    }
    return !opts.jobPath.empty() || !opts.writeConfigPath.empty();
}

// Precedence: command line over job settings over the INI file
bool applyOverrides(const Options& opts, const sc::optimizer::JobSettings& job,
                    sc::EngineConfig& config) {
    if (job.algorithm) config.mode = *job.algorithm;
    if (job.kerf) config.cutting.kerf = *job.kerf;
    if (job.startSafety) config.cutting.startSafety = *job.startSafety;
    if (job.endSafety) config.cutting.endSafety = *job.endSafety;
    if (job.timeBudgetMs) config.timeBudgetMs = *job.timeBudgetMs;
    if (job.seed) config.seed = *job.seed;

    if (!opts.mode.empty() &&
        !sc::optimizer::parseAlgorithm(sc::str::toLower(opts.mode), config.mode)) {
        std::cerr << "Error: unknown mode " << opts.mode << "\n";
        return false;
    }
    if (!opts.seed.empty()) {
        sc::u64 seed = 0;
        if (!sc::str::parseUint64(opts.seed, seed)) {
            std::cerr << "Error: bad seed " << opts.seed << "\n";
            return false;
        }
        config.seed = seed;
    }
    if (!opts.budget.empty() && !sc::str::parseDouble(opts.budget, config.timeBudgetMs)) {
        std::cerr << "Error: bad time budget " << opts.budget << "\n";
        return false;
    }
    if (!opts.kerf.empty() && !sc::str::parseDouble(opts.kerf, config.cutting.kerf)) {
        std::cerr << "Error: bad kerf " << opts.kerf << "\n";
        return false;
    }
    return true;
}

void printResult(const sc::optimizer::OptimizationResult& result) {
    using namespace sc::optimizer;

    std::cout << "Algorithm:   " << algorithmLabel(result.algorithm) << " (seed " << result.seed
              << ")\n";
    std::cout << "Bars:        " << result.barCount() << "\n";
    std::cout << "Stock:       " << sc::str::formatLength(result.totalStockLength) << "\n";
    std::cout << "Used:        " << sc::str::formatLength(result.totalUsedLength) << "\n";
    std::cout << "Waste:       " << sc::str::formatLength(result.totalWaste) << " ("
              << result.wastePercentage << "%)\n";
    std::cout << "Reclaimable: " << sc::str::formatLength(result.reclaimableLength) << "\n";
    std::cout << "Cost:        " << sc::str::formatAmount(result.cost.totalCost) << " ("
              << sc::str::formatAmount(result.cost.costPerMeter) << " per m)\n";
    std::cout << "Quality:     " << qualityGradeLabel(result.quality.grade) << " ("
              << result.quality.score << ")\n";
    if (auto reason = result.convergenceReason()) {
        std::cout << "Converged:   " << convergenceReasonLabel(*reason) << "\n";
    }

    std::cout << "\n";
    int bar = 1;
    for (const auto& cut : result.cuts) {
        std::cout << "#" << bar++ << " " << cut.profileType << " "
                  << sc::str::formatLength(cut.stockLength) << ":";
        for (const auto& segment : cut.segments) {
            std::cout << " " << segment.itemId << "=" << segment.length;
        }
        std::cout << "  [rest " << cut.remainingLength << ", "
                  << wasteCategoryLabel(cut.wasteCategory) << "]\n";
    }

    if (!result.recommendations.empty()) {
        std::cout << "\nRecommendations:\n";
        for (const auto& r : result.recommendations) {
            std::cout << "  [" << severityLabel(r.severity) << "] " << r.message << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    sc::EngineConfig config;
    if (!opts.configPath.empty() && !config.load(opts.configPath)) {
        return 1;
    }
    config.applyLogging();
    if (opts.verbose) {
        sc::log::setLevel(sc::log::Level::Debug);
    }

    sc::optimizer::JobFile job;
    if (!opts.jobPath.empty()) {
        auto loaded = sc::optimizer::PlanFile::loadJob(opts.jobPath);
        if (!loaded) {
            std::cerr << "Error: could not load job " << opts.jobPath << "\n";
            return 1;
        }
        job = std::move(*loaded);
    }

    if (!applyOverrides(opts, job.settings, config)) {
        return 1;
    }

    if (!opts.writeConfigPath.empty()) {
        return config.save(opts.writeConfigPath) ? 0 : 1;
    }

    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);

    try {
        auto result = sc::optimizer::optimize(job.items, job.stock, config.algorithmConfig(),
                                              &g_cancel);
        printResult(result);

        if (!opts.outputPath.empty() &&
            !sc::optimizer::PlanFile::saveResult(opts.outputPath, result, job.name)) {
            return 1;
        }
    } catch (const sc::optimizer::OptimizationError& e) {
        std::cerr << "Error (" << sc::optimizer::errorKindName(e.kind()) << "): " << e.what()
                  << "\n";
        return 2;
    }
    return 0;
}
