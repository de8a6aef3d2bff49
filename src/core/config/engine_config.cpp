#include "engine_config.h"

#include <sstream>

#include "../utils/file_utils.h"
#include "../utils/string_utils.h"

namespace sc {

using optimizer::Algorithm;

namespace {

void warnMalformed(const std::string& section, const std::string& key,
                   const std::string& value) {
    log::warningf("Config", "Ignoring malformed value %s.%s = '%s'", section.c_str(),
                  key.c_str(), value.c_str());
}

void readDouble(const std::string& section, const std::string& key, const std::string& value,
                f64& out) {
    if (!str::parseDouble(value, out)) {
        warnMalformed(section, key, value);
    }
}

void readInt(const std::string& section, const std::string& key, const std::string& value,
             int& out) {
    if (!str::parseInt(value, out)) {
        warnMalformed(section, key, value);
    }
}

void readBool(const std::string& section, const std::string& key, const std::string& value,
              bool& out) {
    if (!str::parseBool(value, out)) {
        warnMalformed(section, key, value);
    }
}

// 0 or "auto" leaves the population to be derived from the piece count
void readPopulation(const std::string& section, const std::string& key,
                    const std::string& value, std::optional<int>& out) {
    if (str::toLower(value) == "auto") {
        out.reset();
        return;
    }
    int population = 0;
    if (!str::parseInt(value, population)) {
        warnMalformed(section, key, value);
        return;
    }
    if (population <= 0) {
        out.reset();
    } else {
        out = population;
    }
}

// Keys shared by [genetic] and [nsga2]
bool applySearchKey(const std::string& section, const std::string& key,
                    const std::string& value, optimizer::GeneticParams& params) {
    if (key == "population") {
        readPopulation(section, key, value, params.populationSize);
    } else if (key == "generations") {
        readInt(section, key, value, params.maxGenerations);
    } else if (key == "plateau") {
        readInt(section, key, value, params.plateauGenerations);
    } else if (key == "tournament") {
        readInt(section, key, value, params.tournamentSize);
    } else if (key == "elites") {
        readInt(section, key, value, params.eliteCount);
    } else if (key == "crossover_rate") {
        readDouble(section, key, value, params.crossoverRate);
    } else if (key == "mutation_rate") {
        readDouble(section, key, value, params.mutationRate);
    } else if (key == "threads") {
        readInt(section, key, value, params.evaluationThreads);
    } else {
        return false;
    }
    return true;
}

void writeSearch(std::ostringstream& ss, const optimizer::GeneticParams& params) {
    ss << "population=" << params.populationSize.value_or(0) << "\n";
    ss << "generations=" << params.maxGenerations << "\n";
    ss << "plateau=" << params.plateauGenerations << "\n";
    ss << "tournament=" << params.tournamentSize << "\n";
    ss << "elites=" << params.eliteCount << "\n";
    ss << "crossover_rate=" << params.crossoverRate << "\n";
    ss << "mutation_rate=" << params.mutationRate << "\n";
    ss << "threads=" << params.evaluationThreads << "\n";
}

// Lowercase names as written to the [logging] section
const char* iniLevelName(log::Level level) {
    switch (level) {
    case log::Level::Debug:
        return "debug";
    case log::Level::Info:
        return "info";
    case log::Level::Warning:
        return "warning";
    case log::Level::Error:
        return "error";
    }
    return "info";
}

} // namespace

bool EngineConfig::load(const Path& path) {
    if (!file::exists(path)) {
        log::infof("Config", "No config file at %s, using defaults", path.string().c_str());
        return true;
    }

    auto content = file::readText(path);
    if (!content) {
        log::errorf("Config", "Failed to read config file %s", path.string().c_str());
        return false;
    }

    loadFromString(*content);
    log::debugf("Config", "Loaded %s", path.string().c_str());
    return true;
}

void EngineConfig::loadFromString(std::string_view text) {
    std::istringstream stream{std::string(text)};
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        line = str::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            section = str::toLower(str::trim(line.substr(1, line.length() - 2)));
            continue;
        }

        // Key=Value pair
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = str::toLower(str::trim(line.substr(0, pos)));
        std::string value = str::trim(line.substr(pos + 1));
        apply(section, key, value);
    }
}

void EngineConfig::apply(const std::string& section, const std::string& key,
                         const std::string& value) {
    if (section == "algorithm") {
        if (key == "mode") {
            if (!optimizer::parseAlgorithm(str::toLower(value), mode)) {
                warnMalformed(section, key, value);
            }
        } else if (key == "time_budget_ms") {
            readDouble(section, key, value, timeBudgetMs);
        } else if (key == "seed") {
            u64 parsed = 0;
            if (value.empty() || str::toLower(value) == "auto") {
                seed.reset();
            } else if (str::parseUint64(value, parsed)) {
                seed = parsed;
            } else {
                warnMalformed(section, key, value);
            }
        } else if (key == "profile_threads") {
            readInt(section, key, value, profileThreads);
        }
    } else if (section == "cutting") {
        if (key == "kerf") {
            readDouble(section, key, value, cutting.kerf);
        } else if (key == "start_safety") {
            readDouble(section, key, value, cutting.startSafety);
        } else if (key == "end_safety") {
            readDouble(section, key, value, cutting.endSafety);
        } else if (key == "tolerance_squeeze") {
            readBool(section, key, value, cutting.allowToleranceSqueeze);
        } else if (key == "right_size_stock") {
            readBool(section, key, value, cutting.rightSizeStock);
        } else if (key == "stock_selection") {
            if (!optimizer::parseStockSelection(str::toLower(value), cutting.stockSelection)) {
                warnMalformed(section, key, value);
            }
        }
    } else if (section == "genetic") {
        if (applySearchKey(section, key, value, genetic)) {
            return;
        }
        if (key == "weight_waste") {
            readDouble(section, key, value, genetic.weights.waste);
        } else if (key == "weight_bars") {
            readDouble(section, key, value, genetic.weights.barCount);
        } else if (key == "weight_cost") {
            readDouble(section, key, value, genetic.weights.cost);
        } else if (key == "weight_reclaim") {
            readDouble(section, key, value, genetic.weights.reclaimBonus);
        }
    } else if (section == "nsga2") {
        if (applySearchKey(section, key, value, nsga2.search)) {
            return;
        }
        if (key == "weight_waste") {
            readDouble(section, key, value, nsga2.scalarization.waste);
        } else if (key == "weight_cost") {
            readDouble(section, key, value, nsga2.scalarization.cost);
        } else if (key == "weight_bars") {
            readDouble(section, key, value, nsga2.scalarization.barCount);
        } else if (key == "selection") {
            if (!optimizer::parseFrontSelection(str::toLower(value), nsga2.selection)) {
                warnMalformed(section, key, value);
            }
        }
    } else if (section == "pooling") {
        if (key == "inner") {
            Algorithm inner;
            if (optimizer::parseAlgorithm(str::toLower(value), inner)) {
                pooling.inner = inner;
            } else {
                warnMalformed(section, key, value);
            }
        } else if (key == "min_waste_reduction") {
            readDouble(section, key, value, pooling.minWasteReduction);
        } else if (key == "max_mixed_bar_ratio") {
            readDouble(section, key, value, pooling.maxMixedBarRatio);
        }
    } else if (section == "waste") {
        if (key == "minimal_below") {
            readDouble(section, key, value, waste.minimalBelow);
        } else if (key == "small_below") {
            readDouble(section, key, value, waste.smallBelow);
        } else if (key == "medium_below") {
            readDouble(section, key, value, waste.mediumBelow);
        } else if (key == "large_up_to") {
            readDouble(section, key, value, waste.largeUpTo);
        } else if (key == "reclaim_floor") {
            readDouble(section, key, value, waste.reclaimFloor);
        } else if (key == "excessive_bar_ratio") {
            readDouble(section, key, value, waste.excessiveBarRatioWarning);
        }
    } else if (section == "cost") {
        if (key == "material_per_meter") {
            readDouble(section, key, value, cost.materialPerMeter);
        } else if (key == "labor_per_hour") {
            readDouble(section, key, value, cost.laborPerHour);
        } else if (key == "waste_per_meter") {
            readDouble(section, key, value, cost.wastePerMeter);
        } else if (key == "setup_per_event") {
            readDouble(section, key, value, cost.setupPerEvent);
        } else if (key == "cutting_per_cut") {
            readDouble(section, key, value, cost.cuttingPerCut);
        } else if (key == "machine_per_hour") {
            readDouble(section, key, value, cost.machinePerHour);
        }
    } else if (section == "time") {
        if (key == "load_minutes_per_bar") {
            readDouble(section, key, value, time.loadMinutesPerBar);
        } else if (key == "minutes_per_cut") {
            readDouble(section, key, value, time.minutesPerCut);
        }
    } else if (section == "logging") {
        if (key == "level") {
            if (!log::parseLevel(value, logLevel)) {
                warnMalformed(section, key, value);
            }
        } else if (key == "file") {
            logFile = value;
        }
    }
}

bool EngineConfig::save(const Path& path) const {
    if (!file::writeText(path, serialize())) {
        log::errorf("Config", "Failed to write config file %s", path.string().c_str());
        return false;
    }
    log::infof("Config", "Saved %s", path.string().c_str());
    return true;
}

std::string EngineConfig::serialize() const {
    std::ostringstream ss;

    ss << "# StockCut engine configuration\n\n";

    ss << "[algorithm]\n";
    ss << "mode=" << optimizer::algorithmLabel(mode) << "\n";
    ss << "time_budget_ms=" << timeBudgetMs << "\n";
    if (seed) {
        ss << "seed=" << *seed << "\n";
    } else {
        ss << "seed=auto\n";
    }
    ss << "profile_threads=" << profileThreads << "\n";
    ss << "\n";

    ss << "[cutting]\n";
    ss << "kerf=" << cutting.kerf << "\n";
    ss << "start_safety=" << cutting.startSafety << "\n";
    ss << "end_safety=" << cutting.endSafety << "\n";
    ss << "tolerance_squeeze=" << (cutting.allowToleranceSqueeze ? "true" : "false") << "\n";
    ss << "right_size_stock=" << (cutting.rightSizeStock ? "true" : "false") << "\n";
    ss << "stock_selection=" << optimizer::stockSelectionLabel(cutting.stockSelection) << "\n";
    ss << "\n";

    ss << "[genetic]\n";
    writeSearch(ss, genetic);
    ss << "weight_waste=" << genetic.weights.waste << "\n";
    ss << "weight_bars=" << genetic.weights.barCount << "\n";
    ss << "weight_cost=" << genetic.weights.cost << "\n";
    ss << "weight_reclaim=" << genetic.weights.reclaimBonus << "\n";
    ss << "\n";

    ss << "[nsga2]\n";
    writeSearch(ss, nsga2.search);
    ss << "weight_waste=" << nsga2.scalarization.waste << "\n";
    ss << "weight_cost=" << nsga2.scalarization.cost << "\n";
    ss << "weight_bars=" << nsga2.scalarization.barCount << "\n";
    ss << "selection=" << optimizer::frontSelectionLabel(nsga2.selection) << "\n";
    ss << "\n";

    ss << "[pooling]\n";
    ss << "inner=" << optimizer::algorithmLabel(pooling.inner) << "\n";
    ss << "min_waste_reduction=" << pooling.minWasteReduction << "\n";
    ss << "max_mixed_bar_ratio=" << pooling.maxMixedBarRatio << "\n";
    ss << "\n";

    ss << "[waste]\n";
    ss << "minimal_below=" << waste.minimalBelow << "\n";
    ss << "small_below=" << waste.smallBelow << "\n";
    ss << "medium_below=" << waste.mediumBelow << "\n";
    ss << "large_up_to=" << waste.largeUpTo << "\n";
    ss << "reclaim_floor=" << waste.reclaimFloor << "\n";
    ss << "excessive_bar_ratio=" << waste.excessiveBarRatioWarning << "\n";
    ss << "\n";

    ss << "[cost]\n";
    ss << "material_per_meter=" << cost.materialPerMeter << "\n";
    ss << "labor_per_hour=" << cost.laborPerHour << "\n";
    ss << "waste_per_meter=" << cost.wastePerMeter << "\n";
    ss << "setup_per_event=" << cost.setupPerEvent << "\n";
    ss << "cutting_per_cut=" << cost.cuttingPerCut << "\n";
    ss << "machine_per_hour=" << cost.machinePerHour << "\n";
    ss << "\n";

    ss << "[time]\n";
    ss << "load_minutes_per_bar=" << time.loadMinutesPerBar << "\n";
    ss << "minutes_per_cut=" << time.minutesPerCut << "\n";
    ss << "\n";

    ss << "[logging]\n";
    ss << "level=" << iniLevelName(logLevel) << "\n";
    if (!logFile.empty()) {
        ss << "file=" << logFile << "\n";
    }

    return ss.str();
}

optimizer::AlgorithmConfig EngineConfig::algorithmConfig() const {
    optimizer::AlgorithmConfig config;
    switch (mode) {
    case Algorithm::FirstFitDecreasing:
        config.strategy = optimizer::FfdParams{};
        break;
    case Algorithm::BestFitDecreasing:
        config.strategy = optimizer::BfdParams{};
        break;
    case Algorithm::Genetic:
        config.strategy = genetic;
        break;
    case Algorithm::Nsga2:
        config.strategy = nsga2;
        break;
    case Algorithm::Pooling: {
        optimizer::PoolingParams params = pooling;
        params.genetic = genetic;
        config.strategy = params;
        break;
    }
    }
    config.cutting = cutting;
    config.waste = waste;
    config.cost = cost;
    config.time = time;
    config.timeBudgetMs = timeBudgetMs;
    config.seed = seed;
    config.profileThreads = profileThreads;
    return config;
}

void EngineConfig::applyLogging() const {
    log::setLevel(logLevel);
    if (!logFile.empty() && !log::setLogFile(logFile)) {
        log::warningf("Config", "Cannot open log file %s, logging to console only",
                      logFile.c_str());
    }
}

} // namespace sc
