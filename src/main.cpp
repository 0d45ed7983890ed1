#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "backtest/ScenarioRunner.h"
#include "core/state/ResultJournalJsonl.h"
#include "strategy/StrategyPresets.h"
#include "strategy/StrategyValidator.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace candlesim;

namespace {

constexpr int EXIT_INVALID = 2;

struct CliOptions {
    std::string candles_path;
    std::string strategy_path;
    std::string preset;
    std::string config_path = "config/config.json";
    std::string journal_path;
    bool json_mode = false;
    bool validate_only = false;
    bool list_presets = false;
};

void printUsage() {
    std::cerr << "Usage:\n"
              << "  candlesim --candles <file.csv|file.json> (--strategy <file.json> | --preset <name>)\n"
              << "            [--config <config.json>] [--journal <results.jsonl>] [--json] [--validate-only]\n"
              << "  candlesim --list-presets\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--validate-only") {
            options.validate_only = true;
        } else if (arg == "--list-presets") {
            options.list_presets = true;
        } else if (arg == "--candles") {
            if (!next(options.candles_path)) return false;
        } else if (arg == "--strategy") {
            if (!next(options.strategy_path)) return false;
        } else if (arg == "--preset") {
            if (!next(options.preset)) return false;
        } else if (arg == "--config") {
            if (!next(options.config_path)) return false;
        } else if (arg == "--journal") {
            if (!next(options.journal_path)) return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

backtest::Scenario loadScenario(const CliOptions& options) {
    if (!options.preset.empty()) {
        const auto preset = strategy::StrategyPresets::buildFromPreset(options.preset);
        if (!preset) {
            throw std::invalid_argument("Unknown preset: " + options.preset);
        }
        return backtest::ScenarioRunner::scenarioFromStrategy(*preset);
    }

    std::ifstream file(options.strategy_path);
    if (!file.is_open()) {
        throw std::invalid_argument("Cannot open strategy file: " + options.strategy_path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Cannot parse strategy file " + options.strategy_path + ": " + e.what());
    }
    return backtest::ScenarioRunner::scenarioFromJson(j);
}

void printLedger(const backtest::SimulationResult& result, const std::string& target) {
    std::cout << "\nSimulation result: " << target << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::left
              << std::setw(12) << "timestamp"
              << std::setw(26) << "event"
              << std::setw(16) << "price"
              << std::setw(11) << "remaining"
              << std::setw(12) << "pnl"
              << "description\n";
    for (const auto& e : result.events) {
        std::cout << std::left
                  << std::setw(12) << e.timestamp
                  << std::setw(26) << backtest::toString(e.type)
                  << std::setw(16) << std::fixed << std::setprecision(8) << e.price
                  << std::setw(11) << std::setprecision(4) << e.remaining_position
                  << std::setw(12) << std::setprecision(6) << e.pnl_so_far
                  << e.description << "\n";
    }
    std::cout << "---------------------------------------------\n";
    std::cout << "Final PnL:     " << std::setprecision(6) << result.final_pnl << "x\n";
    std::cout << "Entry price:   " << std::setprecision(8) << result.entry_price << "\n";
    std::cout << "Final price:   " << result.final_price << "\n";
    std::cout << "Candles:       " << result.total_candles << "\n";
    const auto& opt = result.entry_optimization;
    std::cout << "Lowest price:  " << opt.lowest_price
              << " (" << std::setprecision(1) << opt.lowest_price_percent << "% vs entry, "
              << opt.lowest_price_time_from_entry << " min from entry)\n";
    std::cout << "Entry delay:   " << opt.entry_delay << " min"
              << (opt.trailing_entry_used ? " (trailing entry)" : "") << "\n";
    std::cout << "---------------------------------------------\n";
}

}

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return EXIT_INVALID;
    }

    if (options.list_presets) {
        for (const auto& name : strategy::StrategyPresets::presetNames()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    if (options.strategy_path.empty() == options.preset.empty()) {
        std::cerr << "Exactly one of --strategy or --preset is required\n";
        printUsage();
        return EXIT_INVALID;
    }
    if (options.candles_path.empty() && !options.validate_only) {
        std::cerr << "--candles is required\n";
        printUsage();
        return EXIT_INVALID;
    }

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);

        // Keep stdout clean for JSON consumers
        Logger::getInstance().initialize(config.getLogDir(), options.json_mode ? "error" : config.getLogLevel());

        backtest::Scenario scenario;
        try {
            scenario = loadScenario(options);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return EXIT_INVALID;
        }

        const auto resolved = backtest::ScenarioRunner::resolve(scenario, {}, config.getScenarioDefaults());
        const auto validation = strategy::StrategyValidator::validate(resolved);
        if (!validation.valid) {
            std::cerr << "Strategy '" << resolved.name << "' is invalid:\n";
            for (const auto& error : validation.errors) {
                std::cerr << "  - " << error << "\n";
            }
            return EXIT_INVALID;
        }
        if (options.validate_only) {
            std::cout << "Strategy '" << resolved.name << "' is valid\n";
            return 0;
        }

        const auto candles = backtest::DataHistory::load(options.candles_path);
        if (candles.empty()) {
            std::cerr << "No candles loaded from " << options.candles_path << "\n";
            return 1;
        }

        backtest::SimulationTarget target;
        target.id = std::filesystem::path(options.candles_path).stem().string();

        backtest::ScenarioRequest request;
        request.scenario = scenario;
        request.targets.push_back(target);
        request.candles[target.id] = candles;
        request.options = config.getRunOptions();
        request.options.fail_fast = true;

        std::vector<std::shared_ptr<core::IResultSink>> sinks;
        if (!options.journal_path.empty()) {
            sinks.push_back(std::make_shared<core::ResultJournalJsonl>(options.journal_path));
        }

        backtest::ScenarioRunner runner(sinks, config.getScenarioDefaults());
        const auto summary = runner.run(request);
        const auto& result = summary.results.front().result;

        if (options.json_mode) {
            std::cout << backtest::toJson(result).dump(2) << "\n";
            return 0;
        }

        LOG_INFO("Simulated {} with strategy '{}'", target.id, resolved.name);
        printLedger(result, target.id);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}
