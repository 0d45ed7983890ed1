#include "common/Config.h"
#include "backtest/ScenarioRunner.h"
#include "strategy/StrategyConfigJson.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace candlesim {

namespace {
std::string normalizeLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "warning") {
        return "warn";
    }
    return level;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config()
    : scenario_defaults_(backtest::ScenarioRunner::builtInDefaults()) {}

void Config::reset() {
    loaded_ = false;
    log_level_ = "info";
    log_dir_ = "logs";
    scenario_defaults_ = backtest::ScenarioRunner::builtInDefaults();
    run_options_ = backtest::RunOptions{};
}

void Config::load(const std::string& path) {
    try {
        const std::filesystem::path config_path(path);

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << ", using defaults" << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: cannot open config file: " << config_path << ", using defaults" << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    using strategy::StrategyConfigJson;

    // Sections are decoded into locals first so a bad value leaves the previous state intact.
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    backtest::ScenarioDefaults defaults = scenario_defaults_;
    backtest::RunOptions run = run_options_;

    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level = normalizeLevel(l.value("level", log_level));
        log_dir = l.value("dir", log_dir);
    }

    if (j.contains("defaults")) {
        auto& d = j["defaults"];
        if (d.contains("stopLoss")) {
            defaults.stop_loss = StrategyConfigJson::stopLossFromJson(d["stopLoss"]);
        }
        if (d.contains("entry")) {
            defaults.entry = StrategyConfigJson::entryFromJson(d["entry"]);
        }
        if (d.contains("reEntry")) {
            defaults.re_entry = StrategyConfigJson::reEntryFromJson(d["reEntry"]);
        }
        if (d.contains("costs")) {
            defaults.costs = StrategyConfigJson::costsFromJson(d["costs"]);
        }
    }

    if (j.contains("run")) {
        auto& r = j["run"];
        run.max_concurrency = std::max(1, r.value("maxConcurrency", run.max_concurrency));
        run.fail_fast = r.value("failFast", run.fail_fast);
        run.progress_interval = std::max(1, r.value("progressInterval", run.progress_interval));
    }

    log_level_ = log_level;
    log_dir_ = log_dir;
    scenario_defaults_ = defaults;
    run_options_ = run;
    loaded_ = true;
}

} // namespace candlesim
