#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/ScenarioTypes.h"

namespace candlesim {

class Config {
public:
    static Config& getInstance();

    // Missing or malformed files keep the defaults; problems are reported on stderr
    // because logging is configured from this file.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    bool isLoaded() const { return loaded_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    backtest::ScenarioDefaults getScenarioDefaults() const { return scenario_defaults_; }
    backtest::RunOptions getRunOptions() const { return run_options_; }

private:
    Config();

    bool loaded_ = false;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    backtest::ScenarioDefaults scenario_defaults_;
    backtest::RunOptions run_options_;
};

} // namespace candlesim
