#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "backtest/SimulationResult.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace backtest {

// A token/market to replay, with an optional time window (0 = open).
struct SimulationTarget {
    std::string id;
    std::string chain = "solana";
    Timestamp start_time = 0;
    Timestamp end_time = 0;
};

// Strategy sections a scenario may leave unset; unset ones come from overrides or defaults.
struct ScenarioSections {
    std::optional<strategy::StopLossConfig> stop_loss;
    std::optional<strategy::EntryConfig> entry;
    std::optional<strategy::ReEntryConfig> re_entry;
    std::optional<strategy::CostConfig> costs;
};

using ScenarioDefaults = ScenarioSections;

struct Scenario {
    std::string id;
    std::string name;
    std::vector<strategy::StrategyLeg> legs;
    ScenarioSections sections;
    strategy::SimulationExtensions extensions;
};

struct RunOptions {
    int max_concurrency = 4;
    bool fail_fast = true;
    int progress_interval = 100;
};

struct ScenarioRequest {
    Scenario scenario;
    std::vector<SimulationTarget> targets;
    std::map<std::string, CandleSeries> candles;  // by target id
    ScenarioSections overrides;
    RunOptions options;
};

class SimulationRunError : public std::runtime_error {
public:
    SimulationRunError(std::string target_id, const std::string& message)
        : std::runtime_error(message), target_id_(std::move(target_id)) {}

    const std::string& targetId() const { return target_id_; }

private:
    std::string target_id_;
};

struct TargetResult {
    SimulationTarget target;
    SimulationResult result;
};

struct ScenarioSummary {
    std::string scenario_id;
    std::string scenario_name;
    size_t total_targets = 0;
    size_t successes = 0;
    size_t failures = 0;
    std::vector<TargetResult> results;
    std::vector<SimulationRunError> errors;
};

} // namespace backtest
} // namespace candlesim
