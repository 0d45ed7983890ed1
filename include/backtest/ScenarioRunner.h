#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

#include "backtest/ScenarioTypes.h"
#include "core/contracts/IResultSink.h"

namespace candlesim {
namespace backtest {

// Runs one scenario over many targets, maxConcurrency targets at a time.
// Results go to every sink and into the returned summary.
class ScenarioRunner {
public:
    explicit ScenarioRunner(std::vector<std::shared_ptr<core::IResultSink>> sinks = {},
                            ScenarioDefaults defaults = builtInDefaults());

    // std::invalid_argument when the resolved strategy fails validation.
    // With fail_fast the first target failure is rethrown as SimulationRunError.
    ScenarioSummary run(const ScenarioRequest& request) const;

    // Section precedence: scenario, then overrides, then runner defaults, then built-ins
    static strategy::StrategyConfig resolve(const Scenario& scenario,
                                            const ScenarioSections& overrides,
                                            const ScenarioDefaults& defaults);

    static ScenarioDefaults builtInDefaults();

    // Every section set, so defaults never apply
    static Scenario scenarioFromStrategy(const strategy::StrategyConfig& config);

    // Sections absent from the document stay unset
    static Scenario scenarioFromJson(const nlohmann::json& j);

    static nlohmann::json summaryToJson(const ScenarioSummary& summary);

private:
    TargetResult runTarget(const strategy::StrategyConfig& config,
                           const std::string& scenario_id,
                           const SimulationTarget& target,
                           const ScenarioRequest& request) const;

    std::vector<std::shared_ptr<core::IResultSink>> sinks_;
    ScenarioDefaults defaults_;
};

} // namespace backtest
} // namespace candlesim
