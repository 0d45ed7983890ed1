#include "backtest/ScenarioRunner.h"
#include "backtest/DataHistory.h"
#include "backtest/SimulationEngine.h"
#include "common/Logger.h"
#include "strategy/StrategyConfigJson.h"
#include "strategy/StrategyValidator.h"

#include <algorithm>
#include <thread>

namespace candlesim {
namespace backtest {

namespace {
template <typename T>
T pick(const std::optional<T>& scenario, const std::optional<T>& overrides,
       const std::optional<T>& defaults, const T& built_in) {
    if (scenario) return *scenario;
    if (overrides) return *overrides;
    if (defaults) return *defaults;
    return built_in;
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

// Outcome slot written by exactly one worker thread
struct TargetOutcome {
    bool ok = false;
    TargetResult value;
    std::string error;
};
}

ScenarioRunner::ScenarioRunner(std::vector<std::shared_ptr<core::IResultSink>> sinks,
                               ScenarioDefaults defaults)
    : sinks_(std::move(sinks))
    , defaults_(std::move(defaults)) {}

ScenarioDefaults ScenarioRunner::builtInDefaults() {
    ScenarioDefaults defaults;
    defaults.stop_loss = strategy::StopLossConfig{};
    defaults.entry = strategy::EntryConfig{};
    defaults.re_entry = strategy::ReEntryConfig{};
    defaults.costs = strategy::CostConfig{};
    return defaults;
}

strategy::StrategyConfig ScenarioRunner::resolve(const Scenario& scenario,
                                                 const ScenarioSections& overrides,
                                                 const ScenarioDefaults& defaults) {
    strategy::StrategyConfig config;
    config.name = scenario.name;
    config.legs = scenario.legs;
    config.stop_loss = pick(scenario.sections.stop_loss, overrides.stop_loss,
                            defaults.stop_loss, strategy::StopLossConfig{});
    config.entry = pick(scenario.sections.entry, overrides.entry, defaults.entry, strategy::EntryConfig{});
    config.re_entry = pick(scenario.sections.re_entry, overrides.re_entry,
                           defaults.re_entry, strategy::ReEntryConfig{});
    config.costs = pick(scenario.sections.costs, overrides.costs, defaults.costs, strategy::CostConfig{});
    config.extensions = scenario.extensions;
    return config;
}

Scenario ScenarioRunner::scenarioFromStrategy(const strategy::StrategyConfig& config) {
    Scenario scenario;
    scenario.id = config.name;
    scenario.name = config.name;
    scenario.legs = config.legs;
    scenario.sections.stop_loss = config.stop_loss;
    scenario.sections.entry = config.entry;
    scenario.sections.re_entry = config.re_entry;
    scenario.sections.costs = config.costs;
    scenario.extensions = config.extensions;
    return scenario;
}

Scenario ScenarioRunner::scenarioFromJson(const nlohmann::json& j) {
    using strategy::StrategyConfigJson;

    const auto config = StrategyConfigJson::fromJson(j);
    Scenario scenario;
    scenario.name = config.name;
    scenario.id = j.value("id", config.name);
    scenario.legs = config.legs;
    scenario.extensions = config.extensions;
    if (j.contains("stopLoss")) scenario.sections.stop_loss = config.stop_loss;
    if (j.contains("entry")) scenario.sections.entry = config.entry;
    if (j.contains("reEntry")) scenario.sections.re_entry = config.re_entry;
    if (j.contains("costs")) scenario.sections.costs = config.costs;
    return scenario;
}

ScenarioSummary ScenarioRunner::run(const ScenarioRequest& request) const {
    const auto config = resolve(request.scenario, request.overrides, defaults_);
    const auto validation = strategy::StrategyValidator::validate(config);
    if (!validation.valid) {
        throw std::invalid_argument("Scenario '" + request.scenario.name + "' is invalid: " +
                                    joinErrors(validation.errors));
    }

    ScenarioSummary summary;
    summary.scenario_id = request.scenario.id;
    summary.scenario_name = request.scenario.name;
    summary.total_targets = request.targets.size();

    const size_t batch_size = static_cast<size_t>(std::max(request.options.max_concurrency, 1));
    const size_t progress_interval = static_cast<size_t>(std::max(request.options.progress_interval, 1));
    size_t completed = 0;

    LOG_INFO("[Scenario] {} ({}): {} targets, concurrency {}",
             summary.scenario_name, summary.scenario_id, summary.total_targets, batch_size);

    for (size_t begin = 0; begin < request.targets.size(); begin += batch_size) {
        const size_t end = std::min(begin + batch_size, request.targets.size());
        std::vector<TargetOutcome> outcomes(end - begin);
        std::vector<std::thread> workers;
        workers.reserve(end - begin);

        for (size_t i = begin; i < end; ++i) {
            workers.emplace_back([&, i]() {
                auto& outcome = outcomes[i - begin];
                try {
                    outcome.value = runTarget(config, summary.scenario_id, request.targets[i], request);
                    outcome.ok = true;
                } catch (const std::exception& e) {
                    outcome.error = e.what();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (size_t i = begin; i < end; ++i) {
            auto& outcome = outcomes[i - begin];
            const auto& target = request.targets[i];
            if (outcome.ok) {
                ++summary.successes;
                summary.results.push_back(std::move(outcome.value));
            } else {
                ++summary.failures;
                LOG_ERROR("[Scenario] target {} failed: {}", target.id, outcome.error);
                SimulationRunError error(target.id, outcome.error);
                if (request.options.fail_fast) {
                    throw error;
                }
                summary.errors.push_back(std::move(error));
            }

            ++completed;
            if (completed % progress_interval == 0) {
                LOG_INFO("[Scenario] progress {}/{}", completed, summary.total_targets);
            }
        }
    }

    LOG_INFO("[Scenario] {} finished: {} ok, {} failed",
             summary.scenario_name, summary.successes, summary.failures);
    return summary;
}

TargetResult ScenarioRunner::runTarget(const strategy::StrategyConfig& config,
                                       const std::string& scenario_id,
                                       const SimulationTarget& target,
                                       const ScenarioRequest& request) const {
    const auto it = request.candles.find(target.id);
    if (it == request.candles.end()) {
        throw SimulationRunError(target.id, "No candles for target " + target.id);
    }
    const auto candles = DataHistory::filterByTime(it->second, target.start_time, target.end_time);
    if (candles.empty()) {
        throw SimulationRunError(target.id, "No candles in range for target " + target.id);
    }

    TargetResult out;
    out.target = target;
    out.result = SimulationEngine::simulate(candles, config);

    for (const auto& sink : sinks_) {
        if (sink && !sink->onResult(scenario_id, target, out.result)) {
            LOG_WARN("[Scenario] result sink rejected target {}", target.id);
        }
    }
    Logger::getInstance().logRun(target.id, scenario_id, out.result.final_pnl,
                                 out.result.events.size(), out.result.total_candles);
    return out;
}

nlohmann::json ScenarioRunner::summaryToJson(const ScenarioSummary& summary) {
    nlohmann::json j;
    j["scenarioId"] = summary.scenario_id;
    j["scenarioName"] = summary.scenario_name;
    j["totalTargets"] = summary.total_targets;
    j["successes"] = summary.successes;
    j["failures"] = summary.failures;
    j["results"] = nlohmann::json::array();
    for (const auto& r : summary.results) {
        j["results"].push_back({{"target", r.target.id}, {"chain", r.target.chain}, {"result", toJson(r.result)}});
    }
    j["errors"] = nlohmann::json::array();
    for (const auto& e : summary.errors) {
        j["errors"].push_back({{"target", e.targetId()}, {"message", e.what()}});
    }
    return j;
}

} // namespace backtest
} // namespace candlesim
