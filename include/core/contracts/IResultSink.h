#pragma once

#include <string>

#include "backtest/ScenarioTypes.h"

namespace candlesim {
namespace core {

// Receives every finished simulation. Called from worker threads.
class IResultSink {
public:
    virtual ~IResultSink() = default;

    virtual bool onResult(const std::string& scenario_id,
                          const backtest::SimulationTarget& target,
                          const backtest::SimulationResult& result) = 0;
};

} // namespace core
} // namespace candlesim
