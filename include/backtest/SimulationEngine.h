#pragma once

#include <vector>

#include "backtest/SimulationResult.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace backtest {

// Replays a candle series against one strategy and returns the event ledger.
//
// Pure function of its inputs: no I/O, no shared state, safe to call from
// several threads at once. Malformed numbers (NaN) propagate into the result
// instead of raising. The configuration is not re-validated here; call
// StrategyValidator::validate first.
//
// Within a candle, price is assumed to move open -> low -> high -> close when
// close >= open and open -> high -> low -> close otherwise. Stops, trailing
// updates, ladder legs and targets are checked at each of those points in that
// order. Signals are evaluated once per candle on its closing indicator values.
class SimulationEngine {
public:
    static SimulationResult simulate(const CandleSeries& candles,
                                     const std::vector<strategy::StrategyLeg>& legs,
                                     const strategy::StopLossConfig& stop_loss = {},
                                     const strategy::EntryConfig& entry = {},
                                     const strategy::ReEntryConfig& re_entry = {},
                                     const strategy::CostConfig& costs = {},
                                     const strategy::SimulationExtensions& extensions = {});

    static SimulationResult simulate(const CandleSeries& candles, const strategy::StrategyConfig& config);
};

} // namespace backtest
} // namespace candlesim
