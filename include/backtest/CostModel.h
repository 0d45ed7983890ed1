#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace backtest {

// Converts theoretical fill prices into realized prices and accrues borrow cost.
// Basis points: 1 bps = 0.01%.
class CostModel {
public:
    explicit CostModel(const strategy::CostConfig& config);

    // Slippage and fee both raise the price paid on entry
    double entryFill(double theoretical) const;

    // ...and lower the price received on exit
    double exitFill(double theoretical) const;

    // Financing charged on a position fraction held from opened_at to closed_at, in position units
    double borrowCost(double fraction, Timestamp opened_at, Timestamp closed_at) const;

    double entryMultiplier() const { return entry_multiplier_; }
    double exitMultiplier() const { return exit_multiplier_; }

    const strategy::CostConfig& config() const { return config_; }

private:
    strategy::CostConfig config_;
    double entry_multiplier_;
    double exit_multiplier_;
};

} // namespace backtest
} // namespace candlesim
