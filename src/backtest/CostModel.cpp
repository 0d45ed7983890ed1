#include "backtest/CostModel.h"

namespace candlesim {
namespace backtest {

namespace {
constexpr double BPS = 10000.0;
constexpr double SECONDS_PER_YEAR = 365.0 * 24.0 * 60.0 * 60.0;
}

CostModel::CostModel(const strategy::CostConfig& config)
    : config_(config)
    , entry_multiplier_((1.0 + config.entry_slippage_bps / BPS) * (1.0 + config.taker_fee_bps / BPS))
    , exit_multiplier_((1.0 - config.exit_slippage_bps / BPS) * (1.0 - config.taker_fee_bps / BPS)) {}

double CostModel::entryFill(double theoretical) const {
    return theoretical * entry_multiplier_;
}

double CostModel::exitFill(double theoretical) const {
    return theoretical * exit_multiplier_;
}

double CostModel::borrowCost(double fraction, Timestamp opened_at, Timestamp closed_at) const {
    if (config_.borrow_apr_bps <= 0.0 || closed_at <= opened_at) {
        return 0.0;
    }
    const double elapsed = static_cast<double>(closed_at - opened_at);
    return fraction * (config_.borrow_apr_bps / BPS) * (elapsed / SECONDS_PER_YEAR);
}

} // namespace backtest
} // namespace candlesim
