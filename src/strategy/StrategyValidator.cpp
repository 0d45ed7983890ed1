#include "strategy/StrategyValidator.h"

#include <cmath>
#include <sstream>

namespace candlesim {
namespace strategy {

namespace {
constexpr double SUM_TOLERANCE = 1e-9;

std::string formatNumber(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

bool inClosedUnit(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool inHalfOpenUnit(double v) {
    return v >= 0.0 && v < 1.0;
}
}

ValidationResult StrategyValidator::validate(const StrategyConfig& config) {
    ValidationResult result;
    auto& errors = result.errors;

    if (config.name.empty()) {
        errors.push_back("Strategy name is required");
    }

    validateLegs(config.legs, errors);

    const auto& sl = config.stop_loss;
    if (!(sl.initial < 0.0)) {
        errors.push_back("stopLoss.initial must be negative (got " + formatNumber(sl.initial) + ")");
    }
    if (sl.trailing.isEnabled() && !inHalfOpenUnit(sl.trailing.value())) {
        errors.push_back("stopLoss.trailing must be in [0, 1) (got " + formatNumber(sl.trailing.value()) + ")");
    }
    if (sl.trailing_percent.isEnabled() && !inHalfOpenUnit(sl.trailing_percent.value())) {
        errors.push_back("stopLoss.trailingPercent must be in [0, 1) (got " +
                         formatNumber(sl.trailing_percent.value()) + ")");
    }

    const auto& entry = config.entry;
    if (entry.initial_entry.isEnabled() && !(entry.initial_entry.value() < 0.0)) {
        errors.push_back("entry.initialEntry must be negative, it is a percentage drop (got " +
                         formatNumber(entry.initial_entry.value()) + ")");
    }
    if (entry.trailing_entry.isEnabled() && !(entry.trailing_entry.value() >= 0.0)) {
        errors.push_back("entry.trailingEntry must be non-negative (got " +
                         formatNumber(entry.trailing_entry.value()) + ")");
    }
    if (entry.max_wait_time < 0) {
        errors.push_back("entry.maxWaitTime must be >= 0 (got " + std::to_string(entry.max_wait_time) + ")");
    }

    const auto& re = config.re_entry;
    if (re.trailing_re_entry.isEnabled() && !inHalfOpenUnit(re.trailing_re_entry.value())) {
        errors.push_back("reEntry.trailingReEntry must be in [0, 1) (got " +
                         formatNumber(re.trailing_re_entry.value()) + ")");
    }
    if (re.max_re_entries < 0) {
        errors.push_back("reEntry.maxReEntries must be >= 0 (got " + std::to_string(re.max_re_entries) + ")");
    }
    if (!(re.size_percent > 0.0 && re.size_percent <= 1.0)) {
        errors.push_back("reEntry.sizePercent must be in (0, 1] (got " + formatNumber(re.size_percent) + ")");
    }

    const auto& costs = config.costs;
    if (!(costs.entry_slippage_bps >= 0.0)) errors.push_back("costs.entrySlippageBps must be >= 0");
    if (!(costs.exit_slippage_bps >= 0.0)) errors.push_back("costs.exitSlippageBps must be >= 0");
    if (!(costs.taker_fee_bps >= 0.0)) errors.push_back("costs.takerFeeBps must be >= 0");
    if (!(costs.borrow_apr_bps >= 0.0)) errors.push_back("costs.borrowAprBps must be >= 0");

    const auto& ext = config.extensions;
    if (ext.hold_hours.isEnabled() && !(ext.hold_hours.value() >= 0.0)) {
        errors.push_back("holdHours must be >= 0 (got " + formatNumber(ext.hold_hours.value()) + ")");
    }
    if (ext.loss_clamp_percent.isEnabled() && !inClosedUnit(ext.loss_clamp_percent.value())) {
        errors.push_back("lossClampPercent must be in [0, 1] (got " + formatNumber(ext.loss_clamp_percent.value()) + ")");
    }
    if (ext.min_exit_price.isEnabled() && !inClosedUnit(ext.min_exit_price.value())) {
        errors.push_back("minExitPrice must be in [0, 1], a fraction of the entry price (got " +
                         formatNumber(ext.min_exit_price.value()) + ")");
    }

    if (ext.entry_ladder) validateLadder(*ext.entry_ladder, "entryLadder", errors);
    if (ext.exit_ladder) validateLadder(*ext.exit_ladder, "exitLadder", errors);
    if (ext.entry_signal) validateSignalGroup(*ext.entry_signal, "entrySignal", errors);
    if (ext.exit_signal) validateSignalGroup(*ext.exit_signal, "exitSignal", errors);

    result.valid = errors.empty();
    return result;
}

void StrategyValidator::validateLegs(const std::vector<StrategyLeg>& legs, std::vector<std::string>& errors) {
    if (legs.empty()) {
        errors.push_back("At least one profit target leg is required");
        return;
    }

    double sum = 0.0;
    for (size_t i = 0; i < legs.size(); ++i) {
        const auto& leg = legs[i];
        const std::string label = "legs[" + std::to_string(i) + "]";
        if (!(leg.target > 0.0)) {
            errors.push_back(label + ".target must be > 0 (got " + formatNumber(leg.target) + ")");
        }
        if (!inClosedUnit(leg.percent)) {
            errors.push_back(label + ".percent must be in [0, 1] (got " + formatNumber(leg.percent) + ")");
        }
        sum += leg.percent;
    }

    if (sum > 1.0 + SUM_TOLERANCE) {
        errors.push_back("Sum of leg percents is " + formatNumber(sum) + ", which exceeds the maximum of 1.0");
    }
}

void StrategyValidator::validateLadder(const LadderConfig& ladder, const std::string& label,
                                       std::vector<std::string>& errors) {
    if (ladder.legs.empty()) {
        errors.push_back(label + " must contain at least one leg");
        return;
    }

    double sum = 0.0;
    for (size_t i = 0; i < ladder.legs.size(); ++i) {
        const auto& leg = ladder.legs[i];
        const std::string leg_label = label + ".legs[" + std::to_string(i) + "]";
        if (!inClosedUnit(leg.size_percent)) {
            errors.push_back(leg_label + ".sizePercent must be in [0, 1] (got " + formatNumber(leg.size_percent) + ")");
        }
        if (leg.multiple && !(*leg.multiple > 0.0)) {
            errors.push_back(leg_label + ".multiple must be > 0 (got " + formatNumber(*leg.multiple) + ")");
        }
        if (leg.price_offset && !(*leg.price_offset > -1.0)) {
            errors.push_back(leg_label + ".priceOffset must be > -1 (got " + formatNumber(*leg.price_offset) + ")");
        }
        if (leg.signal) {
            validateSignalGroup(*leg.signal, leg_label + ".signal", errors);
        }
        sum += leg.size_percent;
    }

    if (sum > 1.0 + SUM_TOLERANCE) {
        errors.push_back("Sum of " + label + " sizePercent is " + formatNumber(sum) + ", which exceeds the maximum of 1.0");
    }
}

void StrategyValidator::validateSignalGroup(const SignalGroup& group, const std::string& label,
                                            std::vector<std::string>& errors) {
    for (size_t i = 0; i < group.conditions.size(); ++i) {
        const auto& c = group.conditions[i];
        if (!c.value && !c.secondary_indicator) {
            errors.push_back(label + ".conditions[" + std::to_string(i) +
                             "] needs either a value or a secondaryIndicator");
        }
        if (c.value && !std::isfinite(*c.value)) {
            errors.push_back(label + ".conditions[" + std::to_string(i) + "].value must be finite");
        }
    }
    for (size_t i = 0; i < group.groups.size(); ++i) {
        validateSignalGroup(group.groups[i], label + ".groups[" + std::to_string(i) + "]", errors);
    }
}

} // namespace strategy
} // namespace candlesim
