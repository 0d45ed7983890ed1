#include "signal/SignalEvaluator.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace candlesim {
namespace signal {

using strategy::ComparisonOperator;
using strategy::SignalCondition;
using strategy::SignalGroup;
using strategy::SignalLogic;

namespace {
constexpr double EQUAL_TOLERANCE = 1e-9;

bool nearlyEqual(double a, double b) {
    const double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= EQUAL_TOLERANCE * scale;
}
}

SignalEvaluator::SignalEvaluator(const analytics::IndicatorSeries& indicators)
    : indicators_(indicators) {}

SignalEvaluation SignalEvaluator::evaluate(const SignalGroup& group, size_t index) {
    SignalEvaluation out;
    out.satisfied = evaluateGroup(group, index, out);
    return out;
}

void SignalEvaluator::advance() {
    for (const auto& [key, sample] : staged_) {
        previous_[key] = sample;
    }
    staged_.clear();
}

void SignalEvaluator::reset() {
    previous_.clear();
    staged_.clear();
}

bool SignalEvaluator::compare(ComparisonOperator op, double left, double right) {
    if (std::isnan(left) || std::isnan(right)) {
        return false;
    }
    switch (op) {
        case ComparisonOperator::GREATER: return left > right;
        case ComparisonOperator::GREATER_EQUAL: return left >= right;
        case ComparisonOperator::LESS: return left < right;
        case ComparisonOperator::LESS_EQUAL: return left <= right;
        case ComparisonOperator::EQUAL: return nearlyEqual(left, right);
        case ComparisonOperator::NOT_EQUAL: return !nearlyEqual(left, right);
        case ComparisonOperator::CROSSES_ABOVE:
        case ComparisonOperator::CROSSES_BELOW:
            // needs history, handled by evaluateCondition
            return false;
    }
    return false;
}

bool SignalEvaluator::evaluateGroup(const SignalGroup& group, size_t index, SignalEvaluation& out) {
    if (group.conditions.empty() && group.groups.empty()) {
        return true;
    }

    // No short-circuit: every condition has to stage its sample for this candle.
    bool any = false;
    bool all = true;
    for (const auto& condition : group.conditions) {
        const bool ok = evaluateCondition(condition, index, out);
        any = any || ok;
        all = all && ok;
    }
    for (const auto& child : group.groups) {
        const bool ok = evaluateGroup(child, index, out);
        any = any || ok;
        all = all && ok;
    }

    return group.logic == SignalLogic::AND ? all : any;
}

bool SignalEvaluator::evaluateCondition(const SignalCondition& condition, size_t index, SignalEvaluation& out) {
    ConditionOutcome outcome;
    outcome.id = condition.id;
    outcome.left = indicators_.value(index, condition.indicator, condition.field);
    if (condition.secondary_indicator) {
        outcome.right = indicators_.value(index, *condition.secondary_indicator, condition.secondary_field);
    } else if (condition.value) {
        outcome.right = *condition.value;
    } else {
        outcome.right = std::nan("");
    }

    const std::string key = pairKey(condition);
    staged_[key] = Sample{outcome.left, outcome.right};

    if (condition.op == ComparisonOperator::CROSSES_ABOVE || condition.op == ComparisonOperator::CROSSES_BELOW) {
        const auto prev = previous_.find(key);
        const bool current_defined = !std::isnan(outcome.left) && !std::isnan(outcome.right);
        if (prev != previous_.end() && current_defined &&
            !std::isnan(prev->second.left) && !std::isnan(prev->second.right)) {
            if (condition.op == ComparisonOperator::CROSSES_ABOVE) {
                outcome.satisfied = prev->second.left <= prev->second.right && outcome.left > outcome.right;
            } else {
                outcome.satisfied = prev->second.left >= prev->second.right && outcome.left < outcome.right;
            }
        }
    } else {
        outcome.satisfied = compare(condition.op, outcome.left, outcome.right);
    }

    out.conditions.push_back(outcome);
    return outcome.satisfied;
}

std::string SignalEvaluator::pairKey(const SignalCondition& condition) {
    std::ostringstream oss;
    oss << strategy::toString(condition.indicator) << '.' << condition.field << '|';
    if (condition.secondary_indicator) {
        oss << strategy::toString(*condition.secondary_indicator) << '.' << condition.secondary_field;
    } else if (condition.value) {
        oss.precision(17);
        oss << *condition.value;
    }
    return oss.str();
}

} // namespace signal
} // namespace candlesim
