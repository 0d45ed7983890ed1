#pragma once

#include <map>
#include <string>
#include <vector>

#include "analytics/IndicatorSeries.h"
#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace signal {

struct ConditionOutcome {
    std::string id;
    bool satisfied = false;
    double left = 0.0;   // indicator.field at this candle
    double right = 0.0;  // literal value or secondary indicator.field
};

struct SignalEvaluation {
    bool satisfied = false;
    std::vector<ConditionOutcome> conditions;
};

// Evaluates signal trees candle by candle for one simulation run.
//
// Cross operators need the sample of the previous candle for the same
// (indicator.field, reference) pair, so evaluation is two-phase:
//   evaluate() reads the committed samples and stages the current ones,
//   advance() commits the staged samples once the candle is finished.
// Every tree the caller cares about must be evaluated on every candle,
// otherwise its cross state goes stale.
class SignalEvaluator {
public:
    explicit SignalEvaluator(const analytics::IndicatorSeries& indicators);

    SignalEvaluation evaluate(const strategy::SignalGroup& group, size_t index);

    void advance();
    void reset();

    static bool compare(strategy::ComparisonOperator op, double left, double right);

private:
    struct Sample {
        double left;
        double right;
    };

    bool evaluateGroup(const strategy::SignalGroup& group, size_t index, SignalEvaluation& out);
    bool evaluateCondition(const strategy::SignalCondition& condition, size_t index, SignalEvaluation& out);

    static std::string pairKey(const strategy::SignalCondition& condition);

    const analytics::IndicatorSeries& indicators_;
    std::map<std::string, Sample> previous_;
    std::map<std::string, Sample> staged_;
};

} // namespace signal
} // namespace candlesim
