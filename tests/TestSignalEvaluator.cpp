#include "signal/SignalEvaluator.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace candlesim;
using namespace candlesim::signal;
using namespace candlesim::strategy;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

SignalCondition literal(IndicatorName indicator, ComparisonOperator op, double value, const std::string& id = "") {
    SignalCondition c;
    c.id = id;
    c.indicator = indicator;
    c.op = op;
    c.value = value;
    return c;
}

SignalGroup single(const SignalCondition& c) {
    SignalGroup g;
    g.conditions.push_back(c);
    return g;
}

// Runs the two-phase protocol over every index and collects the outcomes
std::vector<bool> replay(SignalEvaluator& evaluator, const SignalGroup& group, size_t count) {
    std::vector<bool> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(evaluator.evaluate(group, i).satisfied);
        evaluator.advance();
    }
    return out;
}

void testCompare() {
    assert(SignalEvaluator::compare(ComparisonOperator::GREATER, 2.0, 1.0));
    assert(!SignalEvaluator::compare(ComparisonOperator::GREATER, 1.0, 1.0));
    assert(SignalEvaluator::compare(ComparisonOperator::GREATER_EQUAL, 1.0, 1.0));
    assert(SignalEvaluator::compare(ComparisonOperator::LESS, 0.5, 1.0));
    assert(SignalEvaluator::compare(ComparisonOperator::LESS_EQUAL, 1.0, 1.0));
    assert(SignalEvaluator::compare(ComparisonOperator::EQUAL, 0.1 + 0.2, 0.3));
    assert(!SignalEvaluator::compare(ComparisonOperator::EQUAL, 1.0, 1.001));
    assert(SignalEvaluator::compare(ComparisonOperator::NOT_EQUAL, 1.0, 1.001));
    assert(!SignalEvaluator::compare(ComparisonOperator::GREATER, NaN, 1.0));
    assert(!SignalEvaluator::compare(ComparisonOperator::NOT_EQUAL, NaN, 1.0));
    std::cout << "  compare ok\n";
}

void testLiteralAndMissingValues() {
    analytics::IndicatorSeries series;
    series.setColumn(IndicatorName::RSI, "value", {20.0, NaN, 80.0});
    SignalEvaluator evaluator(series);

    const auto group = single(literal(IndicatorName::RSI, ComparisonOperator::GREATER, 70.0, "overbought"));
    const auto results = replay(evaluator, group, 3);
    assert(!results[0]);
    assert(!results[1]);
    assert(results[2]);

    // unknown field evaluates false
    SignalCondition unknown = literal(IndicatorName::RSI, ComparisonOperator::LESS, 1e9);
    unknown.field = "nope";
    assert(!evaluator.evaluate(single(unknown), 0).satisfied);

    const auto detail = evaluator.evaluate(group, 2);
    assert(detail.conditions.size() == 1);
    assert(detail.conditions[0].id == "overbought");
    assert(detail.conditions[0].left == 80.0);
    assert(detail.conditions[0].right == 70.0);
    std::cout << "  literal comparisons ok\n";
}

void testCrossDetection() {
    analytics::IndicatorSeries series;
    series.setColumn(IndicatorName::EMA, "ema9", {1.0, 2.0, 3.0, 2.0, 1.0});
    series.setColumn(IndicatorName::EMA, "ema20", {2.0, 2.0, 2.0, 2.0, 2.0});

    SignalCondition above;
    above.indicator = IndicatorName::EMA;
    above.field = "ema9";
    above.op = ComparisonOperator::CROSSES_ABOVE;
    above.secondary_indicator = IndicatorName::EMA;
    above.secondary_field = "ema20";

    SignalCondition below = above;
    below.op = ComparisonOperator::CROSSES_BELOW;

    {
        SignalEvaluator evaluator(series);
        const auto r = replay(evaluator, single(above), 5);
        // first candle has no history; touching the line then leaving it above counts
        assert(!r[0]);
        assert(!r[1]);
        assert(r[2]);
        assert(!r[3]);
        assert(!r[4]);
    }
    {
        SignalEvaluator evaluator(series);
        const auto r = replay(evaluator, single(below), 5);
        assert(!r[2]);
        assert(!r[3]);
        assert(r[4]);
    }
    {
        // advance() not called: nothing is committed, so no cross is ever seen
        SignalEvaluator evaluator(series);
        for (size_t i = 0; i < 5; ++i) {
            assert(!evaluator.evaluate(single(above), i).satisfied);
        }
    }
    {
        SignalEvaluator evaluator(series);
        replay(evaluator, single(above), 2);
        evaluator.reset();
        assert(!evaluator.evaluate(single(above), 2).satisfied);
    }
    std::cout << "  cross detection ok\n";
}

void testCrossWithGapInHistory() {
    analytics::IndicatorSeries series;
    series.setColumn(IndicatorName::PRICE_CHANGE, "close", {1.0, NaN, 3.0});
    SignalEvaluator evaluator(series);
    const auto r = replay(evaluator, single(literal(IndicatorName::PRICE_CHANGE, ComparisonOperator::CROSSES_ABOVE, 2.0)), 3);
    assert(!r[2]);
    std::cout << "  cross after NaN ok\n";
}

void testGroups() {
    analytics::IndicatorSeries series;
    series.setColumn(IndicatorName::RSI, "value", {50.0});
    series.setColumn(IndicatorName::ATR, "value", {2.0});
    SignalEvaluator evaluator(series);

    const auto rsi_high = literal(IndicatorName::RSI, ComparisonOperator::GREATER, 70.0);
    const auto rsi_mid = literal(IndicatorName::RSI, ComparisonOperator::GREATER, 40.0);
    const auto atr_low = literal(IndicatorName::ATR, ComparisonOperator::LESS, 3.0);

    SignalGroup and_group{SignalLogic::AND, {rsi_high, atr_low}, {}};
    SignalGroup or_group{SignalLogic::OR, {rsi_high, atr_low}, {}};
    assert(!evaluator.evaluate(and_group, 0).satisfied);
    assert(evaluator.evaluate(or_group, 0).satisfied);

    // every condition is reported, even after the outcome is decided
    assert(evaluator.evaluate(and_group, 0).conditions.size() == 2);

    SignalGroup nested{SignalLogic::AND, {rsi_mid}, {or_group}};
    assert(evaluator.evaluate(nested, 0).satisfied);

    assert(evaluator.evaluate(SignalGroup{}, 0).satisfied);
    std::cout << "  groups ok\n";
}

}

int main() {
    std::cout << "[TEST] Starting SignalEvaluator Test..." << std::endl;

    testCompare();
    testLiteralAndMissingValues();
    testCrossDetection();
    testCrossWithGapInHistory();
    testGroups();

    std::cout << "[TEST] SignalEvaluator PASSED" << std::endl;
    return 0;
}
