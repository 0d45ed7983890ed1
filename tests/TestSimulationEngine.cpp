#include "backtest/SimulationEngine.h"
#include "strategy/StrategyValidator.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using namespace candlesim;
using namespace candlesim::backtest;
using namespace candlesim::strategy;

namespace {

constexpr Timestamp START = 1700000000;

// One candle per price with open = high = low = close
CandleSeries flat(const std::vector<double>& prices, Timestamp step = 60) {
    CandleSeries candles;
    for (size_t i = 0; i < prices.size(); ++i) {
        candles.emplace_back(prices[i], prices[i], prices[i], prices[i], 1000.0,
                             START + static_cast<Timestamp>(i) * step);
    }
    return candles;
}

CostConfig noCosts() {
    CostConfig costs;
    costs.taker_fee_bps = 0.0;
    return costs;
}

StopLossConfig fixedStop(double initial) {
    StopLossConfig sl;
    sl.initial = initial;
    sl.trailing = Toggle::disabled();
    return sl;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

// Every unit bought at the last entry must leave through an exit event
void checkConservation(const SimulationResult& result) {
    double entered = 0.0;
    double exited = 0.0;
    double previous = 0.0;
    for (const auto& e : result.events) {
        switch (e.type) {
            case SimulationEventType::ENTRY:
            case SimulationEventType::TRAILING_ENTRY_TRIGGERED:
            case SimulationEventType::RE_ENTRY:
            case SimulationEventType::LADDER_ENTRY:
                if (e.type != SimulationEventType::LADDER_ENTRY || previous <= 0.0) {
                    entered = 0.0;
                    exited = 0.0;
                }
                entered += e.remaining_position - previous;
                break;
            case SimulationEventType::TARGET_HIT:
            case SimulationEventType::LADDER_EXIT:
            case SimulationEventType::STOP_LOSS:
            case SimulationEventType::FINAL_EXIT:
                exited += previous - e.remaining_position;
                break;
            case SimulationEventType::STOP_MOVED:
                break;
        }
        previous = e.remaining_position;
    }
    assert(near(entered, exited + previous));
}

void testEmptyInput() {
    const auto result = SimulationEngine::simulate({}, std::vector<StrategyLeg>{{2.0, 1.0}});
    assert(result.final_pnl == 0.0);
    assert(result.total_candles == 0);
    assert(result.events.empty());
    std::cout << "  empty input ok\n";
}

void testBasicProfitableRun() {
    CandleSeries candles;
    double open = 1.0;
    for (int i = 0; i < 10; ++i) {
        const double close = 1.05 + 0.1 * i;
        candles.emplace_back(open, close, open, close, 1000.0, START + i * 60);
        open = close;
    }

    const auto result = SimulationEngine::simulate(candles, std::vector<StrategyLeg>{{2.0, 0.5}, {3.0, 0.5}});
    assert(result.total_candles == 10);
    assert(result.final_pnl > 0.0);
    assert(!result.events.empty());
    assert(result.events.front().type == SimulationEventType::ENTRY);
    assert(result.events.back().type == SimulationEventType::FINAL_EXIT);
    assert(result.countEvents(SimulationEventType::TARGET_HIT) == 0);
    // trailing activates at 1.5x and lifts the stop to break-even once
    assert(result.countEvents(SimulationEventType::STOP_MOVED) == 1);
    assert(near(result.entry_price, 1.0));
    assert(near(result.final_price, 1.95));
    checkConservation(result);
    std::cout << "  basic profitable run ok\n";
}

void testDeterminism() {
    CandleSeries candles;
    for (int i = 0; i < 120; ++i) {
        const double base = 1.0 + 0.4 * std::sin(i / 7.0) + 0.002 * i;
        candles.emplace_back(base, base * 1.03, base * 0.97, base * 1.01, 500.0 + i, START + i * 60);
    }
    StrategyConfig config;
    config.name = "determinism";
    config.legs = {{1.2, 0.3}, {1.4, 0.3}};
    config.stop_loss.trailing_percent = Toggle::enabled(0.1);
    config.re_entry.trailing_re_entry = Toggle::enabled(0.1);
    config.re_entry.max_re_entries = 3;

    const auto a = SimulationEngine::simulate(candles, config);
    const auto b = SimulationEngine::simulate(candles, config);
    assert(toJson(a).dump() == toJson(b).dump());
    assert(a.countEvents(SimulationEventType::RE_ENTRY) <= 3);
    std::cout << "  determinism ok\n";
}

void testStopLossBeforeTarget() {
    const auto candles = flat({1.0, 0.9, 0.8, 0.75, 0.65, 0.5, 0.4, 0.3});
    const auto result = SimulationEngine::simulate(candles, {{2.0, 1.0}}, fixedStop(-0.3), {}, {}, noCosts());
    assert(result.countEvents(SimulationEventType::STOP_LOSS) == 1);
    assert(result.countEvents(SimulationEventType::TARGET_HIT) == 0);
    assert(near(result.final_pnl, 0.65));
    checkConservation(result);
    std::cout << "  stop loss before target ok\n";
}

void testGapThroughStopFillsAtOpen() {
    const auto candles = flat({1.0, 0.5, 0.4});
    const auto result = SimulationEngine::simulate(candles, {{2.0, 1.0}}, fixedStop(-0.3), {}, {}, noCosts());
    assert(result.countEvents(SimulationEventType::STOP_LOSS) == 1);
    assert(near(result.final_pnl, 0.5));

    SimulationExtensions ext;
    ext.loss_clamp_percent = Toggle::enabled(0.2);
    const auto clamped = SimulationEngine::simulate(candles, {{2.0, 1.0}}, fixedStop(-0.3), {}, {}, noCosts(), ext);
    assert(near(clamped.final_pnl, 0.8));
    std::cout << "  gap through stop ok\n";
}

void testExactTargetTouch() {
    const auto candles = flat({1.0, 1.5, 2.0, 2.0, 2.0, 2.0});
    const auto result = SimulationEngine::simulate(candles, std::vector<StrategyLeg>{{2.0, 1.0}});
    assert(result.countEvents(SimulationEventType::TARGET_HIT) == 1);
    for (const auto& e : result.events) {
        if (e.type == SimulationEventType::TARGET_HIT) {
            assert(e.price == 2.0);
            assert(e.remaining_position == 0.0);
        }
    }
    std::cout << "  exact target touch ok\n";
}

void testZeroPercentLeg() {
    const auto candles = flat({1.0, 1.5, 2.0, 2.5, 3.0, 3.5});
    const auto result = SimulationEngine::simulate(candles, {{2.0, 0.0}, {3.0, 1.0}}, {}, {}, {}, noCosts());
    assert(result.final_pnl >= 0.0);
    assert(near(result.final_pnl, 3.0));
    bool saw_zero_leg = false;
    for (const auto& e : result.events) {
        if (e.type == SimulationEventType::TARGET_HIT && e.price == 2.0) {
            saw_zero_leg = true;
            assert(e.remaining_position == 1.0);
        }
    }
    assert(saw_zero_leg);
    checkConservation(result);
    std::cout << "  zero percent leg ok\n";
}

void testIntraBarOrdering() {
    // close >= open: the low comes first, so the stop wins
    CandleSeries up = {Candle(1.0, 1.5, 0.5, 1.1, 1000.0, START)};
    auto r = SimulationEngine::simulate(up, {{1.4, 1.0}}, fixedStop(-0.3), {}, {}, noCosts());
    assert(r.countEvents(SimulationEventType::STOP_LOSS) == 1);
    assert(r.countEvents(SimulationEventType::TARGET_HIT) == 0);
    assert(near(r.final_pnl, 0.7));

    // close < open: the high comes first, so the target wins
    CandleSeries down = {Candle(1.0, 1.5, 0.5, 0.6, 1000.0, START)};
    r = SimulationEngine::simulate(down, {{1.4, 1.0}}, fixedStop(-0.3), {}, {}, noCosts());
    assert(r.countEvents(SimulationEventType::TARGET_HIT) == 1);
    assert(r.countEvents(SimulationEventType::STOP_LOSS) == 0);
    assert(near(r.final_pnl, 1.4));
    std::cout << "  intra-bar ordering ok\n";
}

void testCostsApplied() {
    CostConfig costs;
    costs.taker_fee_bps = 100.0;
    const auto r = SimulationEngine::simulate(flat({1.0, 2.0}), {{2.0, 1.0}}, fixedStop(-0.3), {}, {}, costs);
    assert(near(r.final_pnl, 2.0 * 0.99 / 1.01));
    std::cout << "  costs ok\n";
}

void testNoTrade() {
    EntryConfig entry;
    entry.initial_entry = Toggle::enabled(-0.5);
    auto r = SimulationEngine::simulate(flat({1.0, 0.9, 0.8}), {{2.0, 1.0}}, {}, entry);
    assert(r.final_pnl == 0.0);
    assert(r.events.size() == 1);
    assert(r.events.front().type == SimulationEventType::ENTRY);
    assert(r.events.front().description.rfind("No trade", 0) == 0);

    entry.max_wait_time = 1;
    r = SimulationEngine::simulate(flat({1.0, 0.9, 0.8, 0.4}), {{2.0, 1.0}}, {}, entry);
    assert(r.final_pnl == 0.0);
    assert(r.events.size() == 1);
    assert(r.events.front().description.find("within 1 candles") != std::string::npos);
    std::cout << "  no trade ok\n";
}

void testInitialDropEntry() {
    EntryConfig entry;
    entry.initial_entry = Toggle::enabled(-0.5);
    const auto r = SimulationEngine::simulate(flat({1.0, 0.8, 0.4, 0.8}), {{2.0, 1.0}}, fixedStop(-0.5),
                                              entry, {}, noCosts());
    assert(r.events.front().type == SimulationEventType::ENTRY);
    assert(near(r.entry_price, 0.4));
    assert(near(r.final_pnl, 2.0));
    assert(near(r.entry_optimization.entry_delay, 2.0));
    std::cout << "  initial drop entry ok\n";
}

void testTrailingEntry() {
    EntryConfig entry;
    entry.trailing_entry = Toggle::enabled(0.1);
    const auto r = SimulationEngine::simulate(flat({1.0, 0.8, 0.7, 0.8, 0.9}), {{2.0, 1.0}}, {}, entry, {}, noCosts());
    assert(r.events.front().type == SimulationEventType::TRAILING_ENTRY_TRIGGERED);
    assert(r.entry_optimization.trailing_entry_used);
    assert(near(r.entry_price, 0.8));
    assert(near(r.entry_optimization.actual_entry_price, 0.8));
    assert(near(r.entry_optimization.entry_delay, 3.0));
    assert(near(r.entry_optimization.lowest_price, 0.7));
    assert(near(r.entry_optimization.lowest_price_percent, -12.5));
    assert(near(r.entry_optimization.lowest_price_time_from_entry, -1.0));
    std::cout << "  trailing entry ok\n";
}

void testEntrySignal() {
    SignalCondition c;
    c.id = "close_above";
    c.indicator = IndicatorName::PRICE_CHANGE;
    c.field = "close";
    c.op = ComparisonOperator::GREATER;
    c.value = 1.2;
    SimulationExtensions ext;
    ext.entry_signal = SignalGroup{SignalLogic::AND, {c}, {}};

    const auto r = SimulationEngine::simulate(flat({1.0, 1.1, 1.3, 1.4}), {{2.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(r.events.front().type == SimulationEventType::ENTRY);
    assert(near(r.entry_price, 1.3));
    assert(near(r.entry_optimization.entry_delay, 2.0));
    assert(near(r.final_pnl, 1.4 / 1.3));
    std::cout << "  entry signal ok\n";
}

void testEntryLadder() {
    LadderConfig ladder;
    ladder.sequential = true;
    LadderLeg first;
    first.size_percent = 0.5;
    first.price_offset = -0.1;
    LadderLeg second;
    second.size_percent = 0.5;
    second.price_offset = -0.2;
    ladder.legs = {first, second};
    SimulationExtensions ext;
    ext.entry_ladder = ladder;

    const auto r = SimulationEngine::simulate(flat({1.0, 0.88, 0.78, 1.2}), {{2.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::LADDER_ENTRY) == 2);
    assert(near(r.entry_price, 0.83));
    assert(near(r.final_pnl, 1.2 / 0.83));
    checkConservation(r);

    // sequential: the deeper leg waits for the first
    ext.entry_ladder->legs[0].price_offset = -0.3;
    const auto waiting = SimulationEngine::simulate(flat({1.0, 0.78, 1.0}), {{2.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(waiting.countEvents(SimulationEventType::LADDER_ENTRY) == 0);
    assert(waiting.final_pnl == 0.0);

    ext.entry_ladder->sequential = false;
    const auto parallel = SimulationEngine::simulate(flat({1.0, 0.78, 1.0}), {{2.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(parallel.countEvents(SimulationEventType::LADDER_ENTRY) == 1);
    assert(near(parallel.final_pnl, 0.5 * 1.0 / 0.78));
    std::cout << "  entry ladder ok\n";
}

// A deeper leg still pending must not buy below a stop the price has already gone through
void testStopBeatsPendingLadderLeg() {
    LadderLeg first;
    first.size_percent = 0.5;
    first.price_offset = -0.1;
    LadderLeg deep;
    deep.size_percent = 0.5;
    deep.price_offset = -0.5;
    SimulationExtensions ext;
    ext.entry_ladder = LadderConfig{true, {first, deep}};

    const auto r = SimulationEngine::simulate(flat({1.0, 0.9, 0.5, 0.4}), std::vector<StrategyLeg>{{2.0, 1.0}},
                                              fixedStop(-0.3), {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::LADDER_ENTRY) == 1);
    assert(r.countEvents(SimulationEventType::STOP_LOSS) == 1);
    assert(r.events.back().type == SimulationEventType::STOP_LOSS);
    assert(near(r.events.back().price, 0.5));
    assert(near(r.final_pnl, 0.5 * 0.5 / 0.9));
    checkConservation(r);
    std::cout << "  stop before pending ladder leg ok\n";
}

// After the first partial exit the entry ladder closes; targets keep their original base
void testLadderClosesAfterPartialExit() {
    LadderLeg first;
    first.size_percent = 0.5;
    first.price_offset = -0.1;
    LadderLeg deep;
    deep.size_percent = 0.5;
    deep.price_offset = -0.28;
    SimulationExtensions ext;
    ext.entry_ladder = LadderConfig{true, {first, deep}};

    const auto r = SimulationEngine::simulate(flat({1.0, 0.9, 1.1, 0.72, 1.2, 1.2}),
                                              std::vector<StrategyLeg>{{1.2, 0.5}, {1.5, 0.5}},
                                              fixedStop(-0.3), {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::LADDER_ENTRY) == 1);
    assert(r.countEvents(SimulationEventType::TARGET_HIT) == 1);
    assert(near(r.entry_price, 0.9));
    assert(r.events.back().type == SimulationEventType::FINAL_EXIT);
    assert(near(r.final_pnl, 0.25 * 1.1 / 0.9 + 0.25 * 1.2 / 0.9));
    checkConservation(r);
    std::cout << "  ladder closes after partial exit ok\n";
}

void testExitLadder() {
    LadderConfig ladder;
    LadderLeg first;
    first.id = "half_at_1_5";
    first.size_percent = 0.5;
    first.multiple = 1.5;
    LadderLeg second;
    second.size_percent = 0.5;
    second.multiple = 2.0;
    ladder.legs = {first, second};
    SimulationExtensions ext;
    ext.exit_ladder = ladder;

    const auto r = SimulationEngine::simulate(flat({1.0, 1.6, 2.1, 2.5}), {{10.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::LADDER_EXIT) == 2);
    assert(r.countEvents(SimulationEventType::TARGET_HIT) == 0);
    assert(r.countEvents(SimulationEventType::FINAL_EXIT) == 0);
    assert(near(r.final_pnl, 0.5 * 1.6 + 0.5 * 2.1));
    bool named = false;
    for (const auto& e : r.events) {
        if (e.description.find("half_at_1_5") != std::string::npos) named = true;
    }
    assert(named);
    checkConservation(r);
    std::cout << "  exit ladder ok\n";
}

void testSignalGatedLadderLeg() {
    SignalCondition c;
    c.indicator = IndicatorName::PRICE_CHANGE;
    c.field = "close";
    c.op = ComparisonOperator::GREATER_EQUAL;
    c.value = 2.0;
    LadderLeg leg;
    leg.size_percent = 1.0;
    leg.signal = SignalGroup{SignalLogic::AND, {c}, {}};
    SimulationExtensions ext;
    ext.exit_ladder = LadderConfig{true, {leg}};

    const auto r = SimulationEngine::simulate(flat({1.0, 1.5, 2.5, 3.0}), {{10.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::LADDER_EXIT) == 1);
    assert(near(r.final_pnl, 2.5));
    std::cout << "  signal gated ladder leg ok\n";
}

void testExitSignal() {
    SignalCondition c;
    c.indicator = IndicatorName::PRICE_CHANGE;
    c.field = "close";
    c.op = ComparisonOperator::CROSSES_BELOW;
    c.value = 1.5;
    SimulationExtensions ext;
    ext.exit_signal = SignalGroup{SignalLogic::AND, {c}, {}};

    const auto r = SimulationEngine::simulate(flat({1.0, 1.6, 1.7, 1.4, 1.3}), {{3.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    assert(r.countEvents(SimulationEventType::FINAL_EXIT) == 1);
    const auto& last = r.events.back();
    assert(last.type == SimulationEventType::FINAL_EXIT);
    assert(last.description.rfind("Signal-based exit", 0) == 0);
    assert(last.timestamp == START + 3 * 60);
    assert(near(r.final_pnl, 1.4));
    std::cout << "  exit signal ok\n";
}

void testHoldHours() {
    std::vector<double> prices(20, 1.0);
    SimulationExtensions ext;
    ext.hold_hours = Toggle::enabled(1.0);
    const auto r = SimulationEngine::simulate(flat(prices, 600), {{2.0, 1.0}}, {}, {}, {}, noCosts(), ext);
    const auto& last = r.events.back();
    assert(last.type == SimulationEventType::FINAL_EXIT);
    assert(last.description.rfind("Hold time", 0) == 0);
    assert(last.timestamp == START + 6 * 600);
    std::cout << "  hold hours ok\n";
}

void testReEntryAfterStop() {
    ReEntryConfig re;
    re.trailing_re_entry = Toggle::enabled(0.1);
    re.max_re_entries = 2;
    re.size_percent = 0.5;
    const auto candles = flat({1.0, 0.85, 0.8, 0.95, 0.8, 0.7, 0.9, 0.7, 0.6, 0.8, 0.6});
    const auto r = SimulationEngine::simulate(candles, {{2.0, 1.0}}, fixedStop(-0.1), {}, re, noCosts());
    assert(r.countEvents(SimulationEventType::RE_ENTRY) == 2);
    assert(r.countEvents(SimulationEventType::STOP_LOSS) == 3);
    assert(near(r.final_pnl, 0.85 + 0.5 * 0.8 / 0.95 + 0.5 * 0.7 / 0.9));
    for (const auto& e : r.events) {
        if (e.type == SimulationEventType::RE_ENTRY) {
            assert(near(e.remaining_position, 0.5));
        }
    }
    checkConservation(r);

    re.max_re_entries = 0;
    const auto none = SimulationEngine::simulate(candles, {{2.0, 1.0}}, fixedStop(-0.1), {}, re, noCosts());
    assert(none.countEvents(SimulationEventType::RE_ENTRY) == 0);
    std::cout << "  re-entry after stop ok\n";
}

void testReEntryAfterTargets() {
    ReEntryConfig re;
    re.trailing_re_entry = Toggle::enabled(0.2);
    re.max_re_entries = 1;
    re.size_percent = 0.5;
    const auto r = SimulationEngine::simulate(flat({1.0, 2.0, 2.5, 1.9, 3.0}), {{2.0, 1.0}}, {}, {}, re, noCosts());
    assert(r.countEvents(SimulationEventType::TARGET_HIT) == 1);
    assert(r.countEvents(SimulationEventType::RE_ENTRY) == 1);
    assert(near(r.final_pnl, 2.0 + 0.5 * 3.0 / 1.9));
    assert(near(r.entry_price, 1.0));
    std::cout << "  re-entry after targets ok\n";
}

void testTrailingPercentRatchet() {
    StopLossConfig sl;
    sl.initial = -0.3;
    sl.trailing = Toggle::enabled(0.2);
    sl.trailing_percent = Toggle::enabled(0.1);
    const auto r = SimulationEngine::simulate(flat({1.0, 1.3, 1.6, 2.0, 1.7}), {{5.0, 1.0}}, sl, {}, {}, noCosts());
    // activation at 1.3, raises at 1.6 and 2.0
    assert(r.countEvents(SimulationEventType::STOP_MOVED) == 3);
    assert(r.countEvents(SimulationEventType::STOP_LOSS) == 1);
    assert(near(r.final_pnl, 1.7));
    std::cout << "  trailing percent ratchet ok\n";
}

void testNaNPropagates() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto r = SimulationEngine::simulate(flat({1.0, nan, 1.2}), {{2.0, 1.0}}, {}, {}, {}, noCosts());
    assert(r.total_candles == 3);
    assert(near(r.final_pnl, 1.2));

    r = SimulationEngine::simulate(flat({1.0, 1.1, nan}), {{2.0, 1.0}}, {}, {}, {}, noCosts());
    assert(std::isnan(r.final_pnl));
    std::cout << "  NaN propagation ok\n";
}

void testValidationMessages() {
    StrategyConfig config;
    config.name = "too_much";
    config.legs = {{2.0, 0.6}, {3.0, 0.5}};
    auto v = StrategyValidator::validate(config);
    assert(!v.valid);
    bool found = false;
    for (const auto& e : v.errors) {
        if (e.find("1.1") != std::string::npos && e.find("1.0") != std::string::npos) found = true;
    }
    assert(found);

    config.legs = {{2.0, 0.5}, {3.0, 0.5}};
    v = StrategyValidator::validate(config);
    assert(v.valid);
    assert(v.errors.empty());
    std::cout << "  validation messages ok\n";
}

}

int main() {
    std::cout << "[TEST] Starting SimulationEngine Test..." << std::endl;

    testEmptyInput();
    testBasicProfitableRun();
    testDeterminism();
    testStopLossBeforeTarget();
    testGapThroughStopFillsAtOpen();
    testExactTargetTouch();
    testZeroPercentLeg();
    testIntraBarOrdering();
    testCostsApplied();
    testNoTrade();
    testInitialDropEntry();
    testTrailingEntry();
    testEntrySignal();
    testEntryLadder();
    testStopBeatsPendingLadderLeg();
    testLadderClosesAfterPartialExit();
    testExitLadder();
    testSignalGatedLadderLeg();
    testExitSignal();
    testHoldHours();
    testReEntryAfterStop();
    testReEntryAfterTargets();
    testTrailingPercentRatchet();
    testNaNPropagates();
    testValidationMessages();

    std::cout << "[TEST] SimulationEngine PASSED" << std::endl;
    return 0;
}
