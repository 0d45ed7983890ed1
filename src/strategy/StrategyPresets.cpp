#include "strategy/StrategyPresets.h"

#include <algorithm>
#include <cctype>

namespace candlesim {
namespace strategy {

namespace {
std::string normalizePresetName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

StrategyConfig withLegs(const std::string& name, std::vector<StrategyLeg> legs) {
    StrategyConfig config;
    config.name = name;
    config.legs = std::move(legs);
    return config;
}

// 60% at 2x, 30% at 3x, 10% at 5x with a tight stop
StrategyConfig conservative() {
    auto config = withLegs("conservative", {{2.0, 0.6}, {3.0, 0.3}, {5.0, 0.1}});
    config.stop_loss.initial = -0.2;
    config.stop_loss.trailing = Toggle::enabled(0.3);
    return config;
}

StrategyConfig balanced() {
    return withLegs("balanced", {{2.0, 0.5}, {5.0, 0.3}, {10.0, 0.2}});
}

StrategyConfig aggressive() {
    auto config = withLegs("aggressive", {{3.0, 0.3}, {5.0, 0.4}, {10.0, 0.3}});
    config.stop_loss.initial = -0.4;
    config.stop_loss.trailing_percent = Toggle::enabled(0.25);
    return config;
}

// Sells 20% early and lets the rest ride a 30% trailing stop
StrategyConfig moonshot() {
    auto config = withLegs("moonshot", {{3.0, 0.1}, {5.0, 0.1}});
    config.stop_loss.trailing_percent = Toggle::enabled(0.3);
    return config;
}

StrategyConfig trailingEntry() {
    auto config = withLegs("trailing_entry", {{2.0, 0.5}, {5.0, 0.3}, {10.0, 0.2}});
    config.entry.trailing_entry = Toggle::enabled(0.1);
    config.entry.max_wait_time = 60;
    return config;
}

StrategyConfig dipBuyer() {
    auto config = withLegs("dip_buyer", {{1.5, 0.5}, {2.0, 0.5}});
    config.entry.initial_entry = Toggle::enabled(-0.2);
    config.re_entry.trailing_re_entry = Toggle::enabled(0.15);
    config.re_entry.max_re_entries = 2;
    config.re_entry.size_percent = 0.5;
    return config;
}

StrategyConfig ladderScaleOut() {
    auto config = withLegs("ladder_scale_out", {{2.0, 1.0}});
    LadderConfig ladder;
    ladder.sequential = true;

    LadderLeg first;
    first.id = "tp_1_5x";
    first.size_percent = 0.25;
    first.multiple = 1.5;

    LadderLeg second;
    second.id = "tp_2x";
    second.size_percent = 0.25;
    second.multiple = 2.0;

    LadderLeg third;
    third.id = "tp_3x_rsi";
    third.size_percent = 0.5;
    third.multiple = 3.0;
    SignalGroup overbought;
    SignalCondition rsi;
    rsi.id = "rsi_overbought";
    rsi.indicator = IndicatorName::RSI;
    rsi.op = ComparisonOperator::GREATER_EQUAL;
    rsi.value = 70.0;
    overbought.conditions.push_back(rsi);
    third.signal = overbought;

    ladder.legs = {first, second, third};
    config.extensions.exit_ladder = ladder;
    return config;
}

// Exits when close falls through the Ichimoku base line
StrategyConfig ichimokuExit() {
    auto config = withLegs("ichimoku_exit", {{2.0, 0.5}, {4.0, 0.5}});
    SignalGroup exit_signal;
    SignalCondition cross;
    cross.id = "close_below_kijun";
    cross.indicator = IndicatorName::PRICE_CHANGE;
    cross.field = "close";
    cross.op = ComparisonOperator::CROSSES_BELOW;
    cross.secondary_indicator = IndicatorName::ICHIMOKU_CLOUD;
    cross.secondary_field = "kijun";
    exit_signal.conditions.push_back(cross);
    config.extensions.exit_signal = exit_signal;
    config.extensions.hold_hours = Toggle::enabled(48.0);
    return config;
}
}

std::optional<StrategyConfig> StrategyPresets::buildFromPreset(const std::string& name) {
    const std::string key = normalizePresetName(name);
    if (key == "conservative") return conservative();
    if (key == "balanced" || key == "default") return balanced();
    if (key == "aggressive") return aggressive();
    if (key == "moonshot") return moonshot();
    if (key == "trailing_entry") return trailingEntry();
    if (key == "dip_buyer") return dipBuyer();
    if (key == "ladder_scale_out") return ladderScaleOut();
    if (key == "ichimoku_exit") return ichimokuExit();
    return std::nullopt;
}

std::vector<std::string> StrategyPresets::presetNames() {
    return {"conservative", "balanced", "aggressive", "moonshot",
            "trailing_entry", "dip_buyer", "ladder_scale_out", "ichimoku_exit"};
}

} // namespace strategy
} // namespace candlesim
