#include "strategy/StrategyConfig.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace candlesim {
namespace strategy {

namespace {
std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}

std::string toString(IndicatorName indicator) {
    switch (indicator) {
        case IndicatorName::PRICE_CHANGE: return "price_change";
        case IndicatorName::VOLUME_CHANGE: return "volume_change";
        case IndicatorName::SMA: return "sma";
        case IndicatorName::EMA: return "ema";
        case IndicatorName::VWMA: return "vwma";
        case IndicatorName::RSI: return "rsi";
        case IndicatorName::MACD: return "macd";
        case IndicatorName::BBANDS: return "bbands";
        case IndicatorName::ATR: return "atr";
        case IndicatorName::ICHIMOKU_CLOUD: return "ichimoku_cloud";
    }
    return "price_change";
}

std::string toString(ComparisonOperator op) {
    switch (op) {
        case ComparisonOperator::GREATER: return ">";
        case ComparisonOperator::GREATER_EQUAL: return ">=";
        case ComparisonOperator::LESS: return "<";
        case ComparisonOperator::LESS_EQUAL: return "<=";
        case ComparisonOperator::EQUAL: return "==";
        case ComparisonOperator::NOT_EQUAL: return "!=";
        case ComparisonOperator::CROSSES_ABOVE: return "crosses_above";
        case ComparisonOperator::CROSSES_BELOW: return "crosses_below";
    }
    return ">";
}

std::string toString(SignalLogic logic) {
    return logic == SignalLogic::OR ? "OR" : "AND";
}

std::optional<IndicatorName> indicatorFromString(const std::string& value) {
    const std::string v = lowerCopy(value);
    if (v == "price_change") return IndicatorName::PRICE_CHANGE;
    if (v == "volume_change") return IndicatorName::VOLUME_CHANGE;
    if (v == "sma") return IndicatorName::SMA;
    if (v == "ema") return IndicatorName::EMA;
    if (v == "vwma") return IndicatorName::VWMA;
    if (v == "rsi") return IndicatorName::RSI;
    if (v == "macd") return IndicatorName::MACD;
    if (v == "bbands") return IndicatorName::BBANDS;
    if (v == "atr") return IndicatorName::ATR;
    if (v == "ichimoku_cloud" || v == "ichimoku") return IndicatorName::ICHIMOKU_CLOUD;
    return std::nullopt;
}

std::optional<ComparisonOperator> operatorFromString(const std::string& value) {
    const std::string v = lowerCopy(value);
    if (v == ">") return ComparisonOperator::GREATER;
    if (v == ">=") return ComparisonOperator::GREATER_EQUAL;
    if (v == "<") return ComparisonOperator::LESS;
    if (v == "<=") return ComparisonOperator::LESS_EQUAL;
    if (v == "==") return ComparisonOperator::EQUAL;
    if (v == "!=") return ComparisonOperator::NOT_EQUAL;
    if (v == "crosses_above") return ComparisonOperator::CROSSES_ABOVE;
    if (v == "crosses_below") return ComparisonOperator::CROSSES_BELOW;
    return std::nullopt;
}

std::optional<SignalLogic> logicFromString(const std::string& value) {
    const std::string v = lowerCopy(value);
    if (v == "and") return SignalLogic::AND;
    if (v == "or") return SignalLogic::OR;
    return std::nullopt;
}

std::string ladderLegId(const LadderLeg& leg, size_t index) {
    if (!leg.id.empty()) {
        return leg.id;
    }
    std::ostringstream oss;
    oss << "leg" << index;
    if (leg.price_offset) {
        oss << "_offset" << *leg.price_offset;
    }
    if (leg.multiple) {
        oss << "_x" << *leg.multiple;
    }
    return oss.str();
}

bool usesSignals(const SimulationExtensions& extensions) {
    if (extensions.entry_signal || extensions.exit_signal) {
        return true;
    }
    auto ladderHasSignal = [](const std::optional<LadderConfig>& ladder) {
        return ladder && std::any_of(ladder->legs.begin(), ladder->legs.end(),
                                     [](const LadderLeg& leg) { return leg.signal.has_value(); });
    };
    return ladderHasSignal(extensions.entry_ladder) || ladderHasSignal(extensions.exit_ladder);
}

} // namespace strategy
} // namespace candlesim
