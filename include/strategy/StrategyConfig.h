#pragma once

#include <optional>
#include <string>
#include <vector>

namespace candlesim {
namespace strategy {

// Enabled(value) | Disabled for every optional numeric setting.
class Toggle {
public:
    Toggle() = default;

    static Toggle disabled() { return Toggle(); }
    static Toggle enabled(double value) {
        Toggle t;
        t.value_ = value;
        return t;
    }

    bool isEnabled() const { return value_.has_value(); }
    double value() const { return *value_; }
    double valueOr(double fallback) const { return value_.value_or(fallback); }

    bool operator==(const Toggle& other) const { return value_ == other.value_; }
    bool operator!=(const Toggle& other) const { return !(*this == other); }

private:
    std::optional<double> value_;
};

struct StrategyLeg {
    double target = 1.0;   // price multiple of entry
    double percent = 0.0;  // fraction of the position sold at target
};

struct StopLossConfig {
    double initial = -0.3;
    Toggle trailing = Toggle::enabled(0.5);
    Toggle trailing_percent;
};

struct EntryConfig {
    Toggle initial_entry;
    Toggle trailing_entry;
    int max_wait_time = 60;  // candles
};

struct ReEntryConfig {
    Toggle trailing_re_entry;
    int max_re_entries = 0;
    double size_percent = 0.5;
};

struct CostConfig {
    double entry_slippage_bps = 0.0;
    double exit_slippage_bps = 0.0;
    double taker_fee_bps = 25.0;
    double borrow_apr_bps = 0.0;
};

// ---- Signal tree ----

enum class IndicatorName {
    PRICE_CHANGE,
    VOLUME_CHANGE,
    SMA,
    EMA,
    VWMA,
    RSI,
    MACD,
    BBANDS,
    ATR,
    ICHIMOKU_CLOUD
};

enum class ComparisonOperator {
    GREATER,
    GREATER_EQUAL,
    LESS,
    LESS_EQUAL,
    EQUAL,
    NOT_EQUAL,
    CROSSES_ABOVE,
    CROSSES_BELOW
};

enum class SignalLogic { AND, OR };

struct SignalCondition {
    std::string id;
    IndicatorName indicator = IndicatorName::PRICE_CHANGE;
    std::string field = "value";
    ComparisonOperator op = ComparisonOperator::GREATER;
    std::optional<double> value;
    std::optional<IndicatorName> secondary_indicator;
    std::string secondary_field = "value";
};

struct SignalGroup {
    SignalLogic logic = SignalLogic::AND;
    std::vector<SignalCondition> conditions;
    std::vector<SignalGroup> groups;
};

// ---- Ladders ----

struct LadderLeg {
    double size_percent = 0.0;
    std::string id;
    std::optional<double> price_offset;
    std::optional<double> multiple;
    std::optional<SignalGroup> signal;
};

struct LadderConfig {
    bool sequential = true;
    std::vector<LadderLeg> legs;
};

// Optional engine inputs beyond the core leg/stop/entry/re-entry/cost settings.
struct SimulationExtensions {
    std::optional<SignalGroup> entry_signal;
    std::optional<SignalGroup> exit_signal;
    std::optional<LadderConfig> entry_ladder;
    std::optional<LadderConfig> exit_ladder;
    Toggle hold_hours;
    Toggle loss_clamp_percent;
    Toggle min_exit_price;  // fraction of entry price
};

struct StrategyConfig {
    std::string name;
    std::vector<StrategyLeg> legs;
    StopLossConfig stop_loss;
    EntryConfig entry;
    ReEntryConfig re_entry;
    CostConfig costs;
    SimulationExtensions extensions;
};

std::string toString(IndicatorName indicator);
std::string toString(ComparisonOperator op);
std::string toString(SignalLogic logic);
std::optional<IndicatorName> indicatorFromString(const std::string& value);
std::optional<ComparisonOperator> operatorFromString(const std::string& value);
std::optional<SignalLogic> logicFromString(const std::string& value);

// Ladder legs without an explicit id get one derived from their trigger settings.
std::string ladderLegId(const LadderLeg& leg, size_t index);

// True when any signal tree is configured, i.e. a run needs indicator columns.
bool usesSignals(const SimulationExtensions& extensions);

} // namespace strategy
} // namespace candlesim
