#include "backtest/SimulationEngine.h"
#include "analytics/IndicatorSeries.h"
#include "backtest/CostModel.h"
#include "common/Logger.h"
#include "signal/SignalEvaluator.h"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace candlesim {
namespace backtest {

using strategy::CostConfig;
using strategy::EntryConfig;
using strategy::LadderConfig;
using strategy::LadderLeg;
using strategy::ReEntryConfig;
using strategy::SimulationExtensions;
using strategy::StopLossConfig;
using strategy::StrategyLeg;

namespace {

constexpr double POSITION_EPSILON = 1e-9;

enum class Phase { AWAITING_ENTRY, IN_POSITION, RE_ENTRY_WAIT, TERMINATED };

enum class EntryPolicy { ENTRY_LADDER, ENTRY_SIGNAL, TRAILING_ENTRY, INITIAL_DROP, IMMEDIATE };

// What closed the previous position decides which extreme re-entry trails.
enum class ReEntryMode { AFTER_STOP, AFTER_EXHAUSTED };

struct PathPoint {
    double price;
    bool at_open;
};

std::array<PathPoint, 4> intraBarPath(const Candle& candle) {
    if (candle.close >= candle.open) {
        return {{{candle.open, true}, {candle.low, false}, {candle.high, false}, {candle.close, false}}};
    }
    return {{{candle.open, true}, {candle.high, false}, {candle.low, false}, {candle.close, false}}};
}

// A level reached inside the bar fills at the level; one already passed at the open fills at the open.
double fillPrice(double level, const PathPoint& point) {
    return point.at_open ? point.price : level;
}

// Checks a ladder leg's price condition. Buy legs trigger at or below their levels, sell legs
// at or above. A leg without priceOffset and multiple has no price condition.
bool ladderLegTriggered(const LadderLeg& leg, double reference, bool buying,
                        const PathPoint& point, bool signal_ok, double& fill) {
    if (!signal_ok) {
        return false;
    }

    bool has_level = false;
    double level = 0.0;
    auto consider = [&](double candidate) {
        if (!has_level) {
            level = candidate;
            has_level = true;
        } else {
            level = buying ? std::min(level, candidate) : std::max(level, candidate);
        }
    };
    if (leg.price_offset) consider(reference * (1.0 + *leg.price_offset));
    if (leg.multiple) consider(reference * *leg.multiple);

    if (!has_level) {
        fill = point.price;
        return !std::isnan(point.price);
    }

    const bool reached = buying ? point.price <= level : point.price >= level;
    if (!reached) {
        return false;
    }
    fill = fillPrice(level, point);
    return true;
}

// Ladder sub-state: next eligible leg when sequential, set of fired legs when parallel.
class LadderProgress {
public:
    void reset(const LadderConfig* ladder) {
        sequential_ = ladder ? ladder->sequential : true;
        next_ = 0;
        fired_.assign(ladder ? ladder->legs.size() : 0, false);
    }

    bool finished() const {
        return std::all_of(fired_.begin(), fired_.end(), [](bool f) { return f; });
    }

    // try_fire(k) returns true when leg k fired.
    template <typename TryFire>
    void step(TryFire try_fire) {
        if (sequential_) {
            while (next_ < fired_.size() && try_fire(next_)) {
                fired_[next_] = true;
                ++next_;
            }
            return;
        }
        for (size_t k = 0; k < fired_.size(); ++k) {
            if (!fired_[k] && try_fire(k)) {
                fired_[k] = true;
            }
        }
    }

private:
    bool sequential_ = true;
    size_t next_ = 0;
    std::vector<bool> fired_;
};

struct CandleSignals {
    bool entry = false;
    bool exit = false;
    std::vector<bool> entry_ladder;
    std::vector<bool> exit_ladder;
};

// All mutable state of one simulate() call.
class SimulationRun {
public:
    SimulationRun(const CandleSeries& candles,
                  const std::vector<StrategyLeg>& legs,
                  const StopLossConfig& stop_loss,
                  const EntryConfig& entry,
                  const ReEntryConfig& re_entry,
                  const CostConfig& costs,
                  const SimulationExtensions& extensions)
        : candles_(candles)
        , legs_(legs)
        , stop_loss_(stop_loss)
        , entry_(entry)
        , re_entry_(re_entry)
        , extensions_(extensions)
        , cost_(costs)
        , indicators_(strategy::usesSignals(extensions) ? analytics::IndicatorSeries::build(candles)
                                                        : analytics::IndicatorSeries{})
        , evaluator_(indicators_) {
        std::stable_sort(legs_.begin(), legs_.end(),
            [](const StrategyLeg& a, const StrategyLeg& b) { return a.target < b.target; });

        if (hasLadder(extensions_.entry_ladder)) {
            policy_ = EntryPolicy::ENTRY_LADDER;
        } else if (extensions_.entry_signal) {
            policy_ = EntryPolicy::ENTRY_SIGNAL;
        } else if (entry_.trailing_entry.isEnabled()) {
            policy_ = EntryPolicy::TRAILING_ENTRY;
        } else if (entry_.initial_entry.isEnabled()) {
            policy_ = EntryPolicy::INITIAL_DROP;
        }

        entry_ladder_.reset(hasLadder(extensions_.entry_ladder) ? &*extensions_.entry_ladder : nullptr);
        exit_ladder_.reset(hasLadder(extensions_.exit_ladder) ? &*extensions_.exit_ladder : nullptr);
    }

    SimulationResult run() {
        if (candles_.empty()) {
            return SimulationResult{};
        }

        running_low_ = candles_.front().open;

        for (size_t i = 0; i < candles_.size() && phase_ != Phase::TERMINATED; ++i) {
            const CandleSignals signals = evaluateSignals(i);
            for (const auto& point : intraBarPath(candles_[i])) {
                if (phase_ == Phase::TERMINATED) {
                    break;
                }
                processPoint(i, point, signals);
            }
            if (phase_ != Phase::TERMINATED) {
                processClose(i, signals);
            }
            evaluator_.advance();
        }

        finish();
        return buildResult();
    }

private:
    static bool hasLadder(const std::optional<LadderConfig>& ladder) {
        return ladder && !ladder->legs.empty();
    }

    // Every configured tree is evaluated once per candle so cross detection stays aligned.
    CandleSignals evaluateSignals(size_t index) {
        CandleSignals signals;
        if (extensions_.entry_signal) {
            signals.entry = evaluator_.evaluate(*extensions_.entry_signal, index).satisfied;
        }
        if (extensions_.exit_signal) {
            signals.exit = evaluator_.evaluate(*extensions_.exit_signal, index).satisfied;
        }
        signals.entry_ladder = evaluateLadderSignals(extensions_.entry_ladder, index);
        signals.exit_ladder = evaluateLadderSignals(extensions_.exit_ladder, index);
        return signals;
    }

    std::vector<bool> evaluateLadderSignals(const std::optional<LadderConfig>& ladder, size_t index) {
        std::vector<bool> out;
        if (!ladder) {
            return out;
        }
        out.reserve(ladder->legs.size());
        for (const auto& leg : ladder->legs) {
            out.push_back(leg.signal ? evaluator_.evaluate(*leg.signal, index).satisfied : true);
        }
        return out;
    }

    void processPoint(size_t index, const PathPoint& point, const CandleSignals& signals) {
        switch (phase_) {
            case Phase::AWAITING_ENTRY:
                tryEntry(index, point, signals);
                break;
            case Phase::IN_POSITION:
                managePosition(index, point, signals);
                break;
            case Phase::RE_ENTRY_WAIT:
                tryReEntry(index, point);
                break;
            case Phase::TERMINATED:
                break;
        }
    }

    // ---- Entry ----

    void tryEntry(size_t index, const PathPoint& point, const CandleSignals& signals) {
        const double first_open = candles_.front().open;

        switch (policy_) {
            case EntryPolicy::IMMEDIATE:
                if (index == 0 && point.at_open) {
                    openPosition(SimulationEventType::ENTRY, index, point.price,
                                 fmt::format("Entry at {:.8f}", point.price));
                }
                break;

            case EntryPolicy::INITIAL_DROP: {
                const double drop = entry_.initial_entry.value();
                const double level = first_open * (1.0 + drop);
                if (point.price <= level) {
                    const double price = fillPrice(level, point);
                    openPosition(SimulationEventType::ENTRY, index, price,
                                 fmt::format("Initial entry at {:.8f} ({:.0f}% drop from first open)",
                                             price, std::abs(drop) * 100.0));
                }
                break;
            }

            case EntryPolicy::TRAILING_ENTRY: {
                const double rebound = entry_.trailing_entry.value();
                const double level = running_low_ * (1.0 + rebound);
                if (point.price >= level) {
                    const double price = fillPrice(level, point);
                    trailing_entry_used_ = true;
                    openPosition(SimulationEventType::TRAILING_ENTRY_TRIGGERED, index, price,
                                 fmt::format("Trailing entry triggered at {:.8f} ({:.1f}% from lowest {:.8f})",
                                             price, rebound * 100.0, running_low_));
                } else if (point.price < running_low_) {
                    running_low_ = point.price;
                }
                break;
            }

            case EntryPolicy::ENTRY_LADDER:
                tryEntryLadder(index, point, signals);
                break;

            case EntryPolicy::ENTRY_SIGNAL:
                // fills at the candle close
                break;
        }
    }

    void tryEntryLadder(size_t index, const PathPoint& point, const CandleSignals& signals) {
        if (!entry_ladder_open_ || entry_ladder_.finished()) {
            return;
        }
        const auto& ladder = *extensions_.entry_ladder;
        const double reference = candles_.front().open;

        entry_ladder_.step([&](size_t k) {
            if (phase_ != Phase::AWAITING_ENTRY && phase_ != Phase::IN_POSITION) {
                return false;
            }
            const auto& leg = ladder.legs[k];
            double fill = 0.0;
            if (!ladderLegTriggered(leg, reference, true, point, signals.entry_ladder[k], fill)) {
                return false;
            }
            addLadderFill(index, leg, k, fill);
            return true;
        });
    }

    void addLadderFill(size_t index, const LadderLeg& leg, size_t leg_index, double price) {
        const double size = leg.size_percent;
        const Timestamp ts = candles_[index].timestamp;

        if (phase_ == Phase::AWAITING_ENTRY) {
            if (size > 0.0) {
                traded_ = true;
                phase_ = Phase::IN_POSITION;
                startPosition(index, price);
                remaining_ = size;
                first_entry_ts_ = ts;
            }
        } else {
            const double total = remaining_ + size;
            if (total > 0.0) {
                entry_price_ = (entry_price_ * remaining_ + price * size) / total;
                entry_fill_ = (entry_fill_ * remaining_ + cost_.entryFill(price) * size) / total;
                remaining_ = total;
                const double base_stop = initialStopLevel(entry_price_);
                stop_level_ = trailing_active_ ? std::max(stop_level_, base_stop) : base_stop;
            }
        }

        position_size_ = remaining_;
        initial_position_size_ = remaining_;
        if (traded_) {
            first_entry_price_ = entry_price_;
        }

        emit(SimulationEventType::LADDER_ENTRY, ts, price,
             fmt::format("Ladder entry {}: bought {:.0f}% at {:.8f}",
                         strategy::ladderLegId(leg, leg_index), size * 100.0, price));
    }

    void openPosition(SimulationEventType type, size_t index, double price, const std::string& description) {
        traded_ = true;
        phase_ = Phase::IN_POSITION;
        remaining_ = 1.0;
        position_size_ = 1.0;
        initial_position_size_ = 1.0;
        startPosition(index, price);
        first_entry_price_ = price;
        first_entry_ts_ = candles_[index].timestamp;
        emit(type, candles_[index].timestamp, price, description);
    }

    // Fresh stop, targets and exit-ladder state relative to a new entry price.
    void startPosition(size_t index, double price) {
        entry_price_ = price;
        entry_fill_ = cost_.entryFill(price);
        opened_at_ = candles_[index].timestamp;
        stop_level_ = initialStopLevel(price);
        trailing_active_ = false;
        peak_ = price;
        next_target_ = 0;
        exit_ladder_.reset(hasLadder(extensions_.exit_ladder) ? &*extensions_.exit_ladder : nullptr);
    }

    double initialStopLevel(double entry_price) const {
        double level = entry_price * (1.0 + stop_loss_.initial);
        if (extensions_.min_exit_price.isEnabled()) {
            level = std::max(level, entry_price * extensions_.min_exit_price.value());
        }
        return level;
    }

    // ---- In position ----

    // Stop first: a point through the live stop closes the position before any deeper leg buys.
    void managePosition(size_t index, const PathPoint& point, const CandleSignals& signals) {
        if (checkStop(index, point)) {
            return;
        }
        if (policy_ == EntryPolicy::ENTRY_LADDER) {
            tryEntryLadder(index, point, signals);
        }
        updateTrailingStop(index, point);
        if (hasLadder(extensions_.exit_ladder)) {
            checkExitLadder(index, point, signals);
        } else {
            checkTargets(index, point);
        }
    }

    bool checkStop(size_t index, const PathPoint& point) {
        if (!(point.price <= stop_level_)) {
            return false;
        }
        const double price = fillPrice(stop_level_, point);
        closeRemaining(SimulationEventType::STOP_LOSS, index, price,
                       fmt::format("STOP LOSS triggered at {:.8f} ({:.1f}%)",
                                   price, (price / entry_price_ - 1.0) * 100.0));
        afterFullExit(ReEntryMode::AFTER_STOP, price);
        return true;
    }

    void updateTrailingStop(size_t index, const PathPoint& point) {
        if (!stop_loss_.trailing.isEnabled()) {
            return;
        }
        const bool follow_peak = stop_loss_.trailing_percent.isEnabled();
        const double trail = stop_loss_.trailing_percent.valueOr(0.0);
        double candidate = stop_level_;
        std::string description;

        if (!trailing_active_) {
            const double activation = entry_price_ * (1.0 + stop_loss_.trailing.value());
            if (!(point.price >= activation)) {
                return;
            }
            trailing_active_ = true;
            peak_ = point.price;
            candidate = std::max(stop_level_, entry_price_);
            if (follow_peak) {
                candidate = std::max(candidate, peak_ * (1.0 - trail));
            }
            description = fmt::format("Trailing stop activated at {:.8f} ({:.0f}% gain hit), stop now {:.8f}",
                                      point.price, stop_loss_.trailing.value() * 100.0, candidate);
        } else {
            if (!follow_peak || !(point.price > peak_)) {
                return;
            }
            peak_ = point.price;
            candidate = peak_ * (1.0 - trail);
            description = fmt::format("Trailing stop raised to {:.8f} (peak {:.8f})", candidate, peak_);
        }

        if (candidate > stop_level_) {
            stop_level_ = candidate;
            emit(SimulationEventType::STOP_MOVED, candles_[index].timestamp, point.price, description);
        }
    }

    void checkTargets(size_t index, const PathPoint& point) {
        const Timestamp ts = candles_[index].timestamp;
        while (phase_ == Phase::IN_POSITION && next_target_ < legs_.size()) {
            const auto& leg = legs_[next_target_];
            const double level = entry_price_ * leg.target;
            if (!(point.price >= level)) {
                break;
            }
            const double price = fillPrice(level, point);
            realize(std::min(leg.percent * position_size_, remaining_), price, ts);
            ++next_target_;
            emit(SimulationEventType::TARGET_HIT, ts, price,
                 fmt::format("Target {}x hit! Sold {:.0f}% at {:.8f}", leg.target, leg.percent * 100.0, price));
            if (remaining_ <= 0.0) {
                afterFullExit(ReEntryMode::AFTER_EXHAUSTED, price);
            }
        }
    }

    void checkExitLadder(size_t index, const PathPoint& point, const CandleSignals& signals) {
        const auto& ladder = *extensions_.exit_ladder;
        const Timestamp ts = candles_[index].timestamp;

        exit_ladder_.step([&](size_t k) {
            if (phase_ != Phase::IN_POSITION) {
                return false;
            }
            const auto& leg = ladder.legs[k];
            double price = 0.0;
            if (!ladderLegTriggered(leg, entry_price_, false, point, signals.exit_ladder[k], price)) {
                return false;
            }
            realize(std::min(leg.size_percent * position_size_, remaining_), price, ts);
            emit(SimulationEventType::LADDER_EXIT, ts, price,
                 fmt::format("Ladder exit {}: sold {:.0f}% at {:.8f}",
                             strategy::ladderLegId(leg, k), leg.size_percent * 100.0, price));
            if (remaining_ <= 0.0) {
                afterFullExit(ReEntryMode::AFTER_EXHAUSTED, price);
            }
            return true;
        });
    }

    void realize(double fraction, double price, Timestamp ts) {
        if (!(fraction > 0.0)) {
            return;
        }
        pnl_ += fraction * cost_.exitFill(price) / entry_fill_ - cost_.borrowCost(fraction, opened_at_, ts);
        remaining_ -= fraction;
        // Exit sizes and target levels are fixed from here on, so no more averaging in.
        entry_ladder_open_ = false;
        if (remaining_ < POSITION_EPSILON) {
            remaining_ = 0.0;
        }
    }

    void closeRemaining(SimulationEventType type, size_t index, double price, const std::string& description) {
        const Timestamp ts = candles_[index].timestamp;
        realize(remaining_, price, ts);
        remaining_ = 0.0;
        emit(type, ts, price, description);
    }

    void afterFullExit(ReEntryMode mode, double exit_price) {
        if (re_entry_.trailing_re_entry.isEnabled() && re_entry_count_ < re_entry_.max_re_entries) {
            phase_ = Phase::RE_ENTRY_WAIT;
            re_entry_mode_ = mode;
            re_entry_reference_ = exit_price;
        } else {
            phase_ = Phase::TERMINATED;
        }
    }

    // ---- Re-entry ----

    void tryReEntry(size_t index, const PathPoint& point) {
        const double retrace = re_entry_.trailing_re_entry.value();

        if (re_entry_mode_ == ReEntryMode::AFTER_STOP) {
            const double level = re_entry_reference_ * (1.0 + retrace);
            if (point.price >= level) {
                const double price = fillPrice(level, point);
                reEnter(index, price, fmt::format("Re-entry at {:.8f} ({:.1f}% rebound from low {:.8f})",
                                                  price, retrace * 100.0, re_entry_reference_));
            } else if (point.price < re_entry_reference_) {
                re_entry_reference_ = point.price;
            }
            return;
        }

        const double level = re_entry_reference_ * (1.0 - retrace);
        if (point.price <= level) {
            const double price = fillPrice(level, point);
            reEnter(index, price, fmt::format("Re-entry at {:.8f} ({:.1f}% pullback from high {:.8f})",
                                              price, retrace * 100.0, re_entry_reference_));
        } else if (point.price > re_entry_reference_) {
            re_entry_reference_ = point.price;
        }
    }

    void reEnter(size_t index, double price, const std::string& description) {
        ++re_entry_count_;
        const double size = re_entry_.size_percent * initial_position_size_;
        remaining_ = size;
        position_size_ = size;
        startPosition(index, price);
        phase_ = Phase::IN_POSITION;
        emit(SimulationEventType::RE_ENTRY, candles_[index].timestamp, price, description);
    }

    // ---- Candle close ----

    void processClose(size_t index, const CandleSignals& signals) {
        const Candle& candle = candles_[index];

        if (phase_ == Phase::IN_POSITION) {
            if (extensions_.exit_signal && signals.exit) {
                closeRemaining(SimulationEventType::FINAL_EXIT, index, candle.close,
                               fmt::format("Signal-based exit at {:.8f}", candle.close));
                phase_ = Phase::TERMINATED;
                return;
            }
            if (extensions_.hold_hours.isEnabled()) {
                const double hours = extensions_.hold_hours.value();
                const double elapsed = static_cast<double>(candle.timestamp - opened_at_);
                if (elapsed >= hours * 3600.0) {
                    closeRemaining(SimulationEventType::FINAL_EXIT, index, candle.close,
                                   fmt::format("Hold time of {}h exceeded, exit at {:.8f}", hours, candle.close));
                    phase_ = Phase::TERMINATED;
                }
            }
            return;
        }

        if (phase_ != Phase::AWAITING_ENTRY) {
            return;
        }

        if (policy_ == EntryPolicy::ENTRY_SIGNAL && signals.entry) {
            openPosition(SimulationEventType::ENTRY, index, candle.close,
                         fmt::format("Entry signal triggered at {:.8f}", candle.close));
            return;
        }

        if (policy_ != EntryPolicy::IMMEDIATE && index >= static_cast<size_t>(std::max(entry_.max_wait_time, 0))) {
            declineTrade(noTradeReason(true));
        }
    }

    void finish() {
        if (phase_ == Phase::IN_POSITION) {
            const size_t last = candles_.size() - 1;
            closeRemaining(SimulationEventType::FINAL_EXIT, last, candles_[last].close,
                           fmt::format("Final exit at {:.8f} (end of data)", candles_[last].close));
        } else if (phase_ == Phase::AWAITING_ENTRY) {
            declineTrade(noTradeReason(false));
        }
        phase_ = Phase::TERMINATED;
    }

    std::string noTradeReason(bool timed_out) const {
        const std::string window = timed_out
            ? fmt::format("within {} candles", entry_.max_wait_time)
            : std::string("before the data ended");

        switch (policy_) {
            case EntryPolicy::INITIAL_DROP:
                return fmt::format("price did not drop {:.0f}% from first open {}",
                                   std::abs(entry_.initial_entry.value()) * 100.0, window);
            case EntryPolicy::TRAILING_ENTRY:
                return fmt::format("no {:.1f}% rebound from the running low {}",
                                   entry_.trailing_entry.value() * 100.0, window);
            case EntryPolicy::ENTRY_SIGNAL:
                return "entry signal not satisfied " + window;
            case EntryPolicy::ENTRY_LADDER:
                return "no entry ladder leg filled " + window;
            case EntryPolicy::IMMEDIATE:
                break;
        }
        return "entry condition not met " + window;
    }

    void declineTrade(const std::string& reason) {
        phase_ = Phase::TERMINATED;
        remaining_ = 0.0;
        emit(SimulationEventType::ENTRY, candles_.front().timestamp, candles_.front().open, "No trade: " + reason);
    }

    void emit(SimulationEventType type, Timestamp ts, double price, const std::string& description) {
        SimulationEvent event;
        event.type = type;
        event.timestamp = ts;
        event.price = price;
        event.description = description;
        event.remaining_position = remaining_;
        event.pnl_so_far = pnl_;
        events_.push_back(std::move(event));
    }

    SimulationResult buildResult() {
        SimulationResult result;
        result.total_candles = candles_.size();
        result.final_price = candles_.back().close;

        // Lowest price of the whole series, seeded with the first open
        auto& opt = result.entry_optimization;
        opt.lowest_price = candles_.front().open;
        opt.lowest_price_timestamp = candles_.front().timestamp;
        for (const auto& candle : candles_) {
            if (candle.low < opt.lowest_price) {
                opt.lowest_price = candle.low;
                opt.lowest_price_timestamp = candle.timestamp;
            }
        }
        opt.trailing_entry_used = trailing_entry_used_;

        if (traded_) {
            result.final_pnl = pnl_;
            if (extensions_.loss_clamp_percent.isEnabled()) {
                result.final_pnl = std::max(pnl_, 1.0 - extensions_.loss_clamp_percent.value());
            }
            result.entry_price = first_entry_price_;
            opt.actual_entry_price = first_entry_price_;
            opt.entry_delay = static_cast<double>(first_entry_ts_ - candles_.front().timestamp) / 60.0;
            opt.lowest_price_percent = (opt.lowest_price / first_entry_price_ - 1.0) * 100.0;
            opt.lowest_price_time_from_entry =
                static_cast<double>(opt.lowest_price_timestamp - first_entry_ts_) / 60.0;
        } else {
            result.final_pnl = 0.0;
            result.entry_price = candles_.front().open;
        }

        result.events = std::move(events_);
        return result;
    }

    const CandleSeries& candles_;
    std::vector<StrategyLeg> legs_;
    const StopLossConfig& stop_loss_;
    const EntryConfig& entry_;
    const ReEntryConfig& re_entry_;
    const SimulationExtensions& extensions_;
    CostModel cost_;
    analytics::IndicatorSeries indicators_;
    signal::SignalEvaluator evaluator_;

    EntryPolicy policy_ = EntryPolicy::IMMEDIATE;
    Phase phase_ = Phase::AWAITING_ENTRY;
    std::vector<SimulationEvent> events_;

    // Position accounting, in units of a full initial position
    double pnl_ = 0.0;
    double remaining_ = 0.0;
    double position_size_ = 0.0;
    double initial_position_size_ = 1.0;
    double entry_price_ = 0.0;
    double entry_fill_ = 0.0;
    Timestamp opened_at_ = 0;

    double stop_level_ = 0.0;
    bool trailing_active_ = false;
    double peak_ = 0.0;
    size_t next_target_ = 0;
    LadderProgress entry_ladder_;
    LadderProgress exit_ladder_;
    bool entry_ladder_open_ = true;

    int re_entry_count_ = 0;
    ReEntryMode re_entry_mode_ = ReEntryMode::AFTER_STOP;
    double re_entry_reference_ = 0.0;

    bool traded_ = false;
    bool trailing_entry_used_ = false;
    double running_low_ = 0.0;
    double first_entry_price_ = 0.0;
    Timestamp first_entry_ts_ = 0;
};

} // namespace

SimulationResult SimulationEngine::simulate(const CandleSeries& candles,
                                            const std::vector<StrategyLeg>& legs,
                                            const StopLossConfig& stop_loss,
                                            const EntryConfig& entry,
                                            const ReEntryConfig& re_entry,
                                            const CostConfig& costs,
                                            const SimulationExtensions& extensions) {
    SimulationRun run(candles, legs, stop_loss, entry, re_entry, costs, extensions);
    SimulationResult result = run.run();

    LOG_DEBUG("[Simulation] {} candles, {} events, finalPnl {:.6f}",
              result.total_candles, result.events.size(), result.final_pnl);
    return result;
}

SimulationResult SimulationEngine::simulate(const CandleSeries& candles, const strategy::StrategyConfig& config) {
    return simulate(candles, config.legs, config.stop_loss, config.entry, config.re_entry,
                    config.costs, config.extensions);
}

} // namespace backtest
} // namespace candlesim
