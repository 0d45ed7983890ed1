#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace candlesim {
namespace backtest {

enum class SimulationEventType {
    ENTRY,
    TRAILING_ENTRY_TRIGGERED,
    LADDER_ENTRY,
    STOP_MOVED,
    TARGET_HIT,
    LADDER_EXIT,
    RE_ENTRY,
    STOP_LOSS,
    FINAL_EXIT
};

std::string toString(SimulationEventType type);
std::optional<SimulationEventType> eventTypeFromString(const std::string& value);

struct SimulationEvent {
    SimulationEventType type = SimulationEventType::ENTRY;
    Timestamp timestamp = 0;
    double price = 0.0;
    std::string description;
    double remaining_position = 0.0;  // fraction of a full position still open
    double pnl_so_far = 0.0;
};

// Diagnostics about the lowest price of the series relative to the chosen entry.
struct EntryOptimization {
    double lowest_price = 0.0;
    Timestamp lowest_price_timestamp = 0;
    double lowest_price_percent = 0.0;          // vs actual entry price, in percent
    double lowest_price_time_from_entry = 0.0;  // minutes, negative when the low came first
    bool trailing_entry_used = false;
    double actual_entry_price = 0.0;
    double entry_delay = 0.0;                   // minutes from the first candle to entry
};

struct SimulationResult {
    double final_pnl = 0.0;  // return multiple, 1.0 = break-even, 0 = no trade
    std::vector<SimulationEvent> events;
    double entry_price = 0.0;
    double final_price = 0.0;
    size_t total_candles = 0;
    EntryOptimization entry_optimization;

    size_t countEvents(SimulationEventType type) const;
};

nlohmann::json toJson(const SimulationEvent& event);
nlohmann::json toJson(const EntryOptimization& optimization);
nlohmann::json toJson(const SimulationResult& result);
SimulationResult resultFromJson(const nlohmann::json& j);

} // namespace backtest
} // namespace candlesim
