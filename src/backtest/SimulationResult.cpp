#include "backtest/SimulationResult.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace candlesim {
namespace backtest {

namespace {
// JSON has no NaN; encode it as null and read null back as NaN.
nlohmann::json number(double v) {
    if (std::isnan(v)) return nullptr;
    return v;
}

double readNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return j.at(key).get<double>();
}
}

std::string toString(SimulationEventType type) {
    switch (type) {
        case SimulationEventType::ENTRY: return "entry";
        case SimulationEventType::TRAILING_ENTRY_TRIGGERED: return "trailing_entry_triggered";
        case SimulationEventType::LADDER_ENTRY: return "ladder_entry";
        case SimulationEventType::STOP_MOVED: return "stop_moved";
        case SimulationEventType::TARGET_HIT: return "target_hit";
        case SimulationEventType::LADDER_EXIT: return "ladder_exit";
        case SimulationEventType::RE_ENTRY: return "re_entry";
        case SimulationEventType::STOP_LOSS: return "stop_loss";
        case SimulationEventType::FINAL_EXIT: return "final_exit";
    }
    return "entry";
}

std::optional<SimulationEventType> eventTypeFromString(const std::string& value) {
    if (value == "entry") return SimulationEventType::ENTRY;
    if (value == "trailing_entry_triggered") return SimulationEventType::TRAILING_ENTRY_TRIGGERED;
    if (value == "ladder_entry") return SimulationEventType::LADDER_ENTRY;
    if (value == "stop_moved") return SimulationEventType::STOP_MOVED;
    if (value == "target_hit") return SimulationEventType::TARGET_HIT;
    if (value == "ladder_exit") return SimulationEventType::LADDER_EXIT;
    if (value == "re_entry") return SimulationEventType::RE_ENTRY;
    if (value == "stop_loss") return SimulationEventType::STOP_LOSS;
    if (value == "final_exit") return SimulationEventType::FINAL_EXIT;
    return std::nullopt;
}

size_t SimulationResult::countEvents(SimulationEventType type) const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [type](const SimulationEvent& e) { return e.type == type; }));
}

nlohmann::json toJson(const SimulationEvent& event) {
    nlohmann::json j;
    j["type"] = toString(event.type);
    j["timestamp"] = event.timestamp;
    j["price"] = number(event.price);
    j["description"] = event.description;
    j["remainingPosition"] = number(event.remaining_position);
    j["pnlSoFar"] = number(event.pnl_so_far);
    return j;
}

nlohmann::json toJson(const EntryOptimization& optimization) {
    nlohmann::json j;
    j["lowestPrice"] = number(optimization.lowest_price);
    j["lowestPriceTimestamp"] = optimization.lowest_price_timestamp;
    j["lowestPricePercent"] = number(optimization.lowest_price_percent);
    j["lowestPriceTimeFromEntry"] = number(optimization.lowest_price_time_from_entry);
    j["trailingEntryUsed"] = optimization.trailing_entry_used;
    j["actualEntryPrice"] = number(optimization.actual_entry_price);
    j["entryDelay"] = number(optimization.entry_delay);
    return j;
}

nlohmann::json toJson(const SimulationResult& result) {
    nlohmann::json j;
    j["finalPnl"] = number(result.final_pnl);
    j["entryPrice"] = number(result.entry_price);
    j["finalPrice"] = number(result.final_price);
    j["totalCandles"] = result.total_candles;
    j["events"] = nlohmann::json::array();
    for (const auto& event : result.events) {
        j["events"].push_back(toJson(event));
    }
    j["entryOptimization"] = toJson(result.entry_optimization);
    return j;
}

SimulationResult resultFromJson(const nlohmann::json& j) {
    SimulationResult result;
    result.final_pnl = readNumber(j, "finalPnl");
    result.entry_price = readNumber(j, "entryPrice");
    result.final_price = readNumber(j, "finalPrice");
    result.total_candles = j.value("totalCandles", static_cast<size_t>(0));

    if (j.contains("events") && j["events"].is_array()) {
        for (const auto& row : j["events"]) {
            SimulationEvent event;
            event.type = eventTypeFromString(row.value("type", std::string("entry")))
                             .value_or(SimulationEventType::ENTRY);
            event.timestamp = row.value("timestamp", 0LL);
            event.price = readNumber(row, "price");
            event.description = row.value("description", std::string());
            event.remaining_position = readNumber(row, "remainingPosition");
            event.pnl_so_far = readNumber(row, "pnlSoFar");
            result.events.push_back(std::move(event));
        }
    }

    if (j.contains("entryOptimization") && j["entryOptimization"].is_object()) {
        const auto& o = j["entryOptimization"];
        auto& opt = result.entry_optimization;
        opt.lowest_price = readNumber(o, "lowestPrice");
        opt.lowest_price_timestamp = o.value("lowestPriceTimestamp", 0LL);
        opt.lowest_price_percent = readNumber(o, "lowestPricePercent");
        opt.lowest_price_time_from_entry = readNumber(o, "lowestPriceTimeFromEntry");
        opt.trailing_entry_used = o.value("trailingEntryUsed", false);
        opt.actual_entry_price = readNumber(o, "actualEntryPrice");
        opt.entry_delay = readNumber(o, "entryDelay");
    }
    return result;
}

} // namespace backtest
} // namespace candlesim
