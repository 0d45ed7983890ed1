#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace strategy {

// JSON strategy documents <-> StrategyConfig.
// Disableable fields accept a number or "none"; missing ones keep the fallback.
// Structurally unusable documents throw std::invalid_argument.
class StrategyConfigJson {
public:
    static StrategyConfig fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const StrategyConfig& config);

    // Reads and decodes a strategy file; std::runtime_error when it can't be read or parsed
    static StrategyConfig loadFile(const std::string& path);

    static StopLossConfig stopLossFromJson(const nlohmann::json& j, const StopLossConfig& fallback = {});
    static EntryConfig entryFromJson(const nlohmann::json& j, const EntryConfig& fallback = {});
    static ReEntryConfig reEntryFromJson(const nlohmann::json& j, const ReEntryConfig& fallback = {});
    static CostConfig costsFromJson(const nlohmann::json& j, const CostConfig& fallback = {});
    static SignalGroup signalGroupFromJson(const nlohmann::json& j);
    static LadderConfig ladderFromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const StopLossConfig& stop_loss);
    static nlohmann::json toJson(const EntryConfig& entry);
    static nlohmann::json toJson(const ReEntryConfig& re_entry);
    static nlohmann::json toJson(const CostConfig& costs);
    static nlohmann::json toJson(const SignalGroup& group);
    static nlohmann::json toJson(const LadderConfig& ladder);

private:
    static Toggle toggleFromJson(const nlohmann::json& j, const char* key, const Toggle& fallback);
    static nlohmann::json toggleToJson(const Toggle& toggle);
    static SignalCondition conditionFromJson(const nlohmann::json& j);
};

} // namespace strategy
} // namespace candlesim
