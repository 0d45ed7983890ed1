#include "strategy/StrategyConfigJson.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace candlesim {
namespace strategy {

namespace {
bool isNone(const nlohmann::json& v) {
    if (v.is_null()) return true;
    if (!v.is_string()) return false;
    std::string s = v.get<std::string>();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s == "none";
}

const nlohmann::json& requireObject(const nlohmann::json& j, const std::string& what) {
    if (!j.is_object()) {
        throw std::invalid_argument(what + " must be a JSON object");
    }
    return j;
}

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}
}

StrategyConfig StrategyConfigJson::fromJson(const nlohmann::json& j) {
    requireObject(j, "Strategy document");

    StrategyConfig config;
    try {
        config.name = j.value("name", std::string());

        // "strategy" is the older name of the leg list
        const nlohmann::json* legs = nullptr;
        if (j.contains("legs")) {
            legs = &j.at("legs");
            if (!legs->is_array()) {
                throw std::invalid_argument("legs must be an array");
            }
        } else if (j.contains("strategy") && j.at("strategy").is_array()) {
            legs = &j.at("strategy");
        }
        if (legs) {
            for (const auto& row : *legs) {
                StrategyLeg leg;
                leg.target = row.value("target", 1.0);
                leg.percent = row.value("percent", 0.0);
                config.legs.push_back(leg);
            }
        }

        if (j.contains("stopLoss")) config.stop_loss = stopLossFromJson(j.at("stopLoss"));
        if (j.contains("entry")) config.entry = entryFromJson(j.at("entry"));
        if (j.contains("reEntry")) config.re_entry = reEntryFromJson(j.at("reEntry"));
        if (j.contains("costs")) config.costs = costsFromJson(j.at("costs"));

        auto& ext = config.extensions;
        if (j.contains("entrySignal") && !j.at("entrySignal").is_null()) {
            ext.entry_signal = signalGroupFromJson(j.at("entrySignal"));
        }
        if (j.contains("exitSignal") && !j.at("exitSignal").is_null()) {
            ext.exit_signal = signalGroupFromJson(j.at("exitSignal"));
        }
        if (j.contains("entryLadder") && !j.at("entryLadder").is_null()) {
            ext.entry_ladder = ladderFromJson(j.at("entryLadder"));
        }
        if (j.contains("exitLadder") && !j.at("exitLadder").is_null()) {
            ext.exit_ladder = ladderFromJson(j.at("exitLadder"));
        }
        ext.hold_hours = toggleFromJson(j, "holdHours", Toggle::disabled());
        ext.loss_clamp_percent = toggleFromJson(j, "lossClampPercent", Toggle::disabled());
        ext.min_exit_price = toggleFromJson(j, "minExitPrice", Toggle::disabled());
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid strategy document: ") + e.what());
    }
    return config;
}

nlohmann::json StrategyConfigJson::toJson(const StrategyConfig& config) {
    nlohmann::json j;
    j["name"] = config.name;
    j["legs"] = nlohmann::json::array();
    for (const auto& leg : config.legs) {
        j["legs"].push_back({{"target", leg.target}, {"percent", leg.percent}});
    }
    j["stopLoss"] = toJson(config.stop_loss);
    j["entry"] = toJson(config.entry);
    j["reEntry"] = toJson(config.re_entry);
    j["costs"] = toJson(config.costs);

    const auto& ext = config.extensions;
    if (ext.entry_signal) j["entrySignal"] = toJson(*ext.entry_signal);
    if (ext.exit_signal) j["exitSignal"] = toJson(*ext.exit_signal);
    if (ext.entry_ladder) j["entryLadder"] = toJson(*ext.entry_ladder);
    if (ext.exit_ladder) j["exitLadder"] = toJson(*ext.exit_ladder);
    j["holdHours"] = toggleToJson(ext.hold_hours);
    j["lossClampPercent"] = toggleToJson(ext.loss_clamp_percent);
    j["minExitPrice"] = toggleToJson(ext.min_exit_price);
    return j;
}

StrategyConfig StrategyConfigJson::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open strategy file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Cannot parse strategy file " + path + ": " + e.what());
    }
    return fromJson(j);
}

StopLossConfig StrategyConfigJson::stopLossFromJson(const nlohmann::json& j, const StopLossConfig& fallback) {
    requireObject(j, "stopLoss");
    StopLossConfig out = fallback;
    out.initial = j.value("initial", fallback.initial);
    // a stop-loss object without "trailing" means no trailing stop
    out.trailing = toggleFromJson(j, "trailing", Toggle::disabled());
    out.trailing_percent = toggleFromJson(j, "trailingPercent", Toggle::disabled());
    return out;
}

EntryConfig StrategyConfigJson::entryFromJson(const nlohmann::json& j, const EntryConfig& fallback) {
    requireObject(j, "entry");
    EntryConfig out = fallback;
    out.initial_entry = toggleFromJson(j, "initialEntry", Toggle::disabled());
    out.trailing_entry = toggleFromJson(j, "trailingEntry", Toggle::disabled());
    out.max_wait_time = j.value("maxWaitTime", fallback.max_wait_time);
    return out;
}

ReEntryConfig StrategyConfigJson::reEntryFromJson(const nlohmann::json& j, const ReEntryConfig& fallback) {
    requireObject(j, "reEntry");
    ReEntryConfig out = fallback;
    out.trailing_re_entry = toggleFromJson(j, "trailingReEntry", Toggle::disabled());
    out.max_re_entries = j.value("maxReEntries", fallback.max_re_entries);
    out.size_percent = j.value("sizePercent", fallback.size_percent);
    return out;
}

CostConfig StrategyConfigJson::costsFromJson(const nlohmann::json& j, const CostConfig& fallback) {
    requireObject(j, "costs");
    CostConfig out;
    out.entry_slippage_bps = j.value("entrySlippageBps", fallback.entry_slippage_bps);
    out.exit_slippage_bps = j.value("exitSlippageBps", fallback.exit_slippage_bps);
    out.taker_fee_bps = j.value("takerFeeBps", fallback.taker_fee_bps);
    out.borrow_apr_bps = j.value("borrowAprBps", fallback.borrow_apr_bps);
    return out;
}

SignalGroup StrategyConfigJson::signalGroupFromJson(const nlohmann::json& j) {
    requireObject(j, "Signal group");

    SignalGroup group;
    const std::string logic = j.value("logic", std::string("AND"));
    const auto parsed = logicFromString(logic);
    if (!parsed) {
        throw std::invalid_argument("Unknown signal logic: " + logic);
    }
    group.logic = *parsed;

    if (j.contains("conditions")) {
        for (const auto& row : j.at("conditions")) {
            group.conditions.push_back(conditionFromJson(row));
        }
    }
    if (j.contains("groups")) {
        for (const auto& row : j.at("groups")) {
            group.groups.push_back(signalGroupFromJson(row));
        }
    }
    return group;
}

SignalCondition StrategyConfigJson::conditionFromJson(const nlohmann::json& j) {
    requireObject(j, "Signal condition");

    SignalCondition condition;
    condition.id = j.value("id", std::string());

    const std::string indicator = j.value("indicator", std::string());
    const auto parsed_indicator = indicatorFromString(indicator);
    if (!parsed_indicator) {
        throw std::invalid_argument("Unknown indicator: '" + indicator + "'");
    }
    condition.indicator = *parsed_indicator;
    condition.field = j.value("field", std::string("value"));

    const std::string op = j.value("operator", std::string());
    const auto parsed_op = operatorFromString(op);
    if (!parsed_op) {
        throw std::invalid_argument("Unknown operator: '" + op + "'");
    }
    condition.op = *parsed_op;

    condition.value = optionalNumber(j, "value");
    if (j.contains("secondaryIndicator") && !j.at("secondaryIndicator").is_null()) {
        const std::string secondary = j.at("secondaryIndicator").get<std::string>();
        const auto parsed_secondary = indicatorFromString(secondary);
        if (!parsed_secondary) {
            throw std::invalid_argument("Unknown secondary indicator: '" + secondary + "'");
        }
        condition.secondary_indicator = *parsed_secondary;
    }
    condition.secondary_field = j.value("secondaryField", std::string("value"));
    return condition;
}

LadderConfig StrategyConfigJson::ladderFromJson(const nlohmann::json& j) {
    requireObject(j, "Ladder");

    LadderConfig ladder;
    ladder.sequential = j.value("sequential", true);
    if (j.contains("legs")) {
        for (const auto& row : j.at("legs")) {
            requireObject(row, "Ladder leg");
            LadderLeg leg;
            leg.size_percent = row.value("sizePercent", 0.0);
            leg.id = row.value("id", std::string());
            leg.price_offset = optionalNumber(row, "priceOffset");
            leg.multiple = optionalNumber(row, "multiple");
            if (row.contains("signal") && !row.at("signal").is_null()) {
                leg.signal = signalGroupFromJson(row.at("signal"));
            }
            ladder.legs.push_back(std::move(leg));
        }
    }
    return ladder;
}

nlohmann::json StrategyConfigJson::toJson(const StopLossConfig& stop_loss) {
    return {
        {"initial", stop_loss.initial},
        {"trailing", toggleToJson(stop_loss.trailing)},
        {"trailingPercent", toggleToJson(stop_loss.trailing_percent)}
    };
}

nlohmann::json StrategyConfigJson::toJson(const EntryConfig& entry) {
    return {
        {"initialEntry", toggleToJson(entry.initial_entry)},
        {"trailingEntry", toggleToJson(entry.trailing_entry)},
        {"maxWaitTime", entry.max_wait_time}
    };
}

nlohmann::json StrategyConfigJson::toJson(const ReEntryConfig& re_entry) {
    return {
        {"trailingReEntry", toggleToJson(re_entry.trailing_re_entry)},
        {"maxReEntries", re_entry.max_re_entries},
        {"sizePercent", re_entry.size_percent}
    };
}

nlohmann::json StrategyConfigJson::toJson(const CostConfig& costs) {
    return {
        {"entrySlippageBps", costs.entry_slippage_bps},
        {"exitSlippageBps", costs.exit_slippage_bps},
        {"takerFeeBps", costs.taker_fee_bps},
        {"borrowAprBps", costs.borrow_apr_bps}
    };
}

nlohmann::json StrategyConfigJson::toJson(const SignalGroup& group) {
    nlohmann::json j;
    j["logic"] = toString(group.logic);
    j["conditions"] = nlohmann::json::array();
    for (const auto& c : group.conditions) {
        nlohmann::json row;
        if (!c.id.empty()) row["id"] = c.id;
        row["indicator"] = toString(c.indicator);
        row["field"] = c.field;
        row["operator"] = toString(c.op);
        if (c.value) row["value"] = *c.value;
        if (c.secondary_indicator) {
            row["secondaryIndicator"] = toString(*c.secondary_indicator);
            row["secondaryField"] = c.secondary_field;
        }
        j["conditions"].push_back(row);
    }
    j["groups"] = nlohmann::json::array();
    for (const auto& child : group.groups) {
        j["groups"].push_back(toJson(child));
    }
    return j;
}

nlohmann::json StrategyConfigJson::toJson(const LadderConfig& ladder) {
    nlohmann::json j;
    j["sequential"] = ladder.sequential;
    j["legs"] = nlohmann::json::array();
    for (const auto& leg : ladder.legs) {
        nlohmann::json row;
        row["sizePercent"] = leg.size_percent;
        if (!leg.id.empty()) row["id"] = leg.id;
        if (leg.price_offset) row["priceOffset"] = *leg.price_offset;
        if (leg.multiple) row["multiple"] = *leg.multiple;
        if (leg.signal) row["signal"] = toJson(*leg.signal);
        j["legs"].push_back(row);
    }
    return j;
}

Toggle StrategyConfigJson::toggleFromJson(const nlohmann::json& j, const char* key, const Toggle& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j.at(key);
    if (isNone(v)) {
        return Toggle::disabled();
    }
    if (!v.is_number()) {
        throw std::invalid_argument(std::string(key) + " must be a number or \"none\"");
    }
    return Toggle::enabled(v.get<double>());
}

nlohmann::json StrategyConfigJson::toggleToJson(const Toggle& toggle) {
    if (!toggle.isEnabled()) {
        return "none";
    }
    return toggle.value();
}

} // namespace strategy
} // namespace candlesim
