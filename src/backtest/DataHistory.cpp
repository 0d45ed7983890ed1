#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include "common/Logger.h"

namespace candlesim {
namespace backtest {

namespace {
constexpr long long MILLISECOND_THRESHOLD = 100000000000LL;  // year 5138 in seconds

double parsePriceCell(const std::string& cell) {
    if (cell.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    char* end = nullptr;
    const double v = std::strtod(cell.c_str(), &end);
    if (end != cell.c_str() + cell.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return v;
}

double jsonNumber(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parsePriceCell(v.get<std::string>());
    return std::numeric_limits<double>::quiet_NaN();
}

const nlohmann::json* findKey(const nlohmann::json& item, const char* longKey, const char* shortKey) {
    if (item.contains(longKey)) return &item[longKey];
    if (item.contains(shortKey)) return &item[shortKey];
    return nullptr;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    size_t malformed = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = normalizeTimestamp(std::stoll(row[0]));
            candle.open = parsePriceCell(row[1]);
            candle.high = parsePriceCell(row[2]);
            candle.low = parsePriceCell(row[3]);
            candle.close = parsePriceCell(row[4]);
            candle.volume = parsePriceCell(row[5]);
            if (std::isnan(candle.open) || std::isnan(candle.high) || std::isnan(candle.low) ||
                std::isnan(candle.close) || std::isnan(candle.volume)) {
                ++malformed;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    if (malformed > 0) {
        LOG_WARN("{} candles in {} have non-numeric cells (kept as NaN)", malformed, file_path);
    }
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return candles;
    }
    if (j.is_object() && j.contains("candles")) {
        j = j["candles"];
    }
    if (!j.is_array()) {
        LOG_ERROR("JSON candle file must hold an array: {}", file_path);
        return candles;
    }

    // Same policy as the CSV path: file order is kept, a bad row is skipped alone.
    for (const auto& item : j) {
        try {
            Candle candle;
            if (item.is_array()) {
                if (item.size() < 6) {
                    LOG_WARN("Skipping short candle row in {}: {}", file_path, item.dump());
                    continue;
                }
                candle.timestamp = normalizeTimestamp(item[0].get<long long>());
                candle.open = jsonNumber(item[1]);
                candle.high = jsonNumber(item[2]);
                candle.low = jsonNumber(item[3]);
                candle.close = jsonNumber(item[4]);
                candle.volume = jsonNumber(item[5]);
                candles.push_back(candle);
                continue;
            }
            if (!item.is_object()) {
                LOG_WARN("Skipping non-candle entry in {}: {}", file_path, item.dump());
                continue;
            }

            const auto* ts = findKey(item, "timestamp", "t");
            if (!ts) {
                LOG_WARN("Skipping candle without timestamp in {}", file_path);
                continue;
            }
            candle.timestamp = normalizeTimestamp(ts->get<long long>());

            const nlohmann::json nan_value = nullptr;
            const auto* o = findKey(item, "open", "o");
            const auto* h = findKey(item, "high", "h");
            const auto* l = findKey(item, "low", "l");
            const auto* c = findKey(item, "close", "c");
            const auto* v = findKey(item, "volume", "v");
            candle.open = jsonNumber(o ? *o : nan_value);
            candle.high = jsonNumber(h ? *h : nan_value);
            candle.low = jsonNumber(l ? *l : nan_value);
            candle.close = jsonNumber(c ? *c : nan_value);
            candle.volume = jsonNumber(v ? *v : nan_value);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing candle in {}: {} - {}", file_path, item.dump(), e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              Timestamp start_time,
                                              Timestamp end_time) {
    std::vector<Candle> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) {
        if (start_time > 0 && candle.timestamp < start_time) continue;
        if (end_time > 0 && candle.timestamp > end_time) continue;
        out.push_back(candle);
    }
    return out;
}

Timestamp DataHistory::normalizeTimestamp(long long raw) {
    return (raw >= MILLISECOND_THRESHOLD || raw <= -MILLISECOND_THRESHOLD) ? raw / 1000 : raw;
}

} // namespace backtest
} // namespace candlesim
