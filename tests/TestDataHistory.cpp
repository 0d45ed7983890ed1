#include "backtest/DataHistory.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace candlesim;
using namespace candlesim::backtest;

namespace {

std::filesystem::path writeTemp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

}

int main() {
    std::cout << "[TEST] Starting DataHistory Test..." << std::endl;

    // CSV with BOM, header, quoted cells, a millisecond timestamp and a broken price
    const auto csv = writeTemp("candlesim_test_candles.csv",
        "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n"
        "1700000000,1.0,1.2,0.9,1.1,500\n"
        "\"1700000060\",\"1.1\",\"1.3\",\"1.0\",\"1.2\",\"600\"\n"
        "1700000120000,1.2,1.4,1.1,1.3,700\n"
        "1700000180,1.3,oops,1.2,1.25,800\n"
        "short,row\n");
    const auto candles = DataHistory::loadCSV(csv.string());
    std::filesystem::remove(csv);

    assert(candles.size() == 4);
    assert(candles[0].timestamp == 1700000000);
    assert(candles[0].close == 1.1);
    assert(candles[1].timestamp == 1700000060);
    assert(candles[1].volume == 600.0);
    assert(candles[2].timestamp == 1700000120);
    assert(std::isnan(candles[3].high));
    assert(candles[3].close == 1.25);
    std::cout << "  csv ok\n";

    // JSON objects with long and short keys; a bad row is dropped alone and file order is kept
    const auto objects = writeTemp("candlesim_test_candles.json", R"({"candles": [
        {"timestamp": 1700000060, "open": 2, "high": 3, "low": 1, "close": 2.5, "volume": 10},
        {"timestamp": "soon", "open": 9, "high": 9, "low": 9, "close": 9, "volume": 9},
        42,
        {"t": 1700000000000, "o": 1, "h": 2, "l": 0.5, "c": 1.5, "v": "20"}
    ]})");
    auto loaded = DataHistory::load(objects.string());
    std::filesystem::remove(objects);
    assert(loaded.size() == 2);
    assert(loaded[0].timestamp == 1700000060);
    assert(loaded[0].close == 2.5);
    assert(loaded[1].timestamp == 1700000000);
    assert(loaded[1].volume == 20.0);

    // JSON row arrays
    const auto rows = writeTemp("candlesim_test_rows.JSON",
        R"([[1700000000, 1, 2, 0.5, 1.5, 9], [1700000060, 1.5], [null, 1, 1, 1, 1, 1], [1700000120, 2, 3, 1, 2.5, 4]])");
    loaded = DataHistory::load(rows.string());
    std::filesystem::remove(rows);
    assert(loaded.size() == 2);
    assert(loaded[0].high == 2.0);
    assert(loaded[1].timestamp == 1700000120);

    // Unparseable JSON yields nothing
    const auto broken = writeTemp("candlesim_test_broken.json", "[{\"timestamp\": ");
    assert(DataHistory::loadJSON(broken.string()).empty());
    std::filesystem::remove(broken);

    assert(DataHistory::load("/nonexistent/candles.csv").empty());
    std::cout << "  json ok\n";

    // Time filtering, 0 leaves a side open
    std::vector<Candle> series;
    for (int i = 0; i < 5; ++i) {
        series.emplace_back(1, 1, 1, 1, 1, 100 + i * 10);
    }
    assert(DataHistory::filterByTime(series, 110, 130).size() == 3);
    assert(DataHistory::filterByTime(series, 0, 110).size() == 2);
    assert(DataHistory::filterByTime(series, 125, 0).size() == 2);
    assert(DataHistory::filterByTime(series, 0, 0).size() == 5);

    assert(DataHistory::normalizeTimestamp(1700000000) == 1700000000);
    assert(DataHistory::normalizeTimestamp(1700000000123LL) == 1700000000);
    std::cout << "  filtering ok\n";

    std::cout << "[TEST] DataHistory PASSED" << std::endl;
    return 0;
}
