#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace candlesim {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // A price cell that is not a number becomes NaN; the row is kept.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of {timestamp,open,high,low,close,volume}
    // objects (single-letter keys accepted) or of [t,o,h,l,c,v] arrays
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks the loader by file extension
    static std::vector<Candle> load(const std::string& file_path);

    // Keep candles with start <= timestamp <= end; 0 leaves that side open
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            Timestamp start_time,
                                            Timestamp end_time);

    // Millisecond timestamps are converted to seconds
    static Timestamp normalizeTimestamp(long long raw);
};

} // namespace backtest
} // namespace candlesim
