#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace analytics {

// Indicator values for every candle of one run, computed once up front.
// Lookup is by indicator and field name; "value" is each indicator's primary field.
class IndicatorSeries {
public:
    IndicatorSeries() = default;

    static IndicatorSeries build(const CandleSeries& candles);

    size_t size() const { return size_; }

    // NaN when the index is out of range, the field is unknown or the value is still warming up.
    double value(size_t index, strategy::IndicatorName indicator, const std::string& field) const;

    bool hasField(strategy::IndicatorName indicator, const std::string& field) const;

    // Test hook: overrides (or adds) one column.
    void setColumn(strategy::IndicatorName indicator, const std::string& field, std::vector<double> values);

private:
    static std::string key(strategy::IndicatorName indicator, const std::string& field);
    void addColumn(strategy::IndicatorName indicator, const std::string& field, const std::vector<double>& values);

    size_t size_ = 0;
    std::unordered_map<std::string, std::vector<double>> columns_;
};

} // namespace analytics
} // namespace candlesim
