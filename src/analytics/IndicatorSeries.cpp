#include "analytics/IndicatorSeries.h"
#include "analytics/TechnicalIndicators.h"

#include <limits>

namespace candlesim {
namespace analytics {

using strategy::IndicatorName;

IndicatorSeries IndicatorSeries::build(const CandleSeries& candles) {
    IndicatorSeries series;
    series.size_ = candles.size();

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto volumes = TechnicalIndicators::extractVolumes(candles);

    // Raw candle fields and percent changes
    std::vector<double> opens, highs, lows;
    opens.reserve(candles.size());
    highs.reserve(candles.size());
    lows.reserve(candles.size());
    for (const auto& c : candles) {
        opens.push_back(c.open);
        highs.push_back(c.high);
        lows.push_back(c.low);
    }
    series.addColumn(IndicatorName::PRICE_CHANGE, "value", TechnicalIndicators::percentChangeSeries(closes));
    series.addColumn(IndicatorName::PRICE_CHANGE, "open", opens);
    series.addColumn(IndicatorName::PRICE_CHANGE, "high", highs);
    series.addColumn(IndicatorName::PRICE_CHANGE, "low", lows);
    series.addColumn(IndicatorName::PRICE_CHANGE, "close", closes);
    series.addColumn(IndicatorName::PRICE_CHANGE, "volume", volumes);
    series.addColumn(IndicatorName::VOLUME_CHANGE, "value", TechnicalIndicators::percentChangeSeries(volumes));

    // Moving averages
    const auto sma9 = TechnicalIndicators::smaSeries(closes, 9);
    const auto sma20 = TechnicalIndicators::smaSeries(closes, 20);
    const auto sma50 = TechnicalIndicators::smaSeries(closes, 50);
    series.addColumn(IndicatorName::SMA, "value", sma20);
    series.addColumn(IndicatorName::SMA, "sma9", sma9);
    series.addColumn(IndicatorName::SMA, "sma20", sma20);
    series.addColumn(IndicatorName::SMA, "sma50", sma50);

    const auto ema9 = TechnicalIndicators::emaSeries(closes, 9);
    const auto ema20 = TechnicalIndicators::emaSeries(closes, 20);
    const auto ema50 = TechnicalIndicators::emaSeries(closes, 50);
    series.addColumn(IndicatorName::EMA, "value", ema20);
    series.addColumn(IndicatorName::EMA, "ema9", ema9);
    series.addColumn(IndicatorName::EMA, "ema20", ema20);
    series.addColumn(IndicatorName::EMA, "ema50", ema50);

    series.addColumn(IndicatorName::VWMA, "value", TechnicalIndicators::vwmaSeries(candles, 20));

    // Oscillators and volatility
    series.addColumn(IndicatorName::RSI, "value", TechnicalIndicators::rsiSeries(closes, 14));
    series.addColumn(IndicatorName::ATR, "value", TechnicalIndicators::atrSeries(candles, 14));

    const auto macd = TechnicalIndicators::macdSeries(closes);
    series.addColumn(IndicatorName::MACD, "value", macd.macd);
    series.addColumn(IndicatorName::MACD, "macd", macd.macd);
    series.addColumn(IndicatorName::MACD, "signal", macd.signal);
    series.addColumn(IndicatorName::MACD, "histogram", macd.histogram);

    const auto bands = TechnicalIndicators::bollingerSeries(closes);
    series.addColumn(IndicatorName::BBANDS, "value", bands.middle);
    series.addColumn(IndicatorName::BBANDS, "upper", bands.upper);
    series.addColumn(IndicatorName::BBANDS, "middle", bands.middle);
    series.addColumn(IndicatorName::BBANDS, "lower", bands.lower);
    series.addColumn(IndicatorName::BBANDS, "width", bands.width);
    series.addColumn(IndicatorName::BBANDS, "percent_b", bands.percent_b);

    const auto ichimoku = TechnicalIndicators::ichimokuSeries(candles);
    series.addColumn(IndicatorName::ICHIMOKU_CLOUD, "value", ichimoku.tenkan);
    series.addColumn(IndicatorName::ICHIMOKU_CLOUD, "tenkan", ichimoku.tenkan);
    series.addColumn(IndicatorName::ICHIMOKU_CLOUD, "kijun", ichimoku.kijun);
    series.addColumn(IndicatorName::ICHIMOKU_CLOUD, "span_a", ichimoku.span_a);
    series.addColumn(IndicatorName::ICHIMOKU_CLOUD, "span_b", ichimoku.span_b);

    return series;
}

double IndicatorSeries::value(size_t index, IndicatorName indicator, const std::string& field) const {
    const auto it = columns_.find(key(indicator, field.empty() ? "value" : field));
    if (it == columns_.end() || index >= it->second.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return it->second[index];
}

bool IndicatorSeries::hasField(IndicatorName indicator, const std::string& field) const {
    return columns_.count(key(indicator, field.empty() ? "value" : field)) > 0;
}

void IndicatorSeries::setColumn(IndicatorName indicator, const std::string& field, std::vector<double> values) {
    if (values.size() > size_) {
        size_ = values.size();
    }
    columns_[key(indicator, field)] = std::move(values);
}

std::string IndicatorSeries::key(IndicatorName indicator, const std::string& field) {
    return strategy::toString(indicator) + "." + field;
}

void IndicatorSeries::addColumn(IndicatorName indicator, const std::string& field, const std::vector<double>& values) {
    columns_[key(indicator, field)] = values;
}

} // namespace analytics
} // namespace candlesim
