#pragma once

#include <vector>
#include "common/Types.h"

namespace candlesim {
namespace analytics {

// Whole-series indicator calculations. Every returned vector has one value per input sample;
// samples inside the warm-up window are NaN.
class TechnicalIndicators {
public:
    // SMA (Simple Moving Average)
    static std::vector<double> smaSeries(const std::vector<double>& values, int period);

    // EMA seeded with the SMA of the first period samples
    static std::vector<double> emaSeries(const std::vector<double>& values, int period);

    // RSI with Wilder's smoothing. 70+ overbought, 30- oversold.
    static std::vector<double> rsiSeries(const std::vector<double>& closes, int period = 14);

    // ATR (Average True Range), Wilder's smoothing
    static std::vector<double> atrSeries(const CandleSeries& candles, int period = 14);

    // Volume weighted moving average of close
    static std::vector<double> vwmaSeries(const CandleSeries& candles, int period = 20);

    struct MACDSeries {
        std::vector<double> macd;
        std::vector<double> signal;
        std::vector<double> histogram;
    };
    static MACDSeries macdSeries(const std::vector<double>& closes,
                                 int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerSeries {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
        std::vector<double> width;
        std::vector<double> percent_b;
    };
    static BollingerSeries bollingerSeries(const std::vector<double>& closes,
                                           int period = 20, double std_dev_mult = 2.0);

    // Ichimoku lines without forward displacement, so no value depends on a future candle.
    struct IchimokuSeries {
        std::vector<double> tenkan;
        std::vector<double> kijun;
        std::vector<double> span_a;
        std::vector<double> span_b;
    };
    static IchimokuSeries ichimokuSeries(const CandleSeries& candles,
                                         int tenkan_period = 9, int kijun_period = 26, int span_b_period = 52);

    // Percent change versus the previous sample (first sample is NaN)
    static std::vector<double> percentChangeSeries(const std::vector<double>& values);

    static std::vector<double> extractClosePrices(const CandleSeries& candles);
    static std::vector<double> extractVolumes(const CandleSeries& candles);

private:
    static double calculateMean(const std::vector<double>& values, size_t begin, size_t end);
    static double calculateStandardDeviation(const std::vector<double>& values, size_t begin, size_t end, double mean);
    static double midpoint(const CandleSeries& candles, size_t end_inclusive, int period);
};

} // namespace analytics
} // namespace candlesim
