#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace candlesim {
namespace analytics {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> TechnicalIndicators::smaSeries(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), NaN);
    if (period <= 0) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); ++i) {
        out[i] = calculateMean(values, i + 1 - p, i + 1);
    }
    return out;
}

std::vector<double> TechnicalIndicators::emaSeries(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), NaN);
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return out;

    const double multiplier = 2.0 / (period + 1.0);

    // Seed with SMA
    double ema = calculateMean(values, 0, static_cast<size_t>(period));
    out[period - 1] = ema;

    for (size_t i = period; i < values.size(); ++i) {
        ema = (values[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

// Wilder's Smoothing
std::vector<double> TechnicalIndicators::rsiSeries(const std::vector<double>& closes, int period) {
    std::vector<double> out(closes.size(), NaN);
    if (period <= 0 || closes.size() < static_cast<size_t>(period + 1)) return out;

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;

    auto rsi = [](double gain, double loss) {
        if (loss < 0.0000001) return 100.0;
        const double rs = gain / loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };
    out[period] = rsi(avg_gain, avg_loss);

    for (size_t i = period + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double current_gain = (change > 0) ? change : 0.0;
        const double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        out[i] = rsi(avg_gain, avg_loss);
    }
    return out;
}

std::vector<double> TechnicalIndicators::atrSeries(const CandleSeries& candles, int period) {
    std::vector<double> out(candles.size(), NaN);
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) return out;

    // TR[i] between candle i-1 and i
    std::vector<double> tr_values(candles.size(), NaN);
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];
        const double tr1 = current.high - current.low;
        const double tr2 = std::abs(current.high - prev.close);
        const double tr3 = std::abs(current.low - prev.close);
        tr_values[i] = std::max({tr1, tr2, tr3});
    }

    double atr = calculateMean(tr_values, 1, static_cast<size_t>(period) + 1);
    out[period] = atr;

    for (size_t i = period + 1; i < candles.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
        out[i] = atr;
    }
    return out;
}

std::vector<double> TechnicalIndicators::vwmaSeries(const CandleSeries& candles, int period) {
    std::vector<double> out(candles.size(), NaN);
    if (period <= 0) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < candles.size(); ++i) {
        double pv = 0.0;
        double v = 0.0;
        for (size_t k = i + 1 - p; k <= i; ++k) {
            pv += candles[k].close * candles[k].volume;
            v += candles[k].volume;
        }
        out[i] = (v > 0.0) ? pv / v : NaN;
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::macdSeries(
    const std::vector<double>& closes,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    const auto fast_ema = emaSeries(closes, fast);
    const auto slow_ema = emaSeries(closes, slow);

    result.macd.assign(closes.size(), NaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        result.macd[i] = fast_ema[i] - slow_ema[i];
    }

    // Signal line is the EMA of the defined part of the MACD line
    result.signal.assign(closes.size(), NaN);
    result.histogram.assign(closes.size(), NaN);
    const size_t first_defined = (slow > 0) ? static_cast<size_t>(slow - 1) : 0;
    if (first_defined < closes.size()) {
        const std::vector<double> defined(result.macd.begin() + first_defined, result.macd.end());
        const auto signal = emaSeries(defined, signal_period);
        for (size_t k = 0; k < signal.size(); ++k) {
            result.signal[first_defined + k] = signal[k];
            result.histogram[first_defined + k] = defined[k] - signal[k];
        }
    }
    return result;
}

TechnicalIndicators::BollingerSeries TechnicalIndicators::bollingerSeries(
    const std::vector<double>& closes,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.upper.assign(closes.size(), NaN);
    result.middle.assign(closes.size(), NaN);
    result.lower.assign(closes.size(), NaN);
    result.width.assign(closes.size(), NaN);
    result.percent_b.assign(closes.size(), NaN);
    if (period <= 0) return result;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < closes.size(); ++i) {
        const size_t begin = i + 1 - p;
        const double middle = calculateMean(closes, begin, i + 1);
        const double std_dev = calculateStandardDeviation(closes, begin, i + 1, middle);

        result.middle[i] = middle;
        result.upper[i] = middle + (std_dev * std_dev_mult);
        result.lower[i] = middle - (std_dev * std_dev_mult);
        result.width[i] = result.upper[i] - result.lower[i];
        result.percent_b[i] = (result.width[i] > 0.0000001)
            ? (closes[i] - result.lower[i]) / result.width[i]
            : 0.5;
    }
    return result;
}

TechnicalIndicators::IchimokuSeries TechnicalIndicators::ichimokuSeries(
    const CandleSeries& candles,
    int tenkan_period,
    int kijun_period,
    int span_b_period
) {
    IchimokuSeries result;
    result.tenkan.assign(candles.size(), NaN);
    result.kijun.assign(candles.size(), NaN);
    result.span_a.assign(candles.size(), NaN);
    result.span_b.assign(candles.size(), NaN);

    for (size_t i = 0; i < candles.size(); ++i) {
        result.tenkan[i] = midpoint(candles, i, tenkan_period);
        result.kijun[i] = midpoint(candles, i, kijun_period);
        result.span_a[i] = (result.tenkan[i] + result.kijun[i]) / 2.0;
        result.span_b[i] = midpoint(candles, i, span_b_period);
    }
    return result;
}

std::vector<double> TechnicalIndicators::percentChangeSeries(const std::vector<double>& values) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 1; i < values.size(); ++i) {
        out[i] = (values[i - 1] != 0.0)
            ? ((values[i] - values[i - 1]) / values[i - 1]) * 100.0
            : NaN;
    }
    return out;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const CandleSeries& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) prices.push_back(c.close);
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const CandleSeries& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& c : candles) volumes.push_back(c.volume);
    return volumes;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin) return NaN;
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) sum += values[i];
    return sum / static_cast<double>(end - begin);
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values,
                                                       size_t begin, size_t end, double mean) {
    if (end <= begin) return NaN;
    double variance = 0.0;
    for (size_t i = begin; i < end; ++i) {
        variance += (values[i] - mean) * (values[i] - mean);
    }
    return std::sqrt(variance / static_cast<double>(end - begin));
}

double TechnicalIndicators::midpoint(const CandleSeries& candles, size_t end_inclusive, int period) {
    if (period <= 0 || end_inclusive + 1 < static_cast<size_t>(period)) return NaN;

    const size_t begin = end_inclusive + 1 - static_cast<size_t>(period);
    double highest = candles[begin].high;
    double lowest = candles[begin].low;
    for (size_t k = begin + 1; k <= end_inclusive; ++k) {
        // NaN-propagating comparisons keep a malformed candle visible in the output
        if (std::isnan(candles[k].high) || candles[k].high > highest) highest = candles[k].high;
        if (std::isnan(candles[k].low) || candles[k].low < lowest) lowest = candles[k].low;
    }
    return (highest + lowest) / 2.0;
}

} // namespace analytics
} // namespace candlesim
