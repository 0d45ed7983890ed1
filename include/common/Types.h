#pragma once

#include <string>
#include <vector>

namespace candlesim {

using Price = double;
using Volume = double;
using Fraction = double;
// Unix seconds
using Timestamp = long long;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    Timestamp timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, Timestamp t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

using CandleSeries = std::vector<Candle>;

} // namespace candlesim
