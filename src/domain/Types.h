#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

// One daily bar. openTime is the UTC midnight of the trading date.
struct Candle {
    TimestampMs openTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    std::int64_t volume{0};
};

// Ascending by openTime, no duplicate dates.
using CandleHistory = std::vector<Candle>;

// Closing prices in the same order as the history they came from.
using PriceSeries = std::vector<double>;

inline PriceSeries closing_prices(const CandleHistory& candles) {
    PriceSeries closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

struct Stock {
    Symbol symbol;
    std::string name;
    std::string sector;
    std::string industry;
};

}  // namespace domain
