#pragma once

#include <vector>

namespace indicators {

class EMACalculator {
public:
    // EMA at the end of the series, seeded with the SMA of the first `period` prices.
    // Returns 0 when the series is shorter than the period.
    static double calculate(const std::vector<double>& prices, int period);

    // EMA value after every prefix: out[i] == calculate(prices[0..i], period), 0 before the seed.
    static std::vector<double> trajectory(const std::vector<double>& prices, int period);

    // 20 > 50 > 100 > 200. False while EMA200 is undefined (0).
    static bool isUptrend(double ema20, double ema50, double ema100, double ema200) noexcept;
    // 20 < 50 < 100 < 200. False while EMA200 is undefined (0).
    static bool isDowntrend(double ema20, double ema50, double ema100, double ema200) noexcept;
};

}  // namespace indicators
