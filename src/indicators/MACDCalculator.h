#pragma once

#include <cstddef>
#include <vector>

#include "indicators/IndicatorTypes.h"

namespace indicators {

class MACDCalculator {
public:
    // macd = EMA(fast) - EMA(slow) at the end of the series; the signal line is the EMA of the
    // MACD values of every prefix longer than `slowPeriod`, or macd * 0.9 when there are fewer
    // than `signalPeriod` of them. Zeroed when the series is shorter than `slowPeriod`.
    static MacdResult calculate(const std::vector<double>& prices,
                                int fastPeriod,
                                int slowPeriod,
                                int signalPeriod);

    // Acceptable when MACD is above signal, or when it has been at/below signal for at most
    // kMaxOppositeBars consecutive bars.
    static bool isBearMarketAcceptable(const std::vector<double>& prices,
                                       int fastPeriod,
                                       int slowPeriod,
                                       int signalPeriod);

    // Mirror of isBearMarketAcceptable for the bull side.
    static bool isBullMarketAcceptable(const std::vector<double>& prices,
                                       int fastPeriod,
                                       int slowPeriod,
                                       int signalPeriod);

    static constexpr int kMaxOppositeBars = 5;
};

}  // namespace indicators
