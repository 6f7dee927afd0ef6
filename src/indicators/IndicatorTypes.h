#pragma once

namespace indicators {

// Zero-valued results mean "undefined": not enough history for the requested periods.

struct StochasticRsiResult {
    double k = 0.0;
    double d = 0.0;
    bool crossover = false;
};

struct MacdResult {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

struct IndicatorSnapshot {
    double ema20 = 0.0;
    double ema50 = 0.0;
    double ema100 = 0.0;
    double ema200 = 0.0;
    StochasticRsiResult stochastic;
    MacdResult macd;
};

}  // namespace indicators
