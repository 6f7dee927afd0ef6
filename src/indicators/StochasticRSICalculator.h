#pragma once

#include <vector>

#include "indicators/IndicatorTypes.h"

namespace indicators {

class StochasticRSICalculator {
public:
    // %K over the RSI trajectory, %D as the SMA of the last dPeriod %K values.
    // crossover: previous %K below previous %D, current %K above current %D, previous %K below 30.
    static StochasticRsiResult calculate(const std::vector<double>& prices,
                                         int rsiPeriod,
                                         int kPeriod,
                                         int dPeriod);

    static bool isOversoldWithCrossover(const std::vector<double>& prices,
                                        int rsiPeriod,
                                        int kPeriod,
                                        int dPeriod);

    // Uses the same crossover test as the oversold check.
    static bool isOverboughtWithCrossover(const std::vector<double>& prices,
                                          int rsiPeriod,
                                          int kPeriod,
                                          int dPeriod);

    static constexpr double kOversold = 30.0;
    static constexpr double kOverbought = 70.0;
};

}  // namespace indicators
