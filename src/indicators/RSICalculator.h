#pragma once

#include <cstddef>
#include <vector>

namespace indicators {

class RSICalculator {
public:
    // Wilder RSI at the end of the series; 0 when fewer than period + 1 prices.
    static double calculate(const std::vector<double>& prices, int period);

    // Same as calculate() over prices[first, last).
    static double calculateRange(const std::vector<double>& prices,
                                 std::size_t first,
                                 std::size_t last,
                                 int period);
};

}  // namespace indicators
