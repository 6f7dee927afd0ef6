#include "indicators/RSICalculator.h"

#include <stdexcept>

namespace indicators {

double RSICalculator::calculate(const std::vector<double>& prices, int period) {
    return calculateRange(prices, 0, prices.size(), period);
}

double RSICalculator::calculateRange(const std::vector<double>& prices,
                                     std::size_t first,
                                     std::size_t last,
                                     int period) {
    if (period <= 0) {
        throw std::invalid_argument("RSI period must be positive");
    }
    if (last > prices.size() || first > last) {
        throw std::out_of_range("RSI range outside of price series");
    }

    const std::size_t count = last - first;
    if (count < static_cast<std::size_t>(period) + 1) {
        return 0.0;
    }

    const std::size_t changes = count - 1;
    const auto gainAt = [&](std::size_t step) {
        const double change = prices[first + step + 1] - prices[first + step];
        return change > 0 ? change : 0.0;
    };
    const auto lossAt = [&](std::size_t step) {
        const double change = prices[first + step + 1] - prices[first + step];
        return change > 0 ? 0.0 : -change;
    };

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 0; i < static_cast<std::size_t>(period); ++i) {
        avgGain += gainAt(i);
        avgLoss += lossAt(i);
    }
    avgGain /= static_cast<double>(period);
    avgLoss /= static_cast<double>(period);

    for (std::size_t i = static_cast<std::size_t>(period); i < changes; ++i) {
        avgGain = (avgGain * static_cast<double>(period - 1) + gainAt(i)) / static_cast<double>(period);
        avgLoss = (avgLoss * static_cast<double>(period - 1) + lossAt(i)) / static_cast<double>(period);
    }

    if (avgLoss == 0) {
        return 100.0;
    }

    const double rs = avgGain / avgLoss;
    return 100 - (100 / (1 + rs));
}

}  // namespace indicators
