#include "indicators/StochasticRSICalculator.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include "indicators/RSICalculator.h"

namespace indicators {
namespace {

constexpr double kFlatWindowK = 50.0;

double averageOf(const std::vector<double>& values, std::size_t first, std::size_t last) {
    double sum = 0.0;
    for (std::size_t i = first; i < last; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(last - first);
}

}  // namespace

StochasticRsiResult StochasticRSICalculator::calculate(const std::vector<double>& prices,
                                                       int rsiPeriod,
                                                       int kPeriod,
                                                       int dPeriod) {
    if (rsiPeriod <= 0 || kPeriod <= 0 || dPeriod <= 0) {
        throw std::invalid_argument("Stochastic RSI periods must be positive");
    }

    const auto rsiLen = static_cast<std::size_t>(rsiPeriod);
    const auto kLen = static_cast<std::size_t>(kPeriod);
    const auto dLen = static_cast<std::size_t>(dPeriod);

    if (prices.size() < rsiLen + kLen + dLen) {
        return {};
    }

    // Each RSI point looks at the rsiPeriod + 1 prices ending at i.
    std::vector<double> rsiValues;
    rsiValues.reserve(prices.size() - rsiLen);
    for (std::size_t i = rsiLen; i < prices.size(); ++i) {
        rsiValues.push_back(RSICalculator::calculateRange(prices, i - rsiLen, i + 1, rsiPeriod));
    }

    if (rsiValues.size() < kLen + dLen) {
        return {};
    }

    std::vector<double> kValues;
    kValues.reserve(rsiValues.size() - kLen + 1);
    for (std::size_t i = kLen - 1; i < rsiValues.size(); ++i) {
        const auto windowBegin = rsiValues.begin() + static_cast<std::ptrdiff_t>(i + 1 - kLen);
        const auto windowEnd = rsiValues.begin() + static_cast<std::ptrdiff_t>(i + 1);
        const auto [lowIt, highIt] = std::minmax_element(windowBegin, windowEnd);
        const double lowest = *lowIt;
        const double highest = *highIt;

        if (highest == lowest) {
            kValues.push_back(kFlatWindowK);
        } else {
            kValues.push_back(((rsiValues[i] - lowest) / (highest - lowest)) * 100);
        }
    }

    if (kValues.size() < dLen) {
        return {};
    }

    StochasticRsiResult result;
    result.k = kValues.back();
    result.d = averageOf(kValues, kValues.size() - dLen, kValues.size());

    if (kValues.size() >= 2) {
        const double prevK = kValues[kValues.size() - 2];
        double prevD = 0.0;
        if (kValues.size() >= dLen + 1) {
            prevD = averageOf(kValues, kValues.size() - dLen - 1, kValues.size() - 1);
        }
        result.crossover = prevK < prevD && result.k > result.d && prevK < kOversold;
    }

    return result;
}

bool StochasticRSICalculator::isOversoldWithCrossover(const std::vector<double>& prices,
                                                      int rsiPeriod,
                                                      int kPeriod,
                                                      int dPeriod) {
    const auto result = calculate(prices, rsiPeriod, kPeriod, dPeriod);
    return result.k < kOversold && result.crossover;
}

bool StochasticRSICalculator::isOverboughtWithCrossover(const std::vector<double>& prices,
                                                        int rsiPeriod,
                                                        int kPeriod,
                                                        int dPeriod) {
    const auto result = calculate(prices, rsiPeriod, kPeriod, dPeriod);
    return result.k > kOverbought && result.crossover;
}

}  // namespace indicators
