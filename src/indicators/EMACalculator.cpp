#include "indicators/EMACalculator.h"

#include <cstddef>
#include <stdexcept>

namespace indicators {
namespace {

double smoothingFactor(int period) {
    return 2.0 / (static_cast<double>(period) + 1.0);
}

void requirePositive(int period) {
    if (period <= 0) {
        throw std::invalid_argument("EMA period must be positive");
    }
}

}  // namespace

double EMACalculator::calculate(const std::vector<double>& prices, int period) {
    requirePositive(period);
    if (prices.size() < static_cast<std::size_t>(period)) {
        return 0.0;
    }

    const double multiplier = smoothingFactor(period);

    double sum = 0.0;
    for (int i = 0; i < period; ++i) {
        sum += prices[static_cast<std::size_t>(i)];
    }
    double ema = sum / static_cast<double>(period);

    for (std::size_t i = static_cast<std::size_t>(period); i < prices.size(); ++i) {
        ema = (prices[i] * multiplier) + (ema * (1 - multiplier));
    }

    return ema;
}

std::vector<double> EMACalculator::trajectory(const std::vector<double>& prices, int period) {
    requirePositive(period);
    std::vector<double> values(prices.size(), 0.0);
    if (prices.size() < static_cast<std::size_t>(period)) {
        return values;
    }

    const double multiplier = smoothingFactor(period);

    double sum = 0.0;
    for (int i = 0; i < period; ++i) {
        sum += prices[static_cast<std::size_t>(i)];
    }
    double ema = sum / static_cast<double>(period);
    values[static_cast<std::size_t>(period - 1)] = ema;

    for (std::size_t i = static_cast<std::size_t>(period); i < prices.size(); ++i) {
        ema = (prices[i] * multiplier) + (ema * (1 - multiplier));
        values[i] = ema;
    }

    return values;
}

bool EMACalculator::isUptrend(double ema20, double ema50, double ema100, double ema200) noexcept {
    if (ema200 == 0.0) {
        return false;
    }
    return ema20 > ema50 && ema50 > ema100 && ema100 > ema200;
}

bool EMACalculator::isDowntrend(double ema20, double ema50, double ema100, double ema200) noexcept {
    if (ema200 == 0.0) {
        return false;
    }
    return ema20 < ema50 && ema50 < ema100 && ema100 < ema200;
}

}  // namespace indicators
