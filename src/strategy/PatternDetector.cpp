#include "strategy/PatternDetector.h"

#include <algorithm>
#include <cmath>

namespace strategy {
namespace {

double bodyMidpoint(const domain::Candle& candle) noexcept {
    return (candle.open + candle.close) / 2;
}

// Confirmation closes above the reversal high, is green, and prints a higher low.
bool isBullishConfirmation(const domain::Candle& confirm, const domain::Candle& reversal) noexcept {
    if (confirm.close <= reversal.high) {
        return false;
    }
    if (confirm.close <= confirm.open) {
        return false;
    }
    return confirm.low > reversal.low;
}

// Confirmation closes below the reversal low, is red, and prints a lower high.
bool isBearishConfirmation(const domain::Candle& confirm, const domain::Candle& reversal) noexcept {
    if (confirm.close >= reversal.low) {
        return false;
    }
    if (confirm.close >= confirm.open) {
        return false;
    }
    return confirm.high < reversal.high;
}

}  // namespace

const char* toString(PatternVariant variant) noexcept {
    switch (variant) {
        case PatternVariant::None: return "None";
        case PatternVariant::Long2CandleReversal: return "Long2CandleReversal";
        case PatternVariant::Short2CandleReversal: return "Short2CandleReversal";
        case PatternVariant::LongPinbarReversal: return "LongPinbarReversal";
        case PatternVariant::ShortPinbarReversal: return "ShortPinbarReversal";
    }
    return "Unknown";
}

bool isLongPattern(PatternVariant variant) noexcept {
    return variant == PatternVariant::Long2CandleReversal || variant == PatternVariant::LongPinbarReversal;
}

bool isShortPattern(PatternVariant variant) noexcept {
    return variant == PatternVariant::Short2CandleReversal || variant == PatternVariant::ShortPinbarReversal;
}

double EmaLevels::support() const noexcept {
    return std::min({ema20, ema50, ema100, ema200});
}

double EmaLevels::resistance() const noexcept {
    return std::max({ema20, ema50, ema100, ema200});
}

PatternVariant PatternDetector::detect(const domain::CandleHistory& candles, const EmaLevels& levels) const {
    if (candles.size() < kMinCandles) {
        return PatternVariant::None;
    }
    if (isLong2CandleReversal(candles, levels)) {
        return PatternVariant::Long2CandleReversal;
    }
    if (isShort2CandleReversal(candles, levels)) {
        return PatternVariant::Short2CandleReversal;
    }
    if (isLongPinbarReversal(candles, levels)) {
        return PatternVariant::LongPinbarReversal;
    }
    if (isShortPinbarReversal(candles, levels)) {
        return PatternVariant::ShortPinbarReversal;
    }
    return PatternVariant::None;
}

bool PatternDetector::isLong2CandleReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const {
    if (candles.size() < kMinCandles) {
        return false;
    }
    const auto& confirm = candles[candles.size() - 1];
    const auto& reversal = candles[candles.size() - 2];
    const auto& prior = candles[candles.size() - 3];
    const double support = levels.support();

    if (bodyMidpoint(reversal) <= support) {
        return false;
    }
    if (!(reversal.low < support && reversal.low < prior.low)) {
        return false;
    }
    return isBullishConfirmation(confirm, reversal);
}

bool PatternDetector::isShort2CandleReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const {
    if (candles.size() < kMinCandles) {
        return false;
    }
    const auto& confirm = candles[candles.size() - 1];
    const auto& reversal = candles[candles.size() - 2];
    const auto& prior = candles[candles.size() - 3];
    const double resistance = levels.resistance();

    if (bodyMidpoint(reversal) >= resistance) {
        return false;
    }
    if (!(reversal.high > resistance && reversal.high > prior.high)) {
        return false;
    }
    return isBearishConfirmation(confirm, reversal);
}

bool PatternDetector::isLongPinbarReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const {
    if (candles.size() < kMinCandles) {
        return false;
    }
    const auto& confirm = candles[candles.size() - 1];
    const auto& pinbar = candles[candles.size() - 2];
    if (!isBullishPinbar(pinbar)) {
        return false;
    }

    const double support = levels.support();
    if (bodyMidpoint(pinbar) <= support) {
        return false;
    }
    if (pinbar.low >= support) {
        return false;
    }
    return isBullishConfirmation(confirm, pinbar);
}

bool PatternDetector::isShortPinbarReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const {
    if (candles.size() < kMinCandles) {
        return false;
    }
    const auto& confirm = candles[candles.size() - 1];
    const auto& pinbar = candles[candles.size() - 2];
    if (!isBearishPinbar(pinbar)) {
        return false;
    }

    const double resistance = levels.resistance();
    if (bodyMidpoint(pinbar) >= resistance) {
        return false;
    }
    if (pinbar.high <= resistance) {
        return false;
    }
    return isBearishConfirmation(confirm, pinbar);
}

bool PatternDetector::isBullishPinbar(const domain::Candle& candle) noexcept {
    const double range = candle.high - candle.low;
    if (!(range > 0)) {
        return false;
    }
    const double body = std::abs(candle.close - candle.open);
    if (body / range > kMaxBodyRatio) {
        return false;
    }
    const double lowerWick = std::min(candle.open, candle.close) - candle.low;
    return lowerWick / range >= kMinWickRatio;
}

bool PatternDetector::isBearishPinbar(const domain::Candle& candle) noexcept {
    const double range = candle.high - candle.low;
    if (!(range > 0)) {
        return false;
    }
    const double body = std::abs(candle.close - candle.open);
    if (body / range > kMaxBodyRatio) {
        return false;
    }
    const double upperWick = candle.high - std::max(candle.open, candle.close);
    return upperWick / range >= kMinWickRatio;
}

}  // namespace strategy
