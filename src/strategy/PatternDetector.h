#pragma once

#include "domain/Types.h"

namespace strategy {

enum class PatternVariant {
    None,
    Long2CandleReversal,
    Short2CandleReversal,
    LongPinbarReversal,
    ShortPinbarReversal,
};

const char* toString(PatternVariant variant) noexcept;

bool isLongPattern(PatternVariant variant) noexcept;
bool isShortPattern(PatternVariant variant) noexcept;

// The four EMA levels the tail is measured against.
struct EmaLevels {
    double ema20 = 0.0;
    double ema50 = 0.0;
    double ema100 = 0.0;
    double ema200 = 0.0;

    double support() const noexcept;
    double resistance() const noexcept;
};

// Classifies the last three candles of a history. Candles are read from the tail:
// [n-3] prior, [n-2] reversal/pinbar, [n-1] confirmation.
class PatternDetector {
public:
    // First match in priority order: Long2, Short2, LongPinbar, ShortPinbar.
    PatternVariant detect(const domain::CandleHistory& candles, const EmaLevels& levels) const;

    bool isLong2CandleReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const;
    bool isShort2CandleReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const;
    bool isLongPinbarReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const;
    bool isShortPinbarReversal(const domain::CandleHistory& candles, const EmaLevels& levels) const;

    static bool isBullishPinbar(const domain::Candle& candle) noexcept;
    static bool isBearishPinbar(const domain::Candle& candle) noexcept;

    static constexpr std::size_t kMinCandles = 3;
    static constexpr double kMaxBodyRatio = 0.3;
    static constexpr double kMinWickRatio = 0.6;
};

}  // namespace strategy
