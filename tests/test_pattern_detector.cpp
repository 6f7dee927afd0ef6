#include <cstring>
#include <iostream>

#include "CandleFixtures.hpp"
#include "indicators/EMACalculator.h"
#include "strategy/PatternDetector.h"

using strategy::EmaLevels;
using strategy::PatternDetector;
using strategy::PatternVariant;

namespace {

domain::Candle bar(double open, double high, double low, double close) {
    domain::Candle candle;
    candle.open = open;
    candle.high = high;
    candle.low = low;
    candle.close = close;
    candle.volume = 1000;
    return candle;
}

// Support 100, resistance 110.
const EmaLevels kLevels{110.0, 105.0, 102.0, 100.0};

EmaLevels levelsOf(const domain::CandleHistory& candles) {
    const auto closes = domain::closing_prices(candles);
    return EmaLevels{indicators::EMACalculator::calculate(closes, 20), indicators::EMACalculator::calculate(closes, 50),
                     indicators::EMACalculator::calculate(closes, 100),
                     indicators::EMACalculator::calculate(closes, 200)};
}

bool expectVariant(const char* name, const domain::CandleHistory& candles, const EmaLevels& levels,
                   PatternVariant expected) {
    const PatternDetector detector{};
    const auto actual = detector.detect(candles, levels);
    if (actual != expected) {
        std::cerr << name << ": expected " << strategy::toString(expected) << " but got "
                  << strategy::toString(actual) << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (kLevels.support() != 100.0 || kLevels.resistance() != 110.0) {
        std::cerr << "EMA support/resistance should be the lowest/highest level\n";
        return 1;
    }

    // Reversal candle is both a 2-candle reversal and a bullish pinbar: the 2-candle variant wins.
    {
        const domain::CandleHistory tail{bar(108.0, 108.5, 103.0, 104.0), bar(104.0, 104.5, 98.0, 103.0),
                                         bar(103.5, 105.5, 102.0, 105.0)};
        if (!PatternDetector::isBullishPinbar(tail[1])) {
            std::cerr << "Reversal candle should qualify as a bullish pinbar\n";
            return 1;
        }
        const PatternDetector detector{};
        if (!detector.isLongPinbarReversal(tail, kLevels)) {
            std::cerr << "Tail should also satisfy the long pinbar rules\n";
            return 1;
        }
        if (!expectVariant("long priority", tail, kLevels, PatternVariant::Long2CandleReversal)) {
            return 1;
        }
    }

    // 2-candle reversal with a wide body: not a pinbar.
    {
        const domain::CandleHistory tail{bar(108.0, 108.5, 103.0, 104.0), bar(101.0, 106.0, 99.0, 104.0),
                                         bar(104.0, 107.5, 101.0, 107.0)};
        if (PatternDetector::isBullishPinbar(tail[1])) {
            std::cerr << "Body/range 3/7 should not be a pinbar\n";
            return 1;
        }
        if (!expectVariant("long 2-candle", tail, kLevels, PatternVariant::Long2CandleReversal)) {
            return 1;
        }
    }

    // Prior low under the reversal low breaks the 2-candle rule; the pinbar still qualifies.
    {
        const domain::CandleHistory tail{bar(108.0, 108.5, 97.0, 104.0), bar(104.0, 104.5, 98.0, 103.0),
                                         bar(103.5, 105.5, 102.0, 105.0)};
        if (!expectVariant("long pinbar", tail, kLevels, PatternVariant::LongPinbarReversal)) {
            return 1;
        }
    }

    // Bearish mirror: 2-candle reversal that is also a bearish pinbar.
    {
        const domain::CandleHistory tail{bar(103.0, 108.0, 102.5, 106.0), bar(107.0, 113.0, 106.5, 108.0),
                                         bar(107.5, 108.0, 105.5, 106.0)};
        if (!PatternDetector::isBearishPinbar(tail[1])) {
            std::cerr << "Reversal candle should qualify as a bearish pinbar\n";
            return 1;
        }
        if (!expectVariant("short priority", tail, kLevels, PatternVariant::Short2CandleReversal)) {
            return 1;
        }
    }

    // Prior high above the reversal high leaves only the bearish pinbar.
    {
        const domain::CandleHistory tail{bar(103.0, 115.0, 102.5, 106.0), bar(107.0, 113.0, 106.5, 108.0),
                                         bar(107.5, 108.0, 105.5, 106.0)};
        if (!expectVariant("short pinbar", tail, kLevels, PatternVariant::ShortPinbarReversal)) {
            return 1;
        }
    }

    // Failing rules.
    {
        // Red confirmation candle.
        const domain::CandleHistory redConfirm{bar(108.0, 108.5, 103.0, 104.0), bar(101.0, 106.0, 99.0, 104.0),
                                               bar(107.5, 107.8, 101.0, 107.0)};
        if (!expectVariant("red confirmation", redConfirm, kLevels, PatternVariant::None)) {
            return 1;
        }

        // Confirmation low under the reversal low.
        const domain::CandleHistory lowerLow{bar(108.0, 108.5, 103.0, 104.0), bar(101.0, 106.0, 99.0, 104.0),
                                             bar(104.0, 107.5, 98.0, 107.0)};
        if (!expectVariant("lower low", lowerLow, kLevels, PatternVariant::None)) {
            return 1;
        }

        // Reversal body midpoint under support.
        const domain::CandleHistory bodyBelow{bar(100.0, 100.5, 98.0, 99.0), bar(99.0, 100.0, 95.0, 99.5),
                                              bar(99.5, 101.5, 98.0, 101.0)};
        if (!expectVariant("body below support", bodyBelow, kLevels, PatternVariant::None)) {
            return 1;
        }

        // Tail never reaches support.
        const domain::CandleHistory noPierce{bar(108.0, 108.5, 103.0, 104.0), bar(104.0, 104.5, 101.0, 103.0),
                                             bar(103.5, 105.5, 102.0, 105.0)};
        if (!expectVariant("no pierce", noPierce, kLevels, PatternVariant::None)) {
            return 1;
        }

        const domain::CandleHistory twoBars{bar(104.0, 104.5, 98.0, 103.0), bar(103.5, 105.5, 102.0, 105.0)};
        if (!expectVariant("two bars", twoBars, kLevels, PatternVariant::None)) {
            return 1;
        }
        if (!expectVariant("empty", {}, kLevels, PatternVariant::None)) {
            return 1;
        }
    }

    // Degenerate candles are never pinbars.
    {
        const auto doji = bar(100.0, 100.0, 100.0, 100.0);
        if (PatternDetector::isBullishPinbar(doji) || PatternDetector::isBearishPinbar(doji)) {
            std::cerr << "Zero-range candle should not be a pinbar\n";
            return 1;
        }
    }

    // Fixture tails against their own EMA levels.
    {
        const auto longCandles = fixtures::longSetup();
        if (!expectVariant("long fixture", longCandles, levelsOf(longCandles), PatternVariant::Long2CandleReversal)) {
            return 1;
        }
        const auto pinbarCandles = fixtures::longPinbarOnlySetup();
        if (!expectVariant("long pinbar fixture", pinbarCandles, levelsOf(pinbarCandles),
                           PatternVariant::LongPinbarReversal)) {
            return 1;
        }
        const auto shortCandles = fixtures::shortSetup();
        if (!expectVariant("short fixture", shortCandles, levelsOf(shortCandles),
                           PatternVariant::Short2CandleReversal)) {
            return 1;
        }
    }

    if (std::strcmp(strategy::toString(PatternVariant::LongPinbarReversal), "LongPinbarReversal") != 0 ||
        !strategy::isLongPattern(PatternVariant::LongPinbarReversal) ||
        strategy::isLongPattern(PatternVariant::ShortPinbarReversal) ||
        !strategy::isShortPattern(PatternVariant::Short2CandleReversal)) {
        std::cerr << "PatternVariant helpers mismatch\n";
        return 1;
    }

    return 0;
}
