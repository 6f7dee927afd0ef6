#include "strategy/ScenarioValidator.h"

#include "indicators/EMACalculator.h"
#include "indicators/MACDCalculator.h"
#include "indicators/StochasticRSICalculator.h"

namespace strategy {

const char* toString(Scenario scenario) noexcept {
    return scenario == Scenario::Long ? "Long" : "Short";
}

ScenarioVerdict ScenarioValidator::validate(const domain::Symbol& symbol,
                                            const domain::CandleHistory& candles,
                                            Scenario scenario) const {
    using indicators::EMACalculator;
    using indicators::MACDCalculator;
    using indicators::StochasticRSICalculator;

    ScenarioVerdict verdict;
    verdict.symbol = symbol;
    verdict.scenario = scenario;
    const bool isLong = scenario == Scenario::Long;

    const auto closes = domain::closing_prices(candles);
    if (closes.size() < kMinCloses) {
        verdict.message = "Insufficient data for analysis";
        return verdict;
    }

    auto& snap = verdict.snapshot;
    snap.ema20 = EMACalculator::calculate(closes, 20);
    snap.ema50 = EMACalculator::calculate(closes, 50);
    snap.ema100 = EMACalculator::calculate(closes, 100);
    snap.ema200 = EMACalculator::calculate(closes, 200);

    verdict.emaTrendValid = isLong ? EMACalculator::isUptrend(snap.ema20, snap.ema50, snap.ema100, snap.ema200)
                                   : EMACalculator::isDowntrend(snap.ema20, snap.ema50, snap.ema100, snap.ema200);
    if (!verdict.emaTrendValid) {
        verdict.message = isLong ? "EMA trend not in uptrend order (20 > 50 > 100 > 200)"
                                 : "EMA trend not in downtrend order (20 < 50 < 100 < 200)";
        return verdict;
    }

    snap.stochastic = StochasticRSICalculator::calculate(closes, kStochRsiPeriod, kStochKPeriod, kStochDPeriod);
    if (isLong) {
        verdict.stochasticValid = snap.stochastic.k < StochasticRSICalculator::kOversold && snap.stochastic.crossover;
    } else {
        verdict.stochasticValid = snap.stochastic.k > StochasticRSICalculator::kOverbought && snap.stochastic.crossover;
    }
    if (!verdict.stochasticValid) {
        verdict.message = isLong ? "Stochastic RSI not in oversold region with crossover"
                                 : "Stochastic RSI not in overbought region with crossover";
        return verdict;
    }

    snap.macd = MACDCalculator::calculate(closes, kMacdFast, kMacdSlow, kMacdSignal);
    verdict.macdValid = isLong ? MACDCalculator::isBearMarketAcceptable(closes, kMacdFast, kMacdSlow, kMacdSignal)
                               : MACDCalculator::isBullMarketAcceptable(closes, kMacdFast, kMacdSlow, kMacdSignal);
    if (!verdict.macdValid) {
        verdict.message = isLong ? "MACD not in bull market or bear market exceeds 5 candlesticks"
                                 : "MACD not in bear market or bull market exceeds 5 candlesticks";
        return verdict;
    }

    verdict.pattern = detector_.detect(candles, EmaLevels{snap.ema20, snap.ema50, snap.ema100, snap.ema200});
    verdict.patternValid = isLong ? isLongPattern(verdict.pattern) : isShortPattern(verdict.pattern);
    if (!verdict.patternValid) {
        verdict.message = isLong ? "Long reversal pattern not detected" : "Short reversal pattern not detected";
        return verdict;
    }

    verdict.isValid = true;
    verdict.message = isLong ? "All SAPAN long strategy conditions met" : "All SAPAN short strategy conditions met";
    return verdict;
}

}  // namespace strategy
