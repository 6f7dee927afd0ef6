#pragma once

#include <string>

#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"
#include "strategy/PatternDetector.h"

namespace strategy {

enum class Scenario { Long, Short };

const char* toString(Scenario scenario) noexcept;

struct ScenarioVerdict {
    domain::Symbol symbol;
    Scenario scenario{Scenario::Long};
    bool isValid{false};
    bool emaTrendValid{false};
    bool stochasticValid{false};
    bool macdValid{false};
    bool patternValid{false};
    PatternVariant pattern{PatternVariant::None};
    std::string message;
    // Values computed up to the gate that stopped evaluation.
    indicators::IndicatorSnapshot snapshot;
};

// Stateless gate sequence: EMA order, Stochastic RSI, MACD duration, reversal pattern.
// Stops at the first failing gate.
class ScenarioValidator {
public:
    ScenarioVerdict validate(const domain::Symbol& symbol,
                             const domain::CandleHistory& candles,
                             Scenario scenario) const;

    ScenarioVerdict validateLong(const domain::Symbol& symbol, const domain::CandleHistory& candles) const {
        return validate(symbol, candles, Scenario::Long);
    }

    ScenarioVerdict validateShort(const domain::Symbol& symbol, const domain::CandleHistory& candles) const {
        return validate(symbol, candles, Scenario::Short);
    }

    static constexpr std::size_t kMinCloses = 200;
    static constexpr int kStochRsiPeriod = 5;
    static constexpr int kStochKPeriod = 3;
    static constexpr int kStochDPeriod = 3;
    static constexpr int kMacdFast = 50;
    static constexpr int kMacdSlow = 100;
    static constexpr int kMacdSignal = 9;

private:
    PatternDetector detector_;
};

}  // namespace strategy
