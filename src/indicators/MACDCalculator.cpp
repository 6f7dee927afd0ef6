#include "indicators/MACDCalculator.h"

#include <stdexcept>

#include "indicators/EMACalculator.h"

namespace indicators {
namespace {

constexpr double kSignalFallbackRatio = 0.9;

enum class Side { Bull, Bear };

// Precomputed EMA paths so the MACD of any prefix is an O(1) lookup. Produces the same values
// as recomputing each prefix from scratch.
class MacdTrajectory {
public:
    MacdTrajectory(const std::vector<double>& prices, int fastPeriod, int slowPeriod, int signalPeriod)
        : slow_(static_cast<std::size_t>(slowPeriod)),
          signalPeriod_(static_cast<std::size_t>(signalPeriod)) {
        if (fastPeriod <= 0 || slowPeriod <= 0 || signalPeriod <= 0) {
            throw std::invalid_argument("MACD periods must be positive");
        }

        const auto fast = EMACalculator::trajectory(prices, fastPeriod);
        const auto slow = EMACalculator::trajectory(prices, slowPeriod);
        macd_.reserve(prices.size());
        for (std::size_t i = 0; i < prices.size(); ++i) {
            macd_.push_back(fast[i] - slow[i]);
        }

        // Signal input for a prefix of length n is macd_[slow_ .. n-1].
        if (prices.size() > slow_) {
            const std::vector<double> line(macd_.begin() + static_cast<std::ptrdiff_t>(slow_), macd_.end());
            signal_ = EMACalculator::trajectory(line, signalPeriod);
        }
    }

    MacdResult at(std::size_t length) const {
        MacdResult result;
        if (length < slow_ || length == 0 || length > macd_.size()) {
            return result;
        }

        result.macd = macd_[length - 1];
        const std::size_t lineLength = length - slow_;
        if (lineLength >= signalPeriod_) {
            result.signal = signal_[lineLength - 1];
        } else {
            result.signal = result.macd * kSignalFallbackRatio;
        }
        result.histogram = result.macd - result.signal;
        return result;
    }

    std::size_t size() const noexcept { return macd_.size(); }
    std::size_t slowPeriod() const noexcept { return slow_; }

private:
    std::size_t slow_;
    std::size_t signalPeriod_;
    std::vector<double> macd_;
    std::vector<double> signal_;
};

bool inSide(const MacdResult& result, Side side, bool inclusive) {
    if (side == Side::Bull) {
        return inclusive ? result.macd >= result.signal : result.macd > result.signal;
    }
    return inclusive ? result.macd <= result.signal : result.macd < result.signal;
}

// Walks back from the last bar counting consecutive bars on `opposite`, stopping after one
// more than the allowed run so long trends stay cheap.
bool oppositeRunAcceptable(const MacdTrajectory& trajectory, Side opposite) {
    int oppositeCount = 0;
    for (std::size_t length = trajectory.size(); length >= 2 && oppositeCount <= MACDCalculator::kMaxOppositeBars;
         --length) {
        if (length < trajectory.slowPeriod()) {
            continue;
        }
        if (inSide(trajectory.at(length), opposite, true)) {
            ++oppositeCount;
        } else {
            break;
        }
    }
    return oppositeCount <= MACDCalculator::kMaxOppositeBars;
}

}  // namespace

MacdResult MACDCalculator::calculate(const std::vector<double>& prices,
                                     int fastPeriod,
                                     int slowPeriod,
                                     int signalPeriod) {
    const MacdTrajectory trajectory(prices, fastPeriod, slowPeriod, signalPeriod);
    return trajectory.at(prices.size());
}

bool MACDCalculator::isBearMarketAcceptable(const std::vector<double>& prices,
                                            int fastPeriod,
                                            int slowPeriod,
                                            int signalPeriod) {
    const MacdTrajectory trajectory(prices, fastPeriod, slowPeriod, signalPeriod);
    if (inSide(trajectory.at(prices.size()), Side::Bull, false)) {
        return true;
    }
    return oppositeRunAcceptable(trajectory, Side::Bear);
}

bool MACDCalculator::isBullMarketAcceptable(const std::vector<double>& prices,
                                            int fastPeriod,
                                            int slowPeriod,
                                            int signalPeriod) {
    const MacdTrajectory trajectory(prices, fastPeriod, slowPeriod, signalPeriod);
    if (inSide(trajectory.at(prices.size()), Side::Bear, false)) {
        return true;
    }
    return oppositeRunAcceptable(trajectory, Side::Bull);
}

}  // namespace indicators
