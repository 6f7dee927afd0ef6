#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "CandleFixtures.hpp"
#include "app/BoundedQueue.hpp"
#include "app/EvaluationPipeline.hpp"
#include "app/ThreadGroup.hpp"
#include "app/WatchlistStore.hpp"
#include "common/Log.hpp"
#include "domain/IHistoryFetcher.hpp"
#include "strategy/ScenarioValidator.h"

namespace {
using namespace std::chrono_literals;

// Serves fixtures by symbol prefix: LONG*, SHORT*, FLAT*; FAIL* always throws.
class FixtureFetcher : public domain::IHistoryFetcher {
public:
    domain::CandleHistory fetchHistory(const domain::Symbol& symbol, int lookbackDays) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[symbol];
            lastLookback_ = lookbackDays;
        }
        const int now = inFlight_.fetch_add(1) + 1;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(2ms);
        inFlight_.fetch_sub(1);

        if (symbol.rfind("FAIL", 0) == 0) {
            throw domain::FetchError(symbol, "API rate limit: simulated");
        }
        if (symbol.rfind("LONG", 0) == 0) {
            return fixtures::longSetup();
        }
        if (symbol.rfind("SHORT", 0) == 0) {
            return fixtures::shortSetup();
        }
        return fixtures::flat(260);
    }

    int callsFor(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[symbol];
    }

    int lastLookback() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastLookback_;
    }

    int maxInFlight() const { return maxInFlight_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, int> calls_;
    int lastLookback_ = 0;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

app::EvaluationPipeline::Options fastOptions(int workers) {
    app::EvaluationPipeline::Options options;
    options.workers = workers;
    options.requestDelay = 0ms;
    options.lookbackDays = 300;
    return options;
}

}  // namespace

int main() {
    sapan::log::setLevel(sapan::log::Level::Error);
    const strategy::ScenarioValidator validator{};

    // Bounded queue: FIFO, close drains remaining items, push after close is rejected.
    {
        app::BoundedQueue<int> queue(2);
        queue.push(1);
        queue.push(2);
        std::atomic<bool> thirdPushed{false};
        std::thread producer([&]() {
            queue.push(3);
            thirdPushed.store(true);
        });
        std::this_thread::sleep_for(30ms);
        if (thirdPushed.load()) {
            std::cerr << "push() should block while the queue is full\n";
            producer.join();
            return 1;
        }
        auto first = queue.pop();
        producer.join();
        if (!first || *first != 1 || !thirdPushed.load()) {
            std::cerr << "pop() should free a slot for the blocked producer\n";
            return 1;
        }

        queue.close();
        if (queue.push(4)) {
            std::cerr << "push() after close() should fail\n";
            return 1;
        }
        auto second = queue.pop();
        auto third = queue.pop();
        auto none = queue.pop();
        if (!second || *second != 2 || !third || *third != 3 || none.has_value()) {
            std::cerr << "Closed queue should drain in order and then return nullopt\n";
            return 1;
        }
    }

    // K symbols, W workers: exactly K results, counters consistent, scenarios exclusive.
    {
        std::vector<domain::Symbol> symbols;
        for (int i = 0; i < 6; ++i) {
            symbols.push_back("LONG" + std::to_string(i));
            symbols.push_back("SHORT" + std::to_string(i));
            symbols.push_back("FLAT" + std::to_string(i));
        }
        symbols.push_back("FAIL0");
        symbols.push_back("FAIL1");

        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        std::ostringstream progress;
        auto options = fastOptions(3);
        options.progress = &progress;
        options.progressInterval = 5ms;
        app::EvaluationPipeline pipeline(fetcher, validator, watchlist, options);

        const auto summary = pipeline.evaluate(symbols);
        const std::size_t k = symbols.size();

        if (summary.total != k || summary.processed != k || summary.results.size() != k) {
            std::cerr << "Expected " << k << " results, got processed=" << summary.processed
                      << " results=" << summary.results.size() << "\n";
            return 1;
        }
        if (summary.success != k - 2 || summary.errors != 2) {
            std::cerr << "Expected 2 errors, got success=" << summary.success << " errors=" << summary.errors << "\n";
            return 1;
        }
        if (summary.longCount != 6 || summary.shortCount != 6 || summary.valid != 12) {
            std::cerr << "Expected 6 long and 6 short, got long=" << summary.longCount
                      << " short=" << summary.shortCount << " valid=" << summary.valid << "\n";
            return 1;
        }
        if (summary.longCount + summary.shortCount > k) {
            std::cerr << "long + short must not exceed the symbol count\n";
            return 1;
        }
        if (watchlist.countLong() != 6 || watchlist.countShort() != 6) {
            std::cerr << "Watchlist should hold 6 long and 6 short entries\n";
            return 1;
        }

        std::set<std::string> seen;
        for (const auto& result : summary.results) {
            if (!seen.insert(result.symbol).second) {
                std::cerr << "Duplicate result for " << result.symbol << "\n";
                return 1;
            }
            if (result.isLongValid && result.isShortValid) {
                std::cerr << result.symbol << " matched both scenarios\n";
                return 1;
            }
            if (result.symbol.rfind("LONG", 0) == 0 &&
                (!result.isLongValid || result.pattern != strategy::PatternVariant::Long2CandleReversal)) {
                std::cerr << result.symbol << " should be a Long2CandleReversal\n";
                return 1;
            }
            if (result.symbol.rfind("SHORT", 0) == 0 && !result.isShortValid) {
                std::cerr << result.symbol << " should be a Short setup\n";
                return 1;
            }
            const auto& snap = result.snapshot;
            if (result.isLongValid && !(snap.ema20 > snap.ema200 && snap.stochastic.crossover &&
                                        snap.macd.macd > snap.macd.signal)) {
                std::cerr << result.symbol << " should carry the Long indicator snapshot\n";
                return 1;
            }
            if (result.isShortValid && !(snap.ema20 < snap.ema200 && snap.stochastic.k > 70.0)) {
                std::cerr << result.symbol << " should carry the Short indicator snapshot\n";
                return 1;
            }
            if (result.symbol.rfind("FLAT", 0) == 0 &&
                (std::fabs(snap.ema20 - 50.0) > 1e-9 || snap.stochastic.k != 0.0 || snap.macd.macd != 0.0)) {
                std::cerr << result.symbol << " should carry the EMAs computed before the EMA gate stopped\n";
                return 1;
            }
            if (!result.success && snap.ema200 != 0.0) {
                std::cerr << result.symbol << " failed and should carry an empty snapshot\n";
                return 1;
            }
            if (result.symbol.rfind("FLAT", 0) == 0 &&
                (result.isValid || result.message != "No valid SAPAN setups detected")) {
                std::cerr << result.symbol << " should not match: " << result.message << "\n";
                return 1;
            }
        }

        for (const auto& symbol : symbols) {
            if (fetcher.callsFor(symbol) != 1) {
                std::cerr << symbol << " fetched " << fetcher.callsFor(symbol) << " times\n";
                return 1;
            }
        }
        if (fetcher.maxInFlight() > 3) {
            std::cerr << "At most 3 fetches should run at once, saw " << fetcher.maxInFlight() << "\n";
            return 1;
        }
        if (fetcher.lastLookback() != 300) {
            std::cerr << "Lookback should be forwarded to the fetcher\n";
            return 1;
        }
        if (progress.str().find("Progress: 20/20 (100.0%)") == std::string::npos) {
            std::cerr << "Progress reporter should end with a complete line, got: " << progress.str() << "\n";
            return 1;
        }
    }

    // Threads still running when an exception unwinds the group are joined, not terminated.
    {
        std::atomic<int> finished{0};
        std::size_t started = 0;
        try {
            app::ThreadGroup group;
            for (int i = 0; i < 4; ++i) {
                group.spawn([&finished]() {
                    std::this_thread::sleep_for(5ms);
                    finished.fetch_add(1);
                });
            }
            started = group.size();
            throw std::runtime_error("thread start failed");
        } catch (const std::runtime_error&) {
        }
        if (started != 4 || finished.load() != 4) {
            std::cerr << "ThreadGroup should join every thread during unwinding, finished=" << finished.load()
                      << "\n";
            return 1;
        }
    }

    // A symbol whose fetch fails yields one error result and no watchlist entry.
    {
        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        app::EvaluationPipeline pipeline(fetcher, validator, watchlist, fastOptions(2));
        const auto summary = pipeline.evaluate({"FAILX"});
        if (summary.processed != 1 || summary.errors != 1 || summary.success != 0 || summary.valid != 0) {
            std::cerr << "Failing symbol should produce exactly one error\n";
            return 1;
        }
        const auto& result = summary.results.front();
        if (result.success || result.symbol != "FAILX" || result.error.find("simulated") == std::string::npos) {
            std::cerr << "Failure result should carry the fetch error, got '" << result.error << "'\n";
            return 1;
        }
        if (watchlist.count() != 0) {
            std::cerr << "Failing symbol must not reach the watchlist\n";
            return 1;
        }
    }

    // Worker count is clamped to [1, 10].
    {
        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        app::EvaluationPipeline tooMany(fetcher, validator, watchlist, fastOptions(64));
        app::EvaluationPipeline tooFew(fetcher, validator, watchlist, fastOptions(0));
        if (tooMany.workerCount() != 10 || tooFew.workerCount() != 1) {
            std::cerr << "Worker count should clamp to [1,10], got " << tooMany.workerCount() << " and "
                      << tooFew.workerCount() << "\n";
            return 1;
        }

        std::vector<domain::Symbol> symbols;
        for (int i = 0; i < 3; ++i) {
            symbols.push_back("FLAT" + std::to_string(i));
        }
        const auto summary = tooFew.evaluate(symbols);
        if (summary.processed != 3 || fetcher.maxInFlight() != 1) {
            std::cerr << "Single worker should process sequentially\n";
            return 1;
        }
    }

    // Per-worker delay: two symbols on one worker take at least one delay.
    {
        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        auto options = fastOptions(1);
        options.requestDelay = 40ms;
        app::EvaluationPipeline pipeline(fetcher, validator, watchlist, options);
        const auto started = std::chrono::steady_clock::now();
        const auto summary = pipeline.evaluate({"FLAT0", "FLAT1"});
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (summary.processed != 2 || elapsed < 40ms) {
            std::cerr << "Request delay should be applied between symbols\n";
            return 1;
        }
    }

    // Indicator values reach the log: Info for a match, Debug for both verdicts otherwise.
    {
        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        app::EvaluationPipeline pipeline(fetcher, validator, watchlist, fastOptions(1));
        std::ostringstream captured;
        sapan::log::setConsoleStream(&captured);
        sapan::log::setLevel(sapan::log::Level::Debug);
        const auto summary = pipeline.evaluate({"LONGLOG", "FLATLOG"});
        sapan::log::setLevel(sapan::log::Level::Error);
        sapan::log::setConsoleStream(nullptr);

        const auto text = captured.str();
        if (summary.processed != 2 ||
            text.find("[INFO]") == std::string::npos ||
            text.find("LONGLOG: All SAPAN long strategy conditions met (Long2CandleReversal) ema20=") ==
                std::string::npos ||
            text.find("[DEBUG]") == std::string::npos ||
            text.find("FLATLOG: No valid SAPAN setups detected [long: EMA trend not in uptrend order") ==
                std::string::npos ||
            text.find("ema20=50.00 ema50=50.00") == std::string::npos || text.find("cross=yes") == std::string::npos) {
            std::cerr << "Log should carry the indicator snapshot, got:\n" << text << "\n";
            return 1;
        }
    }

    // Empty input returns immediately.
    {
        FixtureFetcher fetcher;
        app::WatchlistStore watchlist;
        app::EvaluationPipeline pipeline(fetcher, validator, watchlist, fastOptions(4));
        const auto summary = pipeline.evaluate({});
        if (summary.total != 0 || summary.processed != 0 || !summary.results.empty()) {
            std::cerr << "Empty symbol list should produce an empty summary\n";
            return 1;
        }
    }

    return 0;
}
