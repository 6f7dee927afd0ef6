#include "app/EvaluationPipeline.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "app/BoundedQueue.hpp"
#include "app/ProgressTracker.hpp"
#include "app/ThreadGroup.hpp"
#include "app/WatchlistStore.hpp"
#include "common/Log.hpp"

namespace app {
namespace {

const char* const kNoSetupMessage = "No valid SAPAN setups detected";

std::string describe(const indicators::IndicatorSnapshot& snap) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << "ema20=" << snap.ema20 << " ema50=" << snap.ema50
        << " ema100=" << snap.ema100 << " ema200=" << snap.ema200 << " k=" << snap.stochastic.k
        << " d=" << snap.stochastic.d << " cross=" << (snap.stochastic.crossover ? "yes" : "no")
        << " macd=" << snap.macd.macd << " signal=" << snap.macd.signal << " hist=" << snap.macd.histogram;
    return out.str();
}

}  // namespace

EvaluationPipeline::EvaluationPipeline(domain::IHistoryFetcher& fetcher,
                                       const strategy::ScenarioValidator& validator,
                                       WatchlistStore& watchlist,
                                       Options options)
    : fetcher_(fetcher),
      validator_(validator),
      watchlist_(watchlist),
      options_(std::move(options)),
      workers_(std::clamp(options_.workers, kMinWorkers, kMaxWorkers)) {
    if (options_.requestDelay.count() < 0) {
        options_.requestDelay = std::chrono::milliseconds{0};
    }
    if (options_.progressInterval.count() <= 0) {
        options_.progressInterval = std::chrono::milliseconds{1000};
    }
}

EvaluationSummary EvaluationPipeline::evaluate(const std::vector<domain::Symbol>& symbols) {
    const auto started = std::chrono::steady_clock::now();
    EvaluationSummary summary;
    summary.total = symbols.size();
    if (symbols.empty()) {
        LOG_WARN("Pipeline: no symbols to evaluate");
        return summary;
    }

    LOG_INFO("Pipeline: evaluating " << symbols.size() << " symbols with " << workers_ << " workers, delay "
                                     << options_.requestDelay.count() << "ms");

    BoundedQueue<domain::Symbol> tasks(symbols.size());
    BoundedQueue<EvaluationResult> results(symbols.size());
    ProgressTracker tracker(symbols.size());

    // Capacity equals the symbol count, so this never blocks.
    for (const auto& symbol : symbols) {
        if (!tasks.push(symbol)) {
            throw std::logic_error("Pipeline: task queue closed while enqueueing");
        }
    }
    tasks.close();

    std::mutex reporterMutex;
    std::condition_variable reporterCv;
    bool reporterStop = false;
    auto stopReporter = [&]() {
        {
            std::lock_guard<std::mutex> lock(reporterMutex);
            reporterStop = true;
        }
        reporterCv.notify_all();
    };

    ThreadGroup reporter;
    if (options_.progress != nullptr) {
        reporter.spawn([&]() {
            std::unique_lock<std::mutex> lock(reporterMutex);
            while (!reporterStop && !tracker.isComplete()) {
                *options_.progress << '\r' << tracker.render() << std::flush;
                reporterCv.wait_for(lock, options_.progressInterval, [&]() { return reporterStop; });
            }
            *options_.progress << '\r' << tracker.render() << std::endl;
        });
    }

    std::atomic<bool> cancelled{false};
    ThreadGroup workers;
    std::thread completion;
    try {
        for (int id = 0; id < workers_; ++id) {
            workers.spawn([this, id, &tasks, &results, &tracker, &cancelled]() {
                LOG_DEBUG("Pipeline: worker " << id << " started");
                while (!cancelled.load(std::memory_order_relaxed)) {
                    auto symbol = tasks.pop();
                    if (!symbol) {
                        break;
                    }
                    auto result = evaluateSymbol_(*symbol);
                    const bool success = result.success;
                    const bool valid = result.isValid;
                    if (!results.push(std::move(result))) {
                        LOG_ERR("Pipeline: result queue closed, dropping result for " << *symbol);
                    }
                    tracker.update(success, valid);

                    if (options_.requestDelay.count() > 0) {
                        std::this_thread::sleep_for(options_.requestDelay);
                    }
                }
                LOG_DEBUG("Pipeline: worker " << id << " finished");
            });
        }

        completion = std::thread([&workers, &results]() {
            workers.joinAll();
            results.close();
        });
    } catch (const std::exception& ex) {
        LOG_ERR("Pipeline: failed to start threads after " << workers.size() << " workers: " << ex.what());
        cancelled.store(true, std::memory_order_relaxed);
        workers.joinAll();
        stopReporter();
        reporter.joinAll();
        throw;
    }

    while (auto result = results.pop()) {
        ++summary.processed;
        if (result->success) {
            ++summary.success;
            if (result->isValid) {
                ++summary.valid;
            }
            if (result->isLongValid) {
                ++summary.longCount;
            }
            if (result->isShortValid) {
                ++summary.shortCount;
            }
        } else {
            ++summary.errors;
        }
        summary.results.push_back(std::move(*result));
    }

    completion.join();
    stopReporter();
    reporter.joinAll();

    summary.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    LOG_INFO("Pipeline: processed=" << summary.processed << " success=" << summary.success
                                    << " errors=" << summary.errors << " valid=" << summary.valid
                                    << " long=" << summary.longCount << " short=" << summary.shortCount
                                    << " elapsed=" << summary.elapsed.count() << "ms");
    return summary;
}

EvaluationResult EvaluationPipeline::evaluateSymbol_(const domain::Symbol& symbol) {
    EvaluationResult result;
    result.symbol = symbol;

    try {
        const auto candles = fetcher_.fetchHistory(symbol, options_.lookbackDays);

        const auto longVerdict = validator_.validateLong(symbol, candles);
        result.success = true;
        if (longVerdict.isValid) {
            result.isValid = true;
            result.isLongValid = true;
            result.pattern = longVerdict.pattern;
            result.message = longVerdict.message;
            result.snapshot = longVerdict.snapshot;
            watchlist_.addLong(symbol);
            LOG_INFO(symbol << ": " << result.message << " (" << strategy::toString(result.pattern) << ") "
                            << describe(result.snapshot));
            return result;
        }

        const auto shortVerdict = validator_.validateShort(symbol, candles);
        if (shortVerdict.isValid) {
            result.isValid = true;
            result.isShortValid = true;
            result.pattern = shortVerdict.pattern;
            result.message = shortVerdict.message;
            result.snapshot = shortVerdict.snapshot;
            watchlist_.addShort(symbol);
            LOG_INFO(symbol << ": " << result.message << " (" << strategy::toString(result.pattern) << ") "
                            << describe(result.snapshot));
            return result;
        }

        result.message = kNoSetupMessage;
        result.snapshot = longVerdict.snapshot;
        LOG_DEBUG(symbol << ": " << kNoSetupMessage << " [long: " << longVerdict.message << " | "
                         << describe(longVerdict.snapshot) << "] [short: " << shortVerdict.message << " | "
                         << describe(shortVerdict.snapshot) << "]");
    } catch (const std::exception& ex) {
        result = EvaluationResult{};
        result.symbol = symbol;
        result.success = false;
        result.error = ex.what();
        LOG_WARN("Pipeline: failed to evaluate " << symbol << ": " << ex.what());
    }
    return result;
}

}  // namespace app
