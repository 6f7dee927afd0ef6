#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "domain/IHistoryFetcher.hpp"
#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"
#include "strategy/PatternDetector.h"
#include "strategy/ScenarioValidator.h"

namespace app {

class WatchlistStore;

struct EvaluationResult {
    domain::Symbol symbol;
    bool success = false;  // false when fetch or validation threw
    std::string error;
    bool isValid = false;
    bool isLongValid = false;
    bool isShortValid = false;
    strategy::PatternVariant pattern = strategy::PatternVariant::None;
    std::string message;
    // Indicators of the matching verdict, or of the Long verdict when nothing matched.
    indicators::IndicatorSnapshot snapshot;
};

struct EvaluationSummary {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t success = 0;
    std::size_t errors = 0;
    std::size_t valid = 0;
    std::size_t longCount = 0;
    std::size_t shortCount = 0;
    std::chrono::milliseconds elapsed{0};
    // Completion order, one entry per input symbol.
    std::vector<EvaluationResult> results;
};

// Fixed worker pool over a task queue and a result queue, both sized to the symbol list.
// Each worker fetches, validates Long then (only if Long failed) Short, records matches,
// and sleeps requestDelay before taking the next symbol.
class EvaluationPipeline {
public:
    struct Options {
        int workers = 5;
        std::chrono::milliseconds requestDelay{2000};
        int lookbackDays = 300;
        std::chrono::milliseconds progressInterval{1000};
        std::ostream* progress = nullptr;  // live progress line, disabled when null
    };

    static constexpr int kMinWorkers = 1;
    static constexpr int kMaxWorkers = 10;

    EvaluationPipeline(domain::IHistoryFetcher& fetcher,
                       const strategy::ScenarioValidator& validator,
                       WatchlistStore& watchlist,
                       Options options);

    // Blocks until every symbol has produced a result.
    EvaluationSummary evaluate(const std::vector<domain::Symbol>& symbols);

    int workerCount() const noexcept { return workers_; }

private:
    EvaluationResult evaluateSymbol_(const domain::Symbol& symbol);

    domain::IHistoryFetcher& fetcher_;
    const strategy::ScenarioValidator& validator_;
    WatchlistStore& watchlist_;
    Options options_;
    int workers_;
};

}  // namespace app
