#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "domain/Types.h"

namespace domain {

class FetchError : public std::runtime_error {
public:
    FetchError(Symbol symbol, const std::string& message)
        : std::runtime_error(message), symbol_(std::move(symbol)) {}

    const Symbol& symbol() const noexcept { return symbol_; }

private:
    Symbol symbol_;
};

class IHistoryFetcher {
public:
    virtual ~IHistoryFetcher() = default;

    // Returns at most lookbackDays daily candles, oldest first. Throws FetchError.
    virtual CandleHistory fetchHistory(const Symbol& symbol, int lookbackDays) = 0;
};

}  // namespace domain
