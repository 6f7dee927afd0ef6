#pragma once

#include <string>

#include "domain/IHistoryFetcher.hpp"

namespace adapters::alphavantage {

// TIME_SERIES_DAILY over HTTPS. One request per call, no retries.
class AlphaVantageClient : public domain::IHistoryFetcher {
public:
    AlphaVantageClient(std::string apiKey, std::string apiUrl, int timeoutSec = 20);
    ~AlphaVantageClient() override = default;

    domain::CandleHistory fetchHistory(const domain::Symbol& symbol, int lookbackDays) override;

    // Request target for the configured endpoint, API key included.
    std::string buildTarget(const domain::Symbol& symbol, int lookbackDays) const;

    // Parses a TIME_SERIES_DAILY body into ascending candles, keeping the newest lookbackDays.
    // Throws domain::FetchError for rate-limit notes, API errors and bodies without a series.
    static domain::CandleHistory parseDailySeries(const std::string& body,
                                                  const domain::Symbol& symbol,
                                                  int lookbackDays);

    // outputsize=compact returns the latest 100 bars, anything longer needs full.
    static const char* outputSizeFor(int lookbackDays) noexcept;

    static constexpr int kCompactBars = 100;

private:
    std::string apiKey_;
    std::string apiUrl_;
    int timeoutSec_;
};

}  // namespace adapters::alphavantage
