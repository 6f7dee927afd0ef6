#include "adapters/alphavantage/AlphaVantageClient.hpp"

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <exception>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::alphavantage {
namespace {

constexpr const char* kSeriesKey = "Time Series (Daily)";
constexpr std::int64_t kMillisPerSecond = 1000;

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::optional<domain::TimestampMs> parseDateToMs(const std::string& value) {
    if (value.size() != 10) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream input(value);
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (raw < 0) {
        return std::nullopt;
    }
    return static_cast<domain::TimestampMs>(raw) * kMillisPerSecond;
}

std::optional<std::string> stringField(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return std::string{value->as_string().c_str()};
}

std::optional<double> priceField(const boost::json::object& object, const char* key) {
    const auto text = stringField(object, key);
    if (!text) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(*text, &consumed);
        if (consumed != text->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> volumeField(const boost::json::object& object, const char* key) {
    const auto text = stringField(object, key);
    if (!text) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(*text, &consumed);
        if (consumed != text->size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<domain::Candle> parseRow(const std::string& date, const boost::json::value& row) {
    if (!row.is_object()) {
        return std::nullopt;
    }
    const auto& fields = row.as_object();

    const auto openTime = parseDateToMs(date);
    const auto open = priceField(fields, "1. open");
    const auto high = priceField(fields, "2. high");
    const auto low = priceField(fields, "3. low");
    const auto close = priceField(fields, "4. close");
    const auto volume = volumeField(fields, "5. volume");
    if (!openTime || !open || !high || !low || !close || !volume) {
        return std::nullopt;
    }

    domain::Candle candle;
    candle.openTime = *openTime;
    candle.open = *open;
    candle.high = *high;
    candle.low = *low;
    candle.close = *close;
    candle.volume = *volume;
    return candle;
}

}  // namespace

AlphaVantageClient::AlphaVantageClient(std::string apiKey, std::string apiUrl, int timeoutSec)
    : apiKey_(std::move(apiKey)), apiUrl_(std::move(apiUrl)), timeoutSec_(timeoutSec) {
    if (apiKey_.empty()) {
        throw std::invalid_argument("Alpha Vantage API key must not be empty");
    }
    // Fail at construction rather than on the first request.
    infra::http::parse_https_url(apiUrl_);
}

const char* AlphaVantageClient::outputSizeFor(int lookbackDays) noexcept {
    return lookbackDays > kCompactBars ? "full" : "compact";
}

std::string AlphaVantageClient::buildTarget(const domain::Symbol& symbol, int lookbackDays) const {
    auto url = infra::http::parse_https_url(apiUrl_);
    std::ostringstream target;
    target << url.target;
    target << (url.target.find('?') == std::string::npos ? '?' : '&');
    target << "function=TIME_SERIES_DAILY&symbol=" << infra::http::url_encode(symbol)
           << "&outputsize=" << outputSizeFor(lookbackDays) << "&apikey=" << infra::http::url_encode(apiKey_);
    return target.str();
}

domain::CandleHistory AlphaVantageClient::fetchHistory(const domain::Symbol& symbol, int lookbackDays) {
    if (lookbackDays <= 0) {
        throw domain::FetchError(symbol, "lookbackDays must be positive");
    }

    auto url = infra::http::parse_https_url(apiUrl_);
    url.target = buildTarget(symbol, lookbackDays);

    infra::http::HttpsRequestOptions options;
    options.timeout_sec = timeoutSec_;

    LOG_DEBUG("AlphaVantage: GET daily series for " << symbol << " outputsize=" << outputSizeFor(lookbackDays));

    std::string body;
    try {
        body = infra::http::https_get_body(url, options);
    } catch (const std::exception& ex) {
        throw domain::FetchError(symbol, std::string{"failed to fetch data: "} + ex.what());
    }

    auto candles = parseDailySeries(body, symbol, lookbackDays);
    LOG_DEBUG("AlphaVantage: " << symbol << " returned " << candles.size() << " candles");
    return candles;
}

domain::CandleHistory AlphaVantageClient::parseDailySeries(const std::string& body,
                                                           const domain::Symbol& symbol,
                                                           int lookbackDays) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw domain::FetchError(symbol, std::string{"failed to parse JSON: "} + ex.what());
    }
    if (!json.is_object()) {
        throw domain::FetchError(symbol, "invalid API response");
    }
    const auto& root = json.as_object();

    const auto* series = root.if_contains(kSeriesKey);
    if (series == nullptr || !series->is_object() || series->as_object().empty()) {
        if (auto note = stringField(root, "Note")) {
            throw domain::FetchError(symbol, "API rate limit: " + *note);
        }
        if (auto info = stringField(root, "Information")) {
            throw domain::FetchError(symbol, "API rate limit: " + *info);
        }
        if (auto error = stringField(root, "Error Message")) {
            throw domain::FetchError(symbol, "API error: " + *error);
        }
        throw domain::FetchError(symbol, "invalid API response");
    }

    domain::CandleHistory candles;
    candles.reserve(series->as_object().size());
    std::size_t skipped = 0;
    for (const auto& entry : series->as_object()) {
        const std::string date{entry.key()};
        if (auto candle = parseRow(date, entry.value())) {
            candles.push_back(*candle);
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        LOG_WARN("AlphaVantage: skipped " << skipped << " malformed rows for " << symbol);
    }
    if (candles.empty()) {
        throw domain::FetchError(symbol, "no valid candles in API response");
    }

    std::sort(candles.begin(), candles.end(), [](const domain::Candle& a, const domain::Candle& b) {
        return a.openTime < b.openTime;
    });
    candles.erase(std::unique(candles.begin(), candles.end(),
                              [](const domain::Candle& a, const domain::Candle& b) {
                                  return a.openTime == b.openTime;
                              }),
                  candles.end());

    if (lookbackDays > 0 && candles.size() > static_cast<std::size_t>(lookbackDays)) {
        candles.erase(candles.begin(), candles.end() - lookbackDays);
    }
    return candles;
}

}  // namespace adapters::alphavantage
