#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sapan::common {
namespace {

constexpr int kMinWorkers = 1;
constexpr int kMaxWorkers = 10;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

int parseInt(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stol(trim(value), &consumed);
        if (consumed != trim(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            throw std::out_of_range("int out of range");
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

int parsePositive(const std::string& value, const std::string& label) {
    const auto parsed = parseInt(value, label);
    if (parsed < 1) {
        throw std::runtime_error("Invalid value for " + label + " (must be >= 1): " + value);
    }
    return parsed;
}

std::chrono::seconds parseDelaySeconds(const std::string& value, const std::string& label) {
    const auto parsed = parseInt(value, label);
    if (parsed < 0) {
        throw std::runtime_error("Invalid value for " + label + " (must be >= 0): " + value);
    }
    return std::chrono::seconds(parsed);
}

std::vector<std::string> parseSymbolList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto symbol = toUpper(trim(item));
        if (symbol.empty()) {
            continue;
        }
        if (std::find(parts.begin(), parts.end(), symbol) == parts.end()) {
            parts.push_back(std::move(symbol));
        }
    }
    return parts;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

std::string envValue(const char* name) {
    const char* raw = std::getenv(name);
    return raw != nullptr ? trim(raw) : std::string{};
}

}  // namespace

std::size_t Config::optimalWorkerCount() const noexcept {
    return static_cast<std::size_t>(std::clamp(workerCount, kMinWorkers, kMaxWorkers));
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    config.showHelp = hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h");

    if (auto env = envValue("ALPHA_VANTAGE_API_KEY"); !env.empty()) {
        config.apiKey = env;
    }
    if (auto env = envValue("ALPHA_VANTAGE_API_URL"); !env.empty()) {
        config.apiUrl = env;
    }
    if (auto env = envValue("WORKER_COUNT"); !env.empty()) {
        config.workerCount = parseInt(env, "WORKER_COUNT");
    }
    if (auto env = envValue("REQUEST_DELAY_SECONDS"); !env.empty()) {
        config.requestDelay = parseDelaySeconds(env, "REQUEST_DELAY_SECONDS");
    }
    if (auto env = envValue("STOCKS_FILE"); !env.empty()) {
        config.stocksFile = env;
    }
    if (auto env = envValue("OUTPUT_SIZE"); !env.empty()) {
        config.outputSize = parsePositive(env, "OUTPUT_SIZE");
    }
    if (auto env = envValue("HTTP_TIMEOUT_SECONDS"); !env.empty()) {
        config.httpTimeoutSec = parsePositive(env, "HTTP_TIMEOUT_SECONDS");
    }
    if (auto env = envValue("LOG_LEVEL"); !env.empty()) {
        config.logLevel = sapan::log::levelFromString(toLower(env));
    }
    if (auto env = envValue("LOG_FILE"); !env.empty()) {
        config.logFile = env;
    }

    if (auto arg = valueFromArgs(argc, argv, "--api-key"); !arg.empty()) {
        config.apiKey = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--api-url"); !arg.empty()) {
        config.apiUrl = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--workers"); !arg.empty()) {
        config.workerCount = parseInt(arg, "--workers");
    }
    if (auto arg = valueFromArgs(argc, argv, "--request-delay"); !arg.empty()) {
        config.requestDelay = parseDelaySeconds(arg, "--request-delay");
    }
    if (auto arg = valueFromArgs(argc, argv, "--stocks"); !arg.empty()) {
        config.stocksFile = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--output-size"); !arg.empty()) {
        config.outputSize = parsePositive(arg, "--output-size");
    }
    if (auto arg = valueFromArgs(argc, argv, "--http-timeout"); !arg.empty()) {
        config.httpTimeoutSec = parsePositive(arg, "--http-timeout");
    }
    if (auto arg = valueFromArgs(argc, argv, "--log-level"); !arg.empty()) {
        config.logLevel = sapan::log::levelFromString(toLower(arg));
    }
    if (auto arg = valueFromArgs(argc, argv, "--log-file"); !arg.empty()) {
        config.logFile = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--symbols"); !arg.empty()) {
        config.symbols = parseSymbolList(arg);
    }

    if (config.apiKey.empty() && !config.showHelp) {
        throw std::runtime_error("ALPHA_VANTAGE_API_KEY environment variable (or --api-key) is required");
    }

    return config;
}

const char* Config::usage() noexcept {
    return "Usage: sapan [options]\n"
           "  --api-key KEY           Alpha Vantage API key (env ALPHA_VANTAGE_API_KEY)\n"
           "  --api-url URL           API endpoint (env ALPHA_VANTAGE_API_URL)\n"
           "  --workers N             concurrent workers, clamped to 1..10 (env WORKER_COUNT)\n"
           "  --request-delay SEC     per-worker pause between requests (env REQUEST_DELAY_SECONDS)\n"
           "  --stocks PATH           JSON stock list (env STOCKS_FILE)\n"
           "  --symbols A,B,C         evaluate these symbols instead of the stock list\n"
           "  --output-size DAYS      daily candles kept per symbol (env OUTPUT_SIZE)\n"
           "  --http-timeout SEC      per-request timeout (env HTTP_TIMEOUT_SECONDS)\n"
           "  --log-level LEVEL       debug|info|warn|error (env LOG_LEVEL)\n"
           "  --log-file PATH         also append log lines to PATH (env LOG_FILE)\n";
}

}  // namespace sapan::common
