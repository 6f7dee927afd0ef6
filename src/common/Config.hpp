#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace sapan::common {

struct Config {
    std::string apiKey;
    std::string apiUrl = "https://www.alphavantage.co/query";
    int workerCount = 5;
    std::chrono::seconds requestDelay{2};
    std::string stocksFile = "dist/Stocks.json";
    int outputSize = 300;
    int httpTimeoutSec = 20;
    std::chrono::milliseconds progressInterval{1000};
    sapan::log::Level logLevel = sapan::log::Level::Info;
    std::string logFile;
    std::vector<std::string> symbols{};
    bool showHelp = false;

    // Worker count clamped to [1, 10] so a misconfigured run cannot flood the data provider.
    std::size_t optimalWorkerCount() const noexcept;

    static Config fromArgs(int argc, char** argv);
    static const char* usage() noexcept;
};

}  // namespace sapan::common
