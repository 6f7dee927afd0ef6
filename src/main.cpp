#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "adapters/alphavantage/AlphaVantageClient.hpp"
#include "adapters/symbols/SymbolListLoader.hpp"
#include "app/EvaluationPipeline.hpp"
#include "app/WatchlistStore.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "strategy/ScenarioValidator.h"

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &raw);
#else
    localtime_r(&raw, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void printWatchlist(const char* title, const std::vector<app::WatchlistEntry>& entries) {
    std::cout << '\n' << title << " (" << entries.size() << ")\n";
    if (entries.empty()) {
        std::cout << "  no setups found\n";
        return;
    }
    for (const auto& entry : entries) {
        std::cout << "  " << formatTimestamp(entry.timestamp) << "  " << entry.symbol << '\n';
    }
}

void printSummary(const app::EvaluationSummary& summary) {
    std::cout << "\nProcessing summary\n"
              << "  Total symbols:      " << summary.total << '\n'
              << "  Processed:          " << summary.processed << '\n'
              << "  Successful:         " << summary.success << '\n'
              << "  Errors:             " << summary.errors << '\n'
              << "  Valid SAPAN setups: " << summary.valid << '\n'
              << "  Long setups:        " << summary.longCount << '\n'
              << "  Short setups:       " << summary.shortCount << '\n'
              << "  Elapsed:            " << std::fixed << std::setprecision(1)
              << static_cast<double>(summary.elapsed.count()) / 1000.0 << "s\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    sapan::common::Config config;
    std::vector<domain::Symbol> symbols;
    try {
        config = sapan::common::Config::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << sapan::common::Config::usage();
            return EXIT_SUCCESS;
        }

        sapan::log::setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            sapan::log::setLogFile(config.logFile);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  API URL: " << config.apiUrl);
        LOG_INFO("  Workers: " << config.optimalWorkerCount() << " (requested " << config.workerCount << ")");
        LOG_INFO("  Request delay: " << config.requestDelay.count() << " s");
        LOG_INFO("  Lookback: " << config.outputSize << " days");
        LOG_INFO("  Log level: " << sapan::log::levelToString(config.logLevel));

        if (!config.symbols.empty()) {
            symbols = config.symbols;
            LOG_INFO("  Symbols: " << symbols.size() << " from --symbols");
        } else {
            const auto stocks = adapters::symbols::SymbolListLoader::loadFile(config.stocksFile);
            symbols = adapters::symbols::SymbolListLoader::symbolsOf(stocks);
        }
    } catch (const std::exception& ex) {
        LOG_ERR("Startup failed: " << ex.what());
        std::cerr << sapan::common::Config::usage();
        return EXIT_FAILURE;
    }

    try {
        adapters::alphavantage::AlphaVantageClient client(config.apiKey, config.apiUrl, config.httpTimeoutSec);
        strategy::ScenarioValidator validator;
        app::WatchlistStore watchlist;

        app::EvaluationPipeline::Options options;
        options.workers = static_cast<int>(config.optimalWorkerCount());
        options.requestDelay = std::chrono::duration_cast<std::chrono::milliseconds>(config.requestDelay);
        options.lookbackDays = config.outputSize;
        options.progressInterval = config.progressInterval;
        options.progress = &std::cout;

        app::EvaluationPipeline pipeline(client, validator, watchlist, options);
        const auto summary = pipeline.evaluate(symbols);

        printSummary(summary);
        printWatchlist("Long watchlist", watchlist.getLong());
        printWatchlist("Short watchlist", watchlist.getShort());
    } catch (const std::exception& ex) {
        LOG_ERR("Run failed: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
