#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/symbols/SymbolListLoader.hpp"
#include "common/Log.hpp"

using adapters::symbols::SymbolListLoader;

int main() {
    sapan::log::setLevel(sapan::log::Level::Error);

    // Entries are normalized and de-duplicated in first-seen order.
    {
        const auto stocks = SymbolListLoader::parse(R"({
            "Stocks": [
                {"symbol": "aapl", "name": "Apple Inc.", "sector": "Technology", "industry": "Consumer Electronics"},
                {"symbol": " msft ", "name": "Microsoft"},
                {"name": "No Symbol"},
                {"symbol": "AAPL", "name": "Duplicate"},
                42,
                {"symbol": "tsla"}
            ]
        })");
        const auto symbols = SymbolListLoader::symbolsOf(stocks);
        const std::vector<std::string> expected{"AAPL", "MSFT", "TSLA"};
        if (symbols != expected) {
            std::cerr << "Unexpected symbols (" << symbols.size() << ")\n";
            return 1;
        }
        if (stocks[0].name != "Apple Inc." || stocks[0].sector != "Technology" ||
            stocks[0].industry != "Consumer Electronics" || !stocks[2].sector.empty()) {
            std::cerr << "Stock metadata mismatch\n";
            return 1;
        }
    }

    // Malformed documents.
    {
        const std::vector<std::string> bad{R"({"stocks": []})", R"({"Stocks": {}})", "[1,2,3]", "{not json"};
        for (const auto& doc : bad) {
            try {
                SymbolListLoader::parse(doc);
                std::cerr << "Expected failure for: " << doc << "\n";
                return 1;
            } catch (const std::runtime_error&) {
            }
        }
    }

    // File round trip and missing file.
    {
        const auto path = std::filesystem::temp_directory_path() / "sapan_test_stocks.json";
        {
            std::ofstream out(path);
            out << R"({"Stocks":[{"symbol":"IBM","name":"IBM"},{"symbol":"ko","name":"Coca-Cola"}]})";
        }
        const auto stocks = SymbolListLoader::loadFile(path.string());
        std::filesystem::remove(path);
        if (stocks.size() != 2 || stocks[1].symbol != "KO") {
            std::cerr << "loadFile should parse the written file\n";
            return 1;
        }

        try {
            SymbolListLoader::loadFile((std::filesystem::temp_directory_path() / "sapan_missing.json").string());
            std::cerr << "Missing file should throw\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    return 0;
}
