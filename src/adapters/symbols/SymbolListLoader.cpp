#include "adapters/symbols/SymbolListLoader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include <boost/json.hpp>

#include "common/Log.hpp"

namespace adapters::symbols {
namespace {

std::string normalizeSymbol(std::string value) {
    auto notSpace = [](unsigned char ch) { return std::isspace(ch) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string optionalString(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    return std::string{value->as_string().c_str()};
}

}  // namespace

std::vector<domain::Stock> SymbolListLoader::loadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Cannot open stocks file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw std::runtime_error("Failed to read stocks file: " + path);
    }

    auto stocks = parse(buffer.str());
    LOG_INFO("Loaded " << stocks.size() << " stocks from " << path);
    return stocks;
}

std::vector<domain::Stock> SymbolListLoader::parse(const std::string& json) {
    boost::json::value root;
    try {
        root = boost::json::parse(json);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse stocks JSON: "} + ex.what());
    }

    const auto* rootObject = root.if_object();
    const auto* list = rootObject != nullptr ? rootObject->if_contains("Stocks") : nullptr;
    if (list == nullptr || !list->is_array()) {
        throw std::runtime_error("Stocks JSON is missing the \"Stocks\" array");
    }

    std::vector<domain::Stock> stocks;
    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& item : list->as_array()) {
        ++index;
        if (!item.is_object()) {
            LOG_WARN("Stocks entry #" << index << " is not an object, skipping");
            continue;
        }
        const auto& fields = item.as_object();

        domain::Stock stock;
        stock.symbol = normalizeSymbol(optionalString(fields, "symbol"));
        if (stock.symbol.empty()) {
            LOG_WARN("Stocks entry #" << index << " has no symbol, skipping");
            continue;
        }
        if (!seen.insert(stock.symbol).second) {
            LOG_DEBUG("Duplicate stock symbol " << stock.symbol << " ignored");
            continue;
        }
        stock.name = optionalString(fields, "name");
        stock.sector = optionalString(fields, "sector");
        stock.industry = optionalString(fields, "industry");
        stocks.push_back(std::move(stock));
    }
    return stocks;
}

std::vector<domain::Symbol> SymbolListLoader::symbolsOf(const std::vector<domain::Stock>& stocks) {
    std::vector<domain::Symbol> symbols;
    symbols.reserve(stocks.size());
    for (const auto& stock : stocks) {
        symbols.push_back(stock.symbol);
    }
    return symbols;
}

}  // namespace adapters::symbols
