#pragma once

#include <string>
#include <vector>

#include "domain/Types.h"

namespace adapters::symbols {

// Reads {"Stocks":[{"symbol","name","sector","industry"}, ...]}.
class SymbolListLoader {
public:
    // Throws std::runtime_error if the file cannot be read or has no "Stocks" array.
    static std::vector<domain::Stock> loadFile(const std::string& path);
    static std::vector<domain::Stock> parse(const std::string& json);

    static std::vector<domain::Symbol> symbolsOf(const std::vector<domain::Stock>& stocks);
};

}  // namespace adapters::symbols
