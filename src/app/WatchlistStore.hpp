#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <shared_mutex>
#include <vector>

#include "domain/Types.h"
#include "strategy/ScenarioValidator.h"

namespace app {

struct WatchlistEntry {
    std::chrono::system_clock::time_point timestamp;
    domain::Symbol symbol;
    strategy::Scenario scenario{strategy::Scenario::Long};
};

// Run-scoped record of matched symbols, one collection per scenario.
// Writers take the exclusive lock; readers take the shared lock and get a copy.
class WatchlistStore {
public:
    using Clock = std::chrono::system_clock;

    void addLong(const domain::Symbol& symbol);
    void addShort(const domain::Symbol& symbol);
    void add(const domain::Symbol& symbol, strategy::Scenario scenario);

    // Ordered by timestamp, insertion order among equal timestamps.
    std::vector<WatchlistEntry> getLong() const;
    std::vector<WatchlistEntry> getShort() const;

    std::size_t countLong() const;
    std::size_t countShort() const;
    std::size_t count() const;

private:
    using Collection = std::multimap<Clock::time_point, domain::Symbol>;

    static std::vector<WatchlistEntry> copyOf_(const Collection& collection, strategy::Scenario scenario);

    mutable std::shared_mutex mutex_;
    Collection long_;
    Collection short_;
};

}  // namespace app
