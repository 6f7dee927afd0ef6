#include "app/WatchlistStore.hpp"

#include <mutex>

#include "common/Log.hpp"

namespace app {

void WatchlistStore::addLong(const domain::Symbol& symbol) {
    add(symbol, strategy::Scenario::Long);
}

void WatchlistStore::addShort(const domain::Symbol& symbol) {
    add(symbol, strategy::Scenario::Short);
}

void WatchlistStore::add(const domain::Symbol& symbol, strategy::Scenario scenario) {
    const auto now = Clock::now();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& target = scenario == strategy::Scenario::Long ? long_ : short_;
        target.emplace(now, symbol);
    }
    LOG_INFO("Watchlist: added " << symbol << " to " << strategy::toString(scenario) << " watchlist");
}

std::vector<WatchlistEntry> WatchlistStore::getLong() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return copyOf_(long_, strategy::Scenario::Long);
}

std::vector<WatchlistEntry> WatchlistStore::getShort() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return copyOf_(short_, strategy::Scenario::Short);
}

std::size_t WatchlistStore::countLong() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return long_.size();
}

std::size_t WatchlistStore::countShort() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return short_.size();
}

std::size_t WatchlistStore::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return long_.size() + short_.size();
}

std::vector<WatchlistEntry> WatchlistStore::copyOf_(const Collection& collection, strategy::Scenario scenario) {
    std::vector<WatchlistEntry> entries;
    entries.reserve(collection.size());
    for (const auto& [timestamp, symbol] : collection) {
        entries.push_back(WatchlistEntry{timestamp, symbol, scenario});
    }
    return entries;
}

}  // namespace app
