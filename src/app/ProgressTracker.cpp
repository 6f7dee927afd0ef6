#include "app/ProgressTracker.hpp"

#include <iomanip>
#include <sstream>

namespace app {

ProgressTracker::ProgressTracker(std::size_t total) : total_(total), start_(Clock::now()) {}

void ProgressTracker::update(bool success, bool valid) noexcept {
    if (!success) {
        errors_.fetch_add(1, std::memory_order_relaxed);
    } else if (valid) {
        valid_.fetch_add(1, std::memory_order_relaxed);
    }
    processed_.fetch_add(1, std::memory_order_acq_rel);
}

ProgressState ProgressTracker::snapshot() const noexcept {
    ProgressState state;
    state.total = total_;
    state.processed = processed_.load(std::memory_order_acquire);
    state.valid = valid_.load(std::memory_order_relaxed);
    state.errors = errors_.load(std::memory_order_relaxed);
    return state;
}

bool ProgressTracker::isComplete() const noexcept {
    return processed_.load(std::memory_order_acquire) >= total_;
}

std::chrono::seconds ProgressTracker::elapsed() const noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start_);
}

std::string ProgressTracker::render() const {
    const auto state = snapshot();
    std::ostringstream out;
    out << "Progress: " << state.processed << '/' << state.total << " (" << std::fixed << std::setprecision(1)
        << state.percent() << "%) | Valid: " << state.valid << " | Errors: " << state.errors
        << " | Elapsed: " << elapsed().count() << 's';
    return out.str();
}

}  // namespace app
