#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace app {

struct ProgressState {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t valid = 0;
    std::size_t errors = 0;

    // 100 for an empty run.
    double percent() const noexcept {
        return total == 0 ? 100.0 : static_cast<double>(processed) * 100.0 / static_cast<double>(total);
    }
};

// Lock-free run counters. Workers call update(); any thread may read.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::size_t total);

    // Counts one processed symbol. A failed fetch counts as an error, never as valid.
    void update(bool success, bool valid) noexcept;

    ProgressState snapshot() const noexcept;
    bool isComplete() const noexcept;
    std::chrono::seconds elapsed() const noexcept;

    // "Progress: p/t (x.y%) | Valid: v | Errors: e | Elapsed: Ns"
    std::string render() const;

    std::size_t total() const noexcept { return total_; }

private:
    const std::size_t total_;
    const Clock::time_point start_;
    std::atomic<std::size_t> processed_{0};
    std::atomic<std::size_t> valid_{0};
    std::atomic<std::size_t> errors_{0};
};

}  // namespace app
