#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace app {

// Owns a set of threads and joins whatever is still joinable on destruction, so an exception
// thrown while threads are running unwinds without std::terminate.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

}  // namespace app
