#include "common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sapan::log {
namespace {

std::atomic<Level> g_level{Level::Info};

// Everything a line is written to, guarded by one mutex so lines never interleave.
struct Outputs {
    std::mutex mutex;
    std::ofstream file;
    std::ostream* console = nullptr;
};

Outputs& outputs() {
    static Outputs instance;
    return instance;
}

std::ostream& consoleFor(const Outputs& out, Level level) {
    if (out.console != nullptr) {
        return *out.console;
    }
    return level >= Level::Warn ? std::cerr : std::cout;
}

// "YYYY-MM-DD HH:MM:SS.mmm" in local time.
std::string timestamp(std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

const std::pair<std::string_view, Level> kLevelNames[] = {
    {"debug", Level::Debug}, {"info", Level::Info},   {"warn", Level::Warn},
    {"warning", Level::Warn}, {"err", Level::Error}, {"error", Level::Error},
};

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept { return level >= getLevel(); }

void setLogFile(const std::string& path) {
    auto& out = outputs();
    std::lock_guard<std::mutex> lock(out.mutex);
    if (out.file.is_open()) {
        out.file.close();
    }
    if (path.empty()) {
        return;
    }
    out.file.open(path, std::ios::out | std::ios::app);
    if (!out.file) {
        throw std::runtime_error("Cannot open log file: " + path);
    }
}

void setConsoleStream(std::ostream* stream) noexcept {
    auto& out = outputs();
    std::lock_guard<std::mutex> lock(out.mutex);
    out.console = stream;
}

void log(Level level, const std::string& message) {
    std::ostringstream line;
    line << '[' << timestamp(std::chrono::system_clock::now()) << "] [" << levelToString(level) << "] [thread "
         << std::this_thread::get_id() << "] " << message << '\n';
    const auto text = line.str();

    auto& out = outputs();
    std::lock_guard<std::mutex> lock(out.mutex);
    consoleFor(out, level) << text << std::flush;
    if (out.file.is_open()) {
        out.file << text << std::flush;
    }
}

const char* levelToString(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    for (const auto& [name, level] : kLevelNames) {
        if (lower == name) {
            return level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace sapan::log
