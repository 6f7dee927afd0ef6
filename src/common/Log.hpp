#pragma once

#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>

namespace sapan::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;

// Mirrors every emitted line into `path` (appending). An empty path closes the sink.
void setLogFile(const std::string& path);

// Sends console output to `stream` instead of stdout/stderr. Null restores the console.
void setConsoleStream(std::ostream* stream) noexcept;

void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace sapan::log

#define SAPAN_LOG_IMPL(level, expr)                         \
    do {                                                    \
        if (::sapan::log::shouldLog(level)) {               \
            std::ostringstream sapan_log_line__;            \
            sapan_log_line__ << expr;                       \
            ::sapan::log::log(level, sapan_log_line__.str()); \
        }                                                   \
    } while (false)

#define LOG_DEBUG(expr) SAPAN_LOG_IMPL(::sapan::log::Level::Debug, expr)
#define LOG_INFO(expr) SAPAN_LOG_IMPL(::sapan::log::Level::Info, expr)
#define LOG_WARN(expr) SAPAN_LOG_IMPL(::sapan::log::Level::Warn, expr)
#define LOG_ERR(expr) SAPAN_LOG_IMPL(::sapan::log::Level::Error, expr)
