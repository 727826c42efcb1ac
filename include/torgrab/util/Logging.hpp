#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace torgrab::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

// Lines below `level` are discarded. Safe to call while other threads log.
void initLogging(LogLevel level);
void log(LogLevel level, const std::string& message);

const char* toString(LogLevel level) noexcept;

// Accepts the level names case-insensitively ("warn" and "warning" both map to warn).
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace torgrab::util
