#include "torgrab/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace torgrab::util {
namespace {

std::atomic<LogLevel> threshold{LogLevel::info};
std::mutex sinkMutex;

// "2024-05-01 12:00:00.123"
std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

} // namespace

const char* toString(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

void initLogging(LogLevel level) {
    threshold.store(level, std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    if (level < threshold.load(std::memory_order_relaxed)) {
        return;
    }

    std::ostringstream line;
    line << timestampNow() << " [" << toString(level) << "] [" << std::this_thread::get_id() << "] " << message
         << '\n';

    std::scoped_lock lock(sinkMutex);
    std::clog << line.str();
}

} // namespace torgrab::util
