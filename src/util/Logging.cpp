#include "ldaproute/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ldaproute::util {
namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

std::atomic<LogLevel>& globalLevel() {
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto secTp = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - secTp).count();

    std::time_t t = system_clock::to_time_t(secTp);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}
} // namespace

void initLogging(LogLevel level) {
    globalLevel().store(level);
}

void initLoggingFromEnvironment(LogLevel fallback) {
    LogLevel level = fallback;
    if (const char* value = std::getenv("LDAPROUTE_LOG_LEVEL")) {
        if (auto parsed = parseLogLevel(value)) {
            level = *parsed;
        }
    }
    initLogging(level);
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower(text);
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

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLevel().load());
}

void log(LogLevel level, const std::string& message) {
    if (!shouldLog(level)) return;

    const auto stamp = timestamp();
    std::lock_guard lk(logMutex());
    std::clog << stamp << " [" << toString(level) << "] " << message << '\n';
}

} // namespace ldaproute::util
