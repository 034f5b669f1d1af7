#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ldaproute::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);

// Reads LDAPROUTE_LOG_LEVEL, falls back when unset or unrecognized.
void initLoggingFromEnvironment(LogLevel fallback);

std::optional<LogLevel> parseLogLevel(std::string_view text);

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace ldaproute::util
