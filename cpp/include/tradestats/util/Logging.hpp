#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tradestats::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
void log(LogLevel level, const std::string& message);

// Accepts the lower-case level names, case-insensitively. "warning" is an alias of warn.
std::optional<LogLevel> parseLogLevel(std::string_view text);
const char* toString(LogLevel level);

} // namespace tradestats::util
