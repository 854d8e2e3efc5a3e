#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cardforge::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
std::optional<LogLevel> parseLogLevel(std::string_view text);
void log(LogLevel level, const std::string& message);

} // namespace cardforge::util
