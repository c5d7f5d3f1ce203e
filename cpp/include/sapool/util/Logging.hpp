#pragma once

#include <string>
#include <string_view>

namespace sapool::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();

// 未识别的名称返回 fallback
LogLevel parseLogLevel(std::string_view name, LogLevel fallback = LogLevel::info);
const char* toString(LogLevel level);

void log(LogLevel level, const std::string& message);

} // namespace sapool::util
