// Line-oriented stderr logging: "sysgraph: [<level>] <component>: <message>"
#pragma once
#include <string_view>

namespace sysgraph::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel lvl);

// Accepts error|warn|warning|info|debug (case-insensitive).
[[nodiscard]] bool parse_log_level(std::string_view s, LogLevel& out);

void log(LogLevel lvl, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace sysgraph::util

#define SYSGRAPH_LOG_ERROR(comp, ...) ::sysgraph::util::log(::sysgraph::util::LogLevel::Error, comp, __VA_ARGS__)
#define SYSGRAPH_LOG_WARN(comp, ...)  ::sysgraph::util::log(::sysgraph::util::LogLevel::Warn,  comp, __VA_ARGS__)
#define SYSGRAPH_LOG_INFO(comp, ...)  ::sysgraph::util::log(::sysgraph::util::LogLevel::Info,  comp, __VA_ARGS__)
#define SYSGRAPH_LOG_DEBUG(comp, ...) ::sysgraph::util::log(::sysgraph::util::LogLevel::Debug, comp, __VA_ARGS__)
