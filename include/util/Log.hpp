#pragma once
#include <functional>
#include <string>

namespace autogrow::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Receives fully formatted lines (no trailing newline)
using LogSink = std::function<void(LogLevel, const std::string&)>;

// Lines below this level are dropped. Initialized from AUTOGROW_LOG_LEVEL.
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] LogLevel parse_log_level(const std::string& name, LogLevel def);

// Replace the stderr writer (tests). Passing an empty sink restores stderr.
void set_log_sink(LogSink sink);

// "YYYY-MM-DD HH:MM:SS - LEVEL - autogrow: <component>: <message>"
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace autogrow::util
