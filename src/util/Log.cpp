#include "util/Log.hpp"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace autogrow::util {

static LogLevel level_from_env() {
  const char* v = std::getenv("AUTOGROW_LOG_LEVEL");
  if (!v || !*v) return LogLevel::Info;
  return parse_log_level(v, LogLevel::Info);
}

static LogLevel g_level = level_from_env();
static LogSink g_sink;

static const char* level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARNING";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string& name, LogLevel def) {
  std::string s = name;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return def;
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void set_log_sink(LogSink sink) { g_sink = std::move(sink); }

static void vlog_line(LogLevel level, const char* component, const char* fmt, va_list ap) {
  if (static_cast<int>(level) < static_cast<int>(g_level)) return;

  char msg[2048];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);

  auto now_t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  char line[2200];
  std::snprintf(line, sizeof(line), "%s - %s - autogrow: %s: %s", ts, level_name(level), component, msg);

  if (g_sink) {
    g_sink(level, line);
    return;
  }
  std::fprintf(stderr, "%s\n", line);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_line(LogLevel::Debug, component, fmt, ap);
  va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_line(LogLevel::Info, component, fmt, ap);
  va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_line(LogLevel::Warn, component, fmt, ap);
  va_end(ap);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_line(LogLevel::Error, component, fmt, ap);
  va_end(ap);
}

} // namespace autogrow::util
