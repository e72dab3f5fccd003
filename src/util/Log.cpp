#include "util/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace hostscope::util {

static LogLevel initial_level() {
  const char* v = std::getenv("HOSTSCOPE_LOG_LEVEL");
  if (!v || !*v) return LogLevel::Warn;
  return parse_log_level(v, LogLevel::Warn);
}

static std::atomic<LogLevel>& level_ref() {
  static std::atomic<LogLevel> level{initial_level()};
  return level;
}

static std::mutex& sink_mu() {
  static std::mutex mu;
  return mu;
}

static LogSink& sink_ref() {
  static LogSink sink;
  return sink;
}

void set_log_level(LogLevel level) { level_ref().store(level, std::memory_order_relaxed); }

LogLevel log_level() { return level_ref().load(std::memory_order_relaxed); }

LogLevel parse_log_level(std::string_view name, LogLevel defv) {
  std::string s(name);
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  if (s == "debug" || s == "trace") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error" || s == "err") return LogLevel::Error;
  if (s == "off" || s == "none" || s == "quiet") return LogLevel::Off;
  return defv;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "?";
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(sink_mu());
  sink_ref() = std::move(sink);
}

static void vlog(LogLevel level, const char* fmt, va_list ap) {
  if (level == LogLevel::Off || level < log_level()) return;
  char buf[1024];
  int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  if (n < 0) return;
  std::lock_guard<std::mutex> lk(sink_mu());
  if (sink_ref()) {
    sink_ref()(level, std::string(buf));
    return;
  }
  std::fprintf(stderr, "hostscope: [%s] %s\n", log_level_name(level), buf);
}

void log_write(LogLevel level, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(level, fmt, ap);
  va_end(ap);
}

void log_debug(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Debug, fmt, ap);
  va_end(ap);
}

void log_info(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Info, fmt, ap);
  va_end(ap);
}

void log_warn(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Warn, fmt, ap);
  va_end(ap);
}

void log_error(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Error, fmt, ap);
  va_end(ap);
}

} // namespace hostscope::util
