#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace hostscope::util {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

// Process-wide threshold. Initialized from HOSTSCOPE_LOG_LEVEL (default warn).
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel defv);
[[nodiscard]] const char* log_level_name(LogLevel level);

// Replace the stderr writer (tests capture lines through this). Pass an empty
// function to restore stderr.
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

// printf-style; writes "hostscope: [level] message" when level passes the threshold.
void log_write(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace hostscope::util
