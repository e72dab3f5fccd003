#include "minitest.hpp"
#include "util/Log.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace hostscope::util;

namespace {

// Captures lines for the lifetime of the guard and restores the level.
struct CaptureLog {
  std::vector<std::pair<LogLevel, std::string>> lines;
  LogLevel saved{log_level()};
  explicit CaptureLog(LogLevel level) {
    set_log_level(level);
    set_log_sink([this](LogLevel l, const std::string& msg) { lines.emplace_back(l, msg); });
  }
  ~CaptureLog() {
    set_log_sink({});
    set_log_level(saved);
  }
};

} // namespace

TEST(log_functions_respect_threshold) {
  CaptureLog cap(LogLevel::Warn);
  log_debug("cache %s", "hit");
  log_info("detected %d cards", 2);
  log_warn("gpu row %d: cannot parse %s", 3, "power");
  log_error("%s: fetch failed", "disks");
  ASSERT_EQ(cap.lines.size(), 2u);
  ASSERT_TRUE(cap.lines[0].first == LogLevel::Warn);
  ASSERT_EQ(cap.lines[0].second, "gpu row 3: cannot parse power");
  ASSERT_TRUE(cap.lines[1].first == LogLevel::Error);
  ASSERT_EQ(cap.lines[1].second, "disks: fetch failed");
}

TEST(log_off_silences_everything) {
  CaptureLog cap(LogLevel::Off);
  log_error("boom");
  log_write(LogLevel::Error, "boom %d", 2);
  ASSERT_TRUE(cap.lines.empty());
}

TEST(log_level_names_parse_case_insensitively) {
  ASSERT_TRUE(parse_log_level("DEBUG", LogLevel::Off) == LogLevel::Debug);
  ASSERT_TRUE(parse_log_level("Warning", LogLevel::Off) == LogLevel::Warn);
  ASSERT_TRUE(parse_log_level("ERR", LogLevel::Off) == LogLevel::Error);
  ASSERT_TRUE(parse_log_level("quiet", LogLevel::Debug) == LogLevel::Off);
  ASSERT_TRUE(parse_log_level("loud", LogLevel::Info) == LogLevel::Info);
  ASSERT_EQ(std::string(log_level_name(LogLevel::Warn)), "warn");
}
