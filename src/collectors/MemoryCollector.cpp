#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace hostscope::collectors {

// "  123456 kB" -> bytes
static inline uint64_t parse_kb(std::string_view s) {
  uint64_t v = 0;
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v * 1024;
}

bool MemoryCollector::sample(hostscope::model::Memory& out) const {
  auto txt_opt = hostscope::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  hostscope::model::Memory m{};
  bool have_avail = false, have_total = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) { m.total = parse_kb(line.substr(9)); have_total = true; }
    else if (line.starts_with("MemFree:")) m.free = parse_kb(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { m.available = parse_kb(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) m.buffers = parse_kb(line.substr(8));
    else if (line.starts_with("Cached:")) m.cached = parse_kb(line.substr(7));
    else if (line.starts_with("SwapTotal:")) m.swap_total = parse_kb(line.substr(10));
    else if (line.starts_with("SwapFree:")) m.swap_free = parse_kb(line.substr(9));
    start = end + 1;
  }
  if (!have_total) return false;

  // kernels before 3.14 have no MemAvailable
  if (!have_avail) m.available = m.free + m.buffers + m.cached;
  m.used = (m.total > m.available) ? (m.total - m.available) : 0;
  m.swap_used = (m.swap_total > m.swap_free) ? (m.swap_total - m.swap_free) : 0;
  m.used_pct = (m.total > 0) ? (100.0 * static_cast<double>(m.used) / static_cast<double>(m.total)) : 0.0;
  out = m;
  return true;
}

} // namespace hostscope::collectors
