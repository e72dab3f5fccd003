#include "collectors/SmiDecoder.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <vector>

namespace hostscope::collectors {

using hostscope::model::GpuReading;
using hostscope::model::GpuSample;

namespace {

std::string_view trim_view(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    out.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

template <typename T>
std::optional<T> parse_num(std::string_view s) {
  s = trim_view(s);
  T v{};
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size() || s.empty()) return std::nullopt;
  return v;
}

// Parse one field or log and fall back to zero.
template <typename T>
T field_or_zero(std::string_view raw, const char* what, int row) {
  auto v = parse_num<T>(raw);
  if (!v) {
    hostscope::util::log_warn("gpu row %d: cannot parse %s from '%.*s', using 0", row, what,
                       static_cast<int>(raw.size()), raw.data());
    return T{};
  }
  return *v;
}

// Minimal RFC 4180 field splitter: quoted fields, doubled quotes.
std::vector<std::string> split_csv(std::string_view line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
        else quoted = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::string(trim_view(cur)));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(std::string(trim_view(cur)));
  return out;
}

} // namespace

std::string nvidia_query_arg() {
  std::string arg = "--query-gpu=";
  for (size_t i = 0; i < kNvidiaColumns.size(); ++i) {
    if (i) arg += ',';
    arg += kNvidiaColumns[i].query;
  }
  return arg;
}

bool decode_nvidia_smi(std::string_view text, GpuReading& out) {
  constexpr size_t kFields = kNvidiaColumns.size();
  int row = 0, kept = 0;
  for (auto line : split_lines(text)) {
    // nvidia-smi on Windows and some drivers end lines with \r\n
    while (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (trim_view(line).empty()) continue;
    ++row;

    std::vector<std::string_view> f;
    size_t start = 0;
    for (;;) {
      size_t sep = line.find(", ", start);
      if (sep == std::string_view::npos) { f.push_back(line.substr(start)); break; }
      f.push_back(line.substr(start, sep - start));
      start = sep + 2;
    }
    if (f.size() < kFields) {
      hostscope::util::log_warn("gpu row %d: expected %zu fields, got %zu, skipping", row, kFields, f.size());
      continue;
    }
    // a name containing ", " spreads over the middle fields
    std::string name(f[1]);
    for (size_t i = 2; i + 5 < f.size(); ++i) {
      name += ", ";
      name += f[i];
    }
    const size_t m = f.size() - 5;

    GpuSample s;
    s.index = field_or_zero<int32_t>(f[0], kNvidiaColumns[0].field, row);
    s.load = field_or_zero<int>(f[m], kNvidiaColumns[2].field, row) / 100.0;
    s.memory_used_mib = field_or_zero<double>(f[m + 1], kNvidiaColumns[3].field, row);
    s.memory_total_mib = field_or_zero<double>(f[m + 2], kNvidiaColumns[4].field, row);
    s.power_w = field_or_zero<double>(f[m + 3], kNvidiaColumns[5].field, row);
    s.temperature_c = field_or_zero<int32_t>(f[m + 4], kNvidiaColumns[6].field, row);
    name = std::string(trim_view(name));
    if (out.device_name.empty() && !name.empty()) out.device_name = name;
    out.samples.push_back(s);
    ++kept;
  }
  return row == 0 || kept > 0;
}

bool decode_rocm_smi_csv(std::string_view text, GpuReading& out) {
  auto lines = split_lines(text);
  size_t hdr = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    if (trim_view(lines[i]).starts_with("device,")) { hdr = i; break; }
  }
  if (hdr == lines.size()) {
    hostscope::util::log_error("rocm-smi output has no CSV header");
    return false;
  }

  auto header = split_csv(trim_view(lines[hdr]));
  auto col = [&](auto pred) -> int {
    for (size_t i = 0; i < header.size(); ++i) {
      if (pred(header[i])) return static_cast<int>(i);
    }
    return -1;
  };
  auto exact = [&](const char* name) { return col([&](const std::string& h) { return h == name; }); };
  auto contains = [&](const char* part) { return col([&](const std::string& h) { return h.find(part) != std::string::npos; }); };

  int c_dev = exact("device");
  int c_name = exact("Card series");
  if (c_name < 0) c_name = exact("Card model");
  if (c_name < 0) c_name = exact("Card SKU");
  int c_load = exact("GPU use (%)");
  int c_mem_total = exact("VRAM Total Memory (B)");
  int c_mem_used = exact("VRAM Total Used Memory (B)");
  int c_power = contains("Graphics Package Power");
  int c_temp = exact("Temperature (Sensor edge) (C)");
  if (c_temp < 0) c_temp = col([](const std::string& h) { return h.starts_with("Temperature"); });

  int row = 0;
  for (size_t i = hdr + 1; i < lines.size(); ++i) {
    auto line = trim_view(lines[i]);
    if (line.empty() || !line.starts_with("card")) continue;
    auto f = split_csv(line);
    auto get = [&](int c) -> std::string_view {
      return (c >= 0 && static_cast<size_t>(c) < f.size()) ? std::string_view(f[c]) : std::string_view();
    };
    ++row;
    GpuSample s;
    std::string_view dev = get(c_dev);
    if (dev.starts_with("card")) dev.remove_prefix(4);
    s.index = field_or_zero<int32_t>(dev, "index", row);
    s.load = field_or_zero<double>(get(c_load), "load", row) / 100.0;
    s.memory_total_mib = field_or_zero<double>(get(c_mem_total), "memory-total", row) / (1024.0 * 1024.0);
    s.memory_used_mib = field_or_zero<double>(get(c_mem_used), "memory-used", row) / (1024.0 * 1024.0);
    s.power_w = field_or_zero<double>(get(c_power), "power", row);
    s.temperature_c = static_cast<int32_t>(std::lround(field_or_zero<double>(get(c_temp), "temperature", row)));
    std::string name(get(c_name));
    if (out.device_name.empty() && !name.empty()) out.device_name = name;
    out.samples.push_back(s);
  }
  return true;
}

} // namespace hostscope::collectors
