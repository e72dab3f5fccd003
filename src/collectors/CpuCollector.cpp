#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <string_view>

namespace hostscope::collectors {

static void parse_cpu_line(const std::string_view& line, hostscope::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static double busy_pct(const hostscope::model::CpuTimes& cur, const hostscope::model::CpuTimes& prev) {
  auto td = cur.total() - prev.total();
  auto wd = cur.work() - prev.work();
  return (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
}

static int parse_int(const std::string& s, int defv) {
  int v = defv;
  auto r = std::from_chars(s.data(), s.data() + s.size(), v);
  return r.ec == std::errc() ? v : defv;
}

namespace {
struct Package {
  std::string name;
  std::string vendor;
  int cores{};
  std::set<int> logical;
};
} // namespace

bool CpuCollector::identity(std::vector<hostscope::model::CpuInfo>& out) const {
  auto txt = hostscope::util::read_file_string("/proc/cpuinfo");
  if (!txt) return false;

  std::map<int, Package> packages;
  std::string model, vendor, hw;
  int phys = 0, cores = 0, proc = -1;
  auto flush = [&]() {
    if (proc < 0) return;
    auto& p = packages[phys];
    if (p.name.empty()) p.name = !model.empty() ? model : hw;
    if (p.vendor.empty()) p.vendor = vendor;
    if (cores > p.cores) p.cores = cores;
    p.logical.insert(proc);
    model.clear(); vendor.clear(); phys = 0; cores = 0; proc = -1;
  };

  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (hostscope::util::trim(line).empty()) { flush(); continue; }
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = hostscope::util::trim(line.substr(0, colon));
    std::string val = hostscope::util::trim(line.substr(colon + 1));
    if (key == "processor") {
      int id = parse_int(val, -1);
      // arm kernels print "Processor : <model>" as well
      if (id < 0) { if (model.empty()) model = val; continue; }
      if (proc >= 0) flush();
      proc = id;
    }
    else if (key == "model name") model = val;
    else if (key == "vendor_id" || key == "CPU implementer") vendor = val;
    else if (key == "physical id") phys = parse_int(val, 0);
    else if (key == "cpu cores") cores = parse_int(val, 0);
    else if (key == "Hardware") hw = val;
  }
  flush();
  if (packages.empty()) return false;

  out.clear();
  for (const auto& [id, p] : packages) {
    hostscope::model::CpuInfo ci;
    ci.id = id;
    ci.name = p.name;
    ci.vendor = p.vendor;
    ci.logical_cores = static_cast<int>(p.logical.size());
    ci.physical_cores = p.cores > 0 ? p.cores : ci.logical_cores;
    out.push_back(std::move(ci));
  }
  return true;
}

bool CpuCollector::sample(hostscope::model::CpuLoad& out) {
  auto txt_opt = hostscope::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  hostscope::model::CpuTimes agg{}; std::vector<hostscope::model::CpuTimes> per;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; }
    else if (after_cpu && line.starts_with("cpu")) { hostscope::model::CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (after_cpu) break;
    start = end + 1;
  }
  if (!after_cpu) return false;

  // zeroed previous times on the first call give the since-boot average
  std::vector<double> per_pct(per.size(), 0.0);
  for (size_t i = 0; i < per.size(); ++i) {
    per_pct[i] = busy_pct(per[i], i < last_per_.size() ? last_per_[i] : hostscope::model::CpuTimes{});
  }
  out.usage_pct = busy_pct(agg, last_total_);
  out.per_core_pct = std::move(per_pct);
  out.timestamp = std::chrono::system_clock::now();
  last_total_ = agg; last_per_ = std::move(per);
  return true;
}

static void erase_all(std::string& s, std::string_view what) {
  for (auto pos = s.find(what); pos != std::string::npos; pos = s.find(what, pos)) s.erase(pos, what.size());
}

std::string format_cpu_model_name(const std::string& vendor, const std::string& name) {
  if (vendor != "GenuineIntel") return name;
  std::string s = name;
  erase_all(s, "(R)");
  erase_all(s, "(TM)");
  for (auto pos = s.find("CPU @ "); pos != std::string::npos; pos = s.find("CPU @ ", pos)) {
    s.replace(pos, 6, "@");
  }
  erase_all(s, "Core ");
  return s;
}

} // namespace hostscope::collectors
