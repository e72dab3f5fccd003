#include "collectors/HostCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <sys/utsname.h>
#include <unistd.h>

namespace hostscope::collectors {

static std::string unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    v = v.substr(1, v.size() - 2);
  }
  return v;
}

static void read_os_release(hostscope::model::HostInfo& out) {
  auto txt = hostscope::util::read_file_string("/etc/os-release");
  if (!txt) return;
  std::string id, id_like;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    auto eq = line.find('=');
    if (eq == std::string::npos || line.starts_with("#")) continue;
    std::string key = hostscope::util::trim(line.substr(0, eq));
    std::string val = unquote(hostscope::util::trim(line.substr(eq + 1)));
    if (key == "ID") id = val;
    else if (key == "ID_LIKE") id_like = val;
    else if (key == "VERSION_ID") out.platform_version = val;
  }
  out.platform = id;
  auto sp = id_like.find(' ');
  out.platform_family = !id_like.empty() ? id_like.substr(0, sp) : id;
}

static uint64_t count_pids() {
  uint64_t n = 0;
  for (const auto& name : hostscope::util::list_dir("/proc")) {
    if (!name.empty() && name.find_first_not_of("0123456789") == std::string::npos) ++n;
  }
  return n;
}

bool HostCollector::sample(hostscope::model::HostInfo& out) const {
  hostscope::model::HostInfo h;
  h.os = "linux";

  auto hn = hostscope::util::read_first_line("/proc/sys/kernel/hostname");
  if (hn && !hn->empty()) {
    h.hostname = *hn;
  } else {
    char buf[256]{};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return false;
    h.hostname = buf;
  }

  auto up = hostscope::util::read_first_line("/proc/uptime");
  if (!up) return false;
  double up_s = std::strtod(up->c_str(), nullptr);
  h.uptime_s = up_s > 0 ? static_cast<uint64_t>(up_s) : 0;

  if (auto stat = hostscope::util::read_file_string("/proc/stat")) {
    auto pos = stat->find("\nbtime ");
    if (pos != std::string::npos) {
      const char* b = stat->data() + pos + 7;
      std::from_chars(b, stat->data() + stat->size(), h.boot_time);
    }
  }

  h.procs = count_pids();
  read_os_release(h);

  struct utsname uts{};
  if (::uname(&uts) == 0) {
    h.kernel_arch = uts.machine;
    h.kernel_version = uts.release;
  }
  if (auto rel = hostscope::util::read_first_line("/proc/sys/kernel/osrelease")) h.kernel_version = *rel;

  if (auto mid = hostscope::util::read_first_line("/etc/machine-id")) h.host_id = *mid;

  out = std::move(h);
  return true;
}

} // namespace hostscope::collectors
