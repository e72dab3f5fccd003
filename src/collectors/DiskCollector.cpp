#include "collectors/DiskCollector.hpp"
#include "collectors/DriveProbe.hpp"
#include "collectors/FsType.hpp"
#include "collectors/MountTable.hpp"
#include "util/Log.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <set>
#include <sys/statvfs.h>

namespace hostscope::collectors {

static bool under(const std::string& path, const char* root) {
  size_t n = std::strlen(root);
  return path.compare(0, n, root) == 0 && (path.size() == n || path[n] == '/');
}

bool is_user_visible_mount(const std::string& mountpoint, const std::string& fstype) {
  if (is_pseudo_fs(fstype)) return false;
  for (const char* r : {"/proc", "/sys", "/dev", "/run"}) {
    if (under(mountpoint, r)) return false;
  }
  return true;
}

bool DiskCollector::sample(hostscope::model::DiskSnapshot& out) {
  auto table = read_mount_table();
  if (!table) return false;

  std::vector<hostscope::model::DiskRecord> disks;
  std::set<std::string> seen;
  // walk backwards so the visible (last) mount on each path wins
  for (auto it = table->rbegin(); it != table->rend(); ++it) {
    const MountEntry& m = *it;
    if (!is_user_visible_mount(m.mountpoint, m.fstype)) continue;
    if (!seen.insert(m.mountpoint).second) continue;

    struct statvfs st{};
    if (::statvfs(m.mountpoint.c_str(), &st) != 0) {
      hostscope::util::log_debug("statvfs(%s) failed: %s", m.mountpoint.c_str(), std::strerror(errno));
      continue;
    }
    const uint64_t frsize = st.f_frsize ? st.f_frsize : st.f_bsize;
    hostscope::model::DiskRecord d;
    d.mountpoint = m.mountpoint;
    d.device = m.device;
    d.fs_name = canonical_fs_name(m.fstype);
    d.fs_type = normalize_fs_type(d.fs_name);
    d.total_bytes = static_cast<uint64_t>(st.f_blocks) * frsize;
    if (d.total_bytes == 0) continue;
    d.free_bytes = static_cast<uint64_t>(st.f_bavail) * frsize;
    d.used_bytes = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * frsize;
    const uint64_t denom = d.used_bytes + d.free_bytes;
    double pct = denom > 0 ? 100.0 * static_cast<double>(d.used_bytes) / static_cast<double>(denom) : 0.0;
    d.used_pct = std::round(pct * 100.0) / 100.0;
    d.is_virtual = is_virtual_disk(probe_, m.mountpoint);
    disks.push_back(std::move(d));
  }
  out.disks.assign(disks.rbegin(), disks.rend());
  return true;
}

} // namespace hostscope::collectors
