#include "collectors/MountTable.hpp"
#include "util/Procfs.hpp"

#include <array>
#include <charconv>
#include <sstream>
#include <string_view>

namespace hostscope::collectors {

// \040 style escapes used for spaces, tabs, newlines and backslashes
static std::string unescape_octal(const std::string& s) {
  auto is_oct = [](char c) { return c >= '0' && c <= '7'; };
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        is_oct(s[i + 1]) && is_oct(s[i + 2]) && is_oct(s[i + 3])) {
      out.push_back(static_cast<char>((s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0')));
      i += 3;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

std::vector<MountEntry> parse_mount_table(const std::string& txt) {
  std::vector<MountEntry> out;
  std::istringstream ss(txt);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    MountEntry e;
    if (!(ls >> e.device >> e.mountpoint >> e.fstype)) continue;
    ls >> e.options;
    e.device = unescape_octal(e.device);
    e.mountpoint = unescape_octal(e.mountpoint);
    out.push_back(std::move(e));
  }
  return out;
}

// 36 35 98:0 /mnt1 /mnt2 rw,noatime master:1 - ext3 /dev/root rw,errors=continue
std::vector<MountEntry> parse_mountinfo(const std::string& txt) {
  std::vector<MountEntry> out;
  std::istringstream ss(txt);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string id, parent, devno, root;
    MountEntry e;
    if (!(ls >> id >> parent >> devno >> root >> e.mountpoint >> e.options)) continue;
    std::string tok;
    while (ls >> tok && tok != "-") {}
    if (tok != "-" || !(ls >> e.fstype >> e.device)) continue;
    auto colon = devno.find(':');
    if (colon != std::string::npos) {
      auto b = devno.data();
      auto mid = b + colon;
      auto end = b + devno.size();
      auto r1 = std::from_chars(b, mid, e.dev_major);
      auto r2 = std::from_chars(mid + 1, end, e.dev_minor);
      e.has_devno = r1.ec == std::errc() && r1.ptr == mid && r2.ec == std::errc() && r2.ptr == end;
    }
    e.device = unescape_octal(e.device);
    e.mountpoint = unescape_octal(e.mountpoint);
    out.push_back(std::move(e));
  }
  return out;
}

std::optional<std::vector<MountEntry>> read_mount_table() {
  if (auto info = util::read_file_string("/proc/self/mountinfo")) return parse_mountinfo(*info);
  auto txt = util::read_file_string("/proc/self/mounts");
  if (!txt) return std::nullopt;
  return parse_mount_table(*txt);
}

const MountEntry* find_mount(const std::vector<MountEntry>& table, const std::string& mountpoint) {
  const MountEntry* hit = nullptr;
  for (const auto& e : table) {
    if (e.mountpoint == mountpoint) hit = &e;
  }
  return hit;
}

bool is_pseudo_fs(const std::string& fstype) {
  static constexpr std::array<std::string_view, 25> kPseudo{
    "proc", "sysfs", "devtmpfs", "devpts", "cgroup", "cgroup2", "securityfs",
    "pstore", "efivarfs", "bpf", "debugfs", "tracefs", "configfs", "fusectl",
    "mqueue", "hugetlbfs", "autofs", "binfmt_misc", "rpc_pipefs", "nsfs",
    "overlay", "squashfs", "selinuxfs", "rootfs", "fuse.portal",
  };
  for (auto p : kPseudo) {
    if (p == fstype) return true;
  }
  return false;
}

} // namespace hostscope::collectors
