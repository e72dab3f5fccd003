#pragma once
#include <optional>
#include <string>
#include <vector>

namespace hostscope::collectors {

struct MountEntry {
  std::string device;
  std::string mountpoint;
  std::string fstype;
  std::string options;
  // st_dev of the mounted filesystem; only known when read from mountinfo
  bool has_devno{false};
  unsigned dev_major{0};
  unsigned dev_minor{0};
};

// /proc/self/mountinfo when present, else /proc/self/mounts.
// Returns std::nullopt when neither can be read.
[[nodiscard]] std::optional<std::vector<MountEntry>> read_mount_table();

// fstab format (/proc/self/mounts), octal escapes decoded.
[[nodiscard]] std::vector<MountEntry> parse_mount_table(const std::string& txt);

// /proc/self/mountinfo format, see proc(5).
[[nodiscard]] std::vector<MountEntry> parse_mountinfo(const std::string& txt);

// Last entry mounted on `mountpoint` (later mounts shadow earlier ones).
[[nodiscard]] const MountEntry* find_mount(const std::vector<MountEntry>& table, const std::string& mountpoint);

// Kernel pseudo filesystems that never back user data.
[[nodiscard]] bool is_pseudo_fs(const std::string& fstype);

} // namespace hostscope::collectors
