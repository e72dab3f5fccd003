#include "collectors/LinuxDriveProbe.hpp"
#include "util/Procfs.hpp"

#include <array>
#include <filesystem>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace hostscope::collectors {

static bool sys_block_exists(const std::string& name) {
  std::error_code ec;
  return !name.empty() && fs::is_directory(util::map_sys_path("/sys/block/" + name), ec);
}

std::string LinuxDriveProbe::block_name(const std::string& device) {
  std::string dev = device;
  std::error_code ec;
  auto real = fs::canonical(device, ec);
  if (!ec) dev = real.string();
  auto slash = dev.rfind('/');
  return slash == std::string::npos ? dev : dev.substr(slash + 1);
}

std::string LinuxDriveProbe::parent_disk(const std::string& block) {
  if (sys_block_exists(block)) return block;
  std::string cand = block;
  while (!cand.empty() && cand.back() >= '0' && cand.back() <= '9') cand.pop_back();
  if (cand.size() == block.size()) return block;
  // nvme0n1p2, mmcblk0p1
  if (cand.size() >= 2 && cand.back() == 'p' && cand[cand.size() - 2] >= '0' && cand[cand.size() - 2] <= '9') {
    cand.pop_back();
  }
  return sys_block_exists(cand) ? cand : block;
}

// Anonymous devices (major 0: btrfs subvolumes, overlay, fuse) have no
// block device behind them.
static bool real_devno(const MountEntry& m) { return m.has_devno && m.dev_major != 0; }

std::optional<std::string> LinuxDriveProbe::devno_block_name(unsigned major, unsigned minor) {
  const std::string key = std::to_string(major) + ":" + std::to_string(minor);
  if (auto uevent = util::read_file_string("/sys/dev/block/" + key + "/uevent")) {
    std::istringstream ss(*uevent);
    std::string line;
    while (std::getline(ss, line)) {
      if (line.starts_with("DEVNAME=")) return line.substr(8);
    }
  }
  if (auto txt = util::read_file_string("/proc/diskstats")) {
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
      std::istringstream ls(line);
      unsigned ma = 0, mi = 0;
      std::string dev;
      if (ls >> ma >> mi >> dev && ma == major && mi == minor) return dev;
    }
  }
  return std::nullopt;
}

std::string LinuxDriveProbe::mount_block_name(const MountEntry& m) {
  if (real_devno(m)) {
    if (auto name = devno_block_name(m.dev_major, m.dev_minor)) return *name;
  }
  return block_name(m.device);
}

DriveType LinuxDriveProbe::classify(const MountEntry& m) {
  static constexpr std::array<std::string_view, 11> kRemote{
    "nfs", "nfs4", "cifs", "smb3", "smbfs", "ceph", "glusterfs", "9p", "afs", "davfs", "fuse.sshfs",
  };
  const std::string& t = m.fstype;
  if (t == "tmpfs" || t == "ramfs") return DriveType::RamDisk;
  for (auto r : kRemote) {
    if (r == t) return DriveType::Remote;
  }
  if (t == "iso9660" || t == "udf") return DriveType::Cdrom;
  if (t == "fuse" || t.starts_with("fuse.")) return DriveType::Fixed;
  if (m.device.starts_with("/dev/")) {
    auto disk = parent_disk(mount_block_name(m));
    auto removable = util::read_first_line("/sys/block/" + disk + "/removable");
    if (removable && *removable == "1") return DriveType::Removable;
    return DriveType::Fixed;
  }
  return DriveType::Unknown;
}

std::optional<DriveType> LinuxDriveProbe::drive_type(const std::string& mountpoint) {
  auto table = read_mount_table();
  if (!table) return std::nullopt;
  const MountEntry* m = find_mount(*table, mountpoint);
  if (!m) return DriveType::NoRootDir;
  return classify(*m);
}

std::optional<std::size_t> LinuxDriveProbe::io_counter_count(const std::string& mountpoint) {
  auto table = read_mount_table();
  if (!table) return std::nullopt;
  const MountEntry* m = find_mount(*table, mountpoint);
  if (!m) return std::nullopt;
  auto txt = util::read_file_string("/proc/diskstats");
  if (!txt) return std::nullopt;
  if (!m->device.starts_with("/dev/")) return 0;
  // /dev/root and other aliases only resolve through the device number
  const std::string name = block_name(m->device);
  const bool by_devno = real_devno(*m);
  std::size_t n = 0;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major = 0, minor = 0;
    std::string dev;
    if (!(ls >> major >> minor >> dev)) continue;
    if (dev == name || (by_devno && major == m->dev_major && minor == m->dev_minor)) ++n;
  }
  return n;
}

} // namespace hostscope::collectors
