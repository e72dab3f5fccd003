#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope::model {

// Closed set of filesystems the dashboard knows how to label.
enum class FsType : int {
  Unrecognized = -1,
  APFS = 0,
  exFAT,
  FAT,
  FAT32,
  EXT,
  EXT2,
  EXT3,
  EXT4,
  NTFS,
  JFS,
  ZFS,
};

struct DiskRecord {
  std::string mountpoint;
  std::string device;
  FsType fs_type{FsType::Unrecognized};
  std::string fs_name;        // provider-reported name, kept for unrecognized types
  bool is_virtual{false};
  uint64_t free_bytes{};
  uint64_t used_bytes{};
  uint64_t total_bytes{};
  double used_pct{};          // 0..100, two decimals
};

struct DiskSnapshot {
  std::vector<DiskRecord> disks;
};

} // namespace hostscope::model
