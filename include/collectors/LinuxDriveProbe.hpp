#pragma once
#include "collectors/DriveProbe.hpp"
#include "collectors/MountTable.hpp"

namespace hostscope::collectors {

// Derives the drive type from the mount table and /sys/block, and the I/O
// counters from /proc/diskstats. Block devices are matched by major:minor
// when the mount table carries it, by device name otherwise.
class LinuxDriveProbe : public IDriveProbe {
public:
  bool supported() const override { return true; }
  std::optional<DriveType> drive_type(const std::string& mountpoint) override;
  std::optional<std::size_t> io_counter_count(const std::string& mountpoint) override;
  const char* name() const override { return "linux"; }

  // Exposed for tests.
  [[nodiscard]] static DriveType classify(const MountEntry& m);
  [[nodiscard]] static std::string block_name(const std::string& device);
  [[nodiscard]] static std::string parent_disk(const std::string& block);
  [[nodiscard]] static std::optional<std::string> devno_block_name(unsigned major, unsigned minor);
  [[nodiscard]] static std::string mount_block_name(const MountEntry& m);
};

} // namespace hostscope::collectors
