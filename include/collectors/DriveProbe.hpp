#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace hostscope::collectors {

// Drive classification in the shape of the Win32 GetDriveType constants.
enum class DriveType { Unknown, NoRootDir, Removable, Fixed, Remote, Cdrom, RamDisk };

[[nodiscard]] const char* drive_type_name(DriveType t);

// Platform capability used by the virtual-disk classifier.
class IDriveProbe {
public:
  virtual ~IDriveProbe() = default;
  // false on platforms without a drive-type API
  [[nodiscard]] virtual bool supported() const = 0;
  // std::nullopt when the mount path cannot be resolved at all
  [[nodiscard]] virtual std::optional<DriveType> drive_type(const std::string& mountpoint) = 0;
  // Number of per-device I/O counter entries backing the mount.
  // std::nullopt when the counters cannot be queried.
  [[nodiscard]] virtual std::optional<std::size_t> io_counter_count(const std::string& mountpoint) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// RAM disks are virtual. Fixed disks without any I/O counter entry are virtual
// too (cloud-sync and FUSE volumes register as fixed). Everything else,
// including unresolvable paths, is physical.
[[nodiscard]] bool is_virtual_disk(IDriveProbe& probe, const std::string& mountpoint);

// Always answers "not supported".
class NullDriveProbe : public IDriveProbe {
public:
  bool supported() const override { return false; }
  std::optional<DriveType> drive_type(const std::string&) override { return std::nullopt; }
  std::optional<std::size_t> io_counter_count(const std::string&) override { return std::nullopt; }
  const char* name() const override { return "null"; }
};

// The probe for the platform this was built for.
[[nodiscard]] std::unique_ptr<IDriveProbe> make_drive_probe();

} // namespace hostscope::collectors
