#include "collectors/DriveProbe.hpp"
#include "util/Log.hpp"

#ifdef __linux__
#include "collectors/LinuxDriveProbe.hpp"
#endif

namespace hostscope::collectors {

const char* drive_type_name(DriveType t) {
  switch (t) {
    case DriveType::Unknown:   return "unknown";
    case DriveType::NoRootDir: return "no-root-dir";
    case DriveType::Removable: return "removable";
    case DriveType::Fixed:     return "fixed";
    case DriveType::Remote:    return "remote";
    case DriveType::Cdrom:     return "cdrom";
    case DriveType::RamDisk:   return "ramdisk";
  }
  return "?";
}

bool is_virtual_disk(IDriveProbe& probe, const std::string& mountpoint) {
  if (!probe.supported()) {
    hostscope::util::log_debug("virtual-disk check unsupported on this platform (%s probe), %s treated as physical",
                        probe.name(), mountpoint.c_str());
    return false;
  }
  auto type = probe.drive_type(mountpoint);
  if (!type) {
    hostscope::util::log_error("cannot resolve drive type for %s", mountpoint.c_str());
    return false;
  }
  switch (*type) {
    case DriveType::RamDisk:
      hostscope::util::log_debug("%s is a RAM disk", mountpoint.c_str());
      return true;
    case DriveType::Fixed: {
      auto n = probe.io_counter_count(mountpoint);
      if (!n) {
        hostscope::util::log_error("cannot query I/O counters for %s", mountpoint.c_str());
        return false;
      }
      if (*n == 0) {
        hostscope::util::log_debug("%s is fixed but has no I/O counters, treating as virtual", mountpoint.c_str());
        return true;
      }
      hostscope::util::log_debug("%s has %zu I/O counter entries", mountpoint.c_str(), *n);
      return false;
    }
    default:
      hostscope::util::log_debug("%s is %s, not virtual", mountpoint.c_str(), drive_type_name(*type));
      return false;
  }
}

std::unique_ptr<IDriveProbe> make_drive_probe() {
#ifdef __linux__
  return std::make_unique<LinuxDriveProbe>();
#else
  return std::make_unique<NullDriveProbe>();
#endif
}

} // namespace hostscope::collectors
