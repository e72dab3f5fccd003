#pragma once
#include <string>
#include "model/Disk.hpp"

namespace hostscope::collectors {

class IDriveProbe;

// Mounted partitions with usage, filesystem type and the virtual-disk flag.
class DiskCollector {
public:
  explicit DiskCollector(IDriveProbe& probe) : probe_(probe) {}
  bool sample(hostscope::model::DiskSnapshot& out);
private:
  IDriveProbe& probe_;
};

// Filters applied to the mount table before sampling.
[[nodiscard]] bool is_user_visible_mount(const std::string& mountpoint, const std::string& fstype);

} // namespace hostscope::collectors
