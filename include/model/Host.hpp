#pragma once
#include <cstdint>
#include <string>

namespace hostscope::model {

struct HostInfo {
  std::string hostname;
  uint64_t uptime_s{};
  uint64_t boot_time{};       // unix seconds
  uint64_t procs{};
  std::string os;             // "linux"
  std::string platform;       // os-release ID, e.g. "debian"
  std::string platform_family;// os-release ID_LIKE (first word) or ID
  std::string platform_version;
  std::string kernel_version;
  std::string kernel_arch;
  std::string host_id;        // machine-id
};

} // namespace hostscope::model
