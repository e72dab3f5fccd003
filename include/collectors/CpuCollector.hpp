#pragma once
#include <string>
#include <vector>
#include "model/Cpu.hpp"

namespace hostscope::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // One record per physical package, from /proc/cpuinfo.
  bool identity(std::vector<hostscope::model::CpuInfo>& out) const;
  // Utilization since the previous call (since boot on the first call), from /proc/stat.
  bool sample(hostscope::model::CpuLoad& out);
private:
  hostscope::model::CpuTimes last_total_{};
  std::vector<hostscope::model::CpuTimes> last_per_{};
};

// Display form of a model name. For GenuineIntel the trademark marks,
// "CPU @ " and "Core " are dropped; other vendors are returned unchanged.
[[nodiscard]] std::string format_cpu_model_name(const std::string& vendor, const std::string& name);

} // namespace hostscope::collectors
