#pragma once
#include <memory>
#include <vector>
#include "model/Cpu.hpp"
#include "model/Disk.hpp"
#include "model/Gpu.hpp"
#include "model/Host.hpp"
#include "model/Memory.hpp"
#include "model/Net.hpp"

namespace hostscope::model {

// Whole-host view assembled from the per-family caches. A null pointer means
// the family has never produced data.
struct Snapshot {
  std::shared_ptr<const std::vector<CpuInfo>> cpu_info;
  std::shared_ptr<const CpuLoad> cpu_load;
  std::shared_ptr<const Memory> memory;
  std::shared_ptr<const DiskSnapshot> disks;
  std::shared_ptr<const NetSnapshot> network;
  std::shared_ptr<const HostInfo> host;
  GpuIdentity gpu;
  std::shared_ptr<const std::vector<GpuSample>> gpu_stats;
};

} // namespace hostscope::model
