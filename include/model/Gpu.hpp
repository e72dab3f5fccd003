#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope::model {

enum class GpuVendor { None, Nvidia, Amd };

struct GpuIdentity {
  GpuVendor vendor{GpuVendor::None};
  std::string name;           // first device name seen while sampling
};

// Per-card reading. Memory stays in MiB, the unit the vendor tools report.
struct GpuSample {
  int32_t index{};
  double load{};              // 0.0..1.0
  double memory_used_mib{};
  double memory_total_mib{};
  double power_w{};
  int32_t temperature_c{};
};

// One pass of a vendor tool.
struct GpuReading {
  std::vector<GpuSample> samples;
  std::string device_name;
};

[[nodiscard]] inline const char* gpu_vendor_name(GpuVendor v) {
  switch (v) {
    case GpuVendor::Nvidia: return "nvidia";
    case GpuVendor::Amd:    return "amd";
    case GpuVendor::None:   break;
  }
  return "";
}

} // namespace hostscope::model
