#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

// One entry per physical package. Static for the lifetime of the process.
struct CpuInfo {
  int id{};                 // physical package id
  std::string name;         // model name as reported by the kernel
  std::string vendor;       // e.g. GenuineIntel, AuthenticAMD
  int physical_cores{};
  int logical_cores{};
};

struct CpuLoad {
  double usage_pct{};                           // 0..100, whole machine
  std::vector<double> per_core_pct;             // 0..100 per logical cpu
  std::chrono::system_clock::time_point timestamp{};
};

} // namespace hostscope::model
