#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope::model {

struct NetIf {
  std::string name;
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
  uint64_t packets_sent{};
  uint64_t packets_recv{};
  uint64_t errin{};
  uint64_t errout{};
  uint64_t dropin{};
  uint64_t dropout{};
  // calculated from the previous sample of the same interface
  double rx_bps{};
  double tx_bps{};
};

struct NetSnapshot {
  std::vector<NetIf> interfaces;
};

} // namespace hostscope::model
