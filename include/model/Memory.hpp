#pragma once
#include <cstdint>

namespace hostscope::model {

// Virtual memory snapshot, all sizes in bytes.
struct Memory {
  uint64_t total{};
  uint64_t available{};
  uint64_t used{};
  uint64_t free{};
  uint64_t buffers{};
  uint64_t cached{};
  uint64_t swap_total{};
  uint64_t swap_free{};
  uint64_t swap_used{};
  double   used_pct{}; // 0..100
};

} // namespace hostscope::model
