#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "collectors/GpuBackend.hpp"
#include "model/Gpu.hpp"

namespace hostscope::collectors {

// Vendor detection plus the sampling pipeline on top of it.
//
// Backends are tried in order. The first one whose tool runs successfully
// becomes the vendor for the rest of the probe's life and is never probed
// again. A failed detection is not remembered, but further attempts are
// held off for `detect_retry` so a GPU-less host does not spawn two
// processes on every call.
class GpuProbe {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  GpuProbe(std::vector<std::unique_ptr<IGpuBackend>> backends,
           std::chrono::milliseconds detect_retry,
           Clock now = [] { return std::chrono::steady_clock::now(); });

  bool detect();
  [[nodiscard]] hostscope::model::GpuIdentity identity() const;
  // One pass of the detected vendor's tool. False when no vendor is known
  // or the tool fails; `out` is then left untouched.
  bool sample(std::vector<hostscope::model::GpuSample>& out);

private:
  mutable std::mutex mu_;
  std::vector<std::unique_ptr<IGpuBackend>> backends_;
  IGpuBackend* active_{nullptr};
  hostscope::model::GpuIdentity identity_{};
  std::chrono::milliseconds detect_retry_;
  Clock now_;
  std::chrono::steady_clock::time_point last_attempt_{};
  bool attempted_{false};
  bool reported_missing_{false};
};

} // namespace hostscope::collectors
