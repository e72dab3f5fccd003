#include "collectors/GpuProbe.hpp"
#include "util/Log.hpp"

#include <string>

namespace hostscope::collectors {

GpuProbe::GpuProbe(std::vector<std::unique_ptr<IGpuBackend>> backends,
                   std::chrono::milliseconds detect_retry, Clock now)
  : backends_(std::move(backends)), detect_retry_(detect_retry), now_(std::move(now)) {}

bool GpuProbe::detect() {
  std::lock_guard<std::mutex> lk(mu_);
  if (active_) return true;

  auto t = now_();
  if (attempted_ && t - last_attempt_ < detect_retry_) return false;
  attempted_ = true;
  last_attempt_ = t;

  std::string tried;
  for (auto& b : backends_) {
    if (b->detect()) {
      active_ = b.get();
      identity_.vendor = b->vendor();
      hostscope::util::log_info("gpu: detected %s via %s", hostscope::model::gpu_vendor_name(identity_.vendor), b->name());
      return true;
    }
    if (!tried.empty()) tried += ", ";
    tried += b->name();
  }
  // first miss is an error, repeats of the same answer are noise
  if (!reported_missing_) {
    hostscope::util::log_error("gpu: no supported GPU found (tried %s)", tried.empty() ? "nothing" : tried.c_str());
    reported_missing_ = true;
  } else {
    hostscope::util::log_debug("gpu: still no supported GPU (tried %s)", tried.c_str());
  }
  return false;
}

hostscope::model::GpuIdentity GpuProbe::identity() const {
  std::lock_guard<std::mutex> lk(mu_);
  return identity_;
}

bool GpuProbe::sample(std::vector<hostscope::model::GpuSample>& out) {
  if (!detect()) return false;
  IGpuBackend* backend = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    backend = active_;
  }
  hostscope::model::GpuReading r;
  if (!backend->query(r)) {
    hostscope::util::log_error("gpu: %s sampling failed", backend->name());
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (identity_.name.empty() && !r.device_name.empty()) identity_.name = r.device_name;
  }
  out = std::move(r.samples);
  return true;
}

} // namespace hostscope::collectors
