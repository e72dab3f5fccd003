#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "app/MetricCache.hpp"
#include "collectors/GpuProbe.hpp"
#include "collectors/TelemetryProvider.hpp"
#include "model/Snapshot.hpp"

namespace hostscope::app {

// Pull-based front door: one MetricCache per metric family plus the GPU
// vendor state. Created by the caller and shared by reference; every
// accessor is safe to call from several threads.
class HostSampler {
public:
  using NowFn = MetricCache<int>::NowFn;

  // `gpu` may be null when GPU sampling is disabled.
  HostSampler(std::unique_ptr<hostscope::collectors::ITelemetryProvider> provider,
              std::unique_ptr<hostscope::collectors::GpuProbe> gpu,
              const Config& cfg,
              NowFn now = [] { return std::chrono::steady_clock::now(); });

  HostSampler(const HostSampler&) = delete;
  HostSampler& operator=(const HostSampler&) = delete;

  // Per-socket identity, fetched once.
  std::shared_ptr<const std::vector<hostscope::model::CpuInfo>> cpu_info();
  // Display name of the first socket ("" when unknown).
  std::string cpu_model_name();
  std::shared_ptr<const hostscope::model::CpuLoad> cpu_load();
  // Oldest first, bounded by [cpu] history.
  std::vector<hostscope::model::CpuLoad> cpu_history() const;

  std::shared_ptr<const hostscope::model::DiskSnapshot> disks();
  // Returns the previous instance when used_pct did not change.
  std::shared_ptr<const hostscope::model::Memory> memory();
  std::shared_ptr<const hostscope::model::NetSnapshot> network();
  std::shared_ptr<const hostscope::model::HostInfo> host_info();
  std::string hostname();

  bool has_gpu();
  hostscope::model::GpuIdentity gpu_identity() const;
  std::string gpu_name();
  std::shared_ptr<const std::vector<hostscope::model::GpuSample>> gpu_stats();

  // Every family through its cache.
  hostscope::model::Snapshot snapshot();

private:
  std::unique_ptr<hostscope::collectors::ITelemetryProvider> provider_;
  std::unique_ptr<hostscope::collectors::GpuProbe> gpu_;
  size_t history_cap_;

  mutable std::mutex history_mu_;
  std::deque<hostscope::model::CpuLoad> history_;

  MetricCache<std::vector<hostscope::model::CpuInfo>> cpu_info_;
  MetricCache<hostscope::model::CpuLoad> cpu_load_;
  MetricCache<hostscope::model::DiskSnapshot> disks_;
  MetricCache<hostscope::model::Memory> memory_;
  MetricCache<hostscope::model::NetSnapshot> network_;
  MetricCache<hostscope::model::HostInfo> host_;
  MetricCache<std::string> hostname_;
  MetricCache<std::vector<hostscope::model::GpuSample>> gpu_stats_;
};

// Wires the Linux provider, the popen runner and both vendor backends.
[[nodiscard]] std::unique_ptr<HostSampler> make_host_sampler(const Config& cfg);

} // namespace hostscope::app
