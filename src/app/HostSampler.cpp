#include "app/HostSampler.hpp"
#include "util/Process.hpp"

using namespace std::chrono;

namespace hostscope::app {

using namespace hostscope::model;

static std::optional<steady_clock::duration> ttl_ms(int ms) {
  return duration_cast<steady_clock::duration>(milliseconds(ms));
}

HostSampler::HostSampler(std::unique_ptr<hostscope::collectors::ITelemetryProvider> provider,
                         std::unique_ptr<hostscope::collectors::GpuProbe> gpu,
                         const Config& cfg, NowFn now)
  : provider_(std::move(provider)),
    gpu_(std::move(gpu)),
    history_cap_(static_cast<size_t>(cfg.cpu.history > 0 ? cfg.cpu.history : 1)),
    cpu_info_("cpu-info", std::nullopt,
              [this](std::vector<CpuInfo>& out) { return provider_->cpu_info(out); }, now),
    cpu_load_("cpu-load", ttl_ms(cfg.intervals.cpu_ms),
              [this](CpuLoad& out) {
                if (!provider_->cpu_load(out)) return false;
                std::lock_guard<std::mutex> lk(history_mu_);
                history_.push_back(out);
                while (history_.size() > history_cap_) history_.pop_front();
                return true;
              }, now),
    disks_("disks", ttl_ms(cfg.intervals.disk_ms),
           [this](DiskSnapshot& out) { return provider_->disks(out); }, now),
    memory_("memory", ttl_ms(cfg.intervals.memory_ms),
            [this](Memory& out) { return provider_->memory(out); }, now,
            [](const Memory& prev, const Memory& next) { return prev.used_pct == next.used_pct; }),
    network_("network", ttl_ms(cfg.intervals.network_ms),
             [this](NetSnapshot& out) { return provider_->network(out); }, now),
    host_("host", ttl_ms(cfg.intervals.host_ms),
          [this](HostInfo& out) { return provider_->host(out); }, now),
    hostname_("hostname", std::nullopt,
              [this](std::string& out) {
                auto h = host_.get();
                if (!h || h->hostname.empty()) return false;
                out = h->hostname;
                return true;
              }, now),
    gpu_stats_("gpu", ttl_ms(cfg.intervals.gpu_ms),
               [this](std::vector<GpuSample>& out) { return gpu_ && gpu_->sample(out); }, now) {}

std::shared_ptr<const std::vector<CpuInfo>> HostSampler::cpu_info() { return cpu_info_.get(); }

std::string HostSampler::cpu_model_name() {
  auto info = cpu_info();
  if (!info || info->empty()) return {};
  return hostscope::collectors::format_cpu_model_name(info->front().vendor, info->front().name);
}

std::shared_ptr<const CpuLoad> HostSampler::cpu_load() { return cpu_load_.get(); }

std::vector<CpuLoad> HostSampler::cpu_history() const {
  std::lock_guard<std::mutex> lk(history_mu_);
  return std::vector<CpuLoad>(history_.begin(), history_.end());
}

std::shared_ptr<const DiskSnapshot> HostSampler::disks() { return disks_.get(); }
std::shared_ptr<const Memory> HostSampler::memory() { return memory_.get(); }
std::shared_ptr<const NetSnapshot> HostSampler::network() { return network_.get(); }
std::shared_ptr<const HostInfo> HostSampler::host_info() { return host_.get(); }

std::string HostSampler::hostname() {
  auto h = hostname_.get();
  return h ? *h : std::string();
}

bool HostSampler::has_gpu() { return gpu_ && gpu_->detect(); }

GpuIdentity HostSampler::gpu_identity() const {
  return gpu_ ? gpu_->identity() : GpuIdentity{};
}

std::string HostSampler::gpu_name() {
  if (!gpu_) return {};
  auto id = gpu_->identity();
  // the name is learned from the first sampling pass
  if (id.name.empty() && has_gpu()) {
    (void)gpu_stats();
    id = gpu_->identity();
  }
  return id.name;
}

std::shared_ptr<const std::vector<GpuSample>> HostSampler::gpu_stats() {
  if (!has_gpu()) return gpu_stats_.peek();
  return gpu_stats_.get();
}

Snapshot HostSampler::snapshot() {
  Snapshot s;
  s.cpu_info = cpu_info();
  s.cpu_load = cpu_load();
  s.memory = memory();
  s.disks = disks();
  s.network = network();
  s.host = host_info();
  s.gpu_stats = gpu_stats();
  s.gpu = gpu_identity();
  return s;
}

std::unique_ptr<HostSampler> make_host_sampler(const Config& cfg) {
  using namespace hostscope::collectors;
  auto provider = std::make_unique<LinuxTelemetryProvider>();
  std::unique_ptr<GpuProbe> gpu;
  if (cfg.gpu.enabled) {
    auto runner = std::make_shared<hostscope::util::PopenProcessRunner>();
    std::vector<std::unique_ptr<IGpuBackend>> backends;
    backends.push_back(std::make_unique<NvidiaSmiBackend>(runner,
        hostscope::util::resolve_tool(cfg.gpu.nvidia_smi_path, "nvidia-smi",
                                      {"/usr/bin/nvidia-smi", "/usr/local/bin/nvidia-smi", "/opt/nvidia/sbin/nvidia-smi"})));
    backends.push_back(std::make_unique<RocmSmiBackend>(runner,
        hostscope::util::resolve_tool(cfg.gpu.rocm_smi_path, "rocm-smi",
                                      {"/opt/rocm/bin/rocm-smi", "/usr/bin/rocm-smi", "/usr/local/bin/rocm-smi"})));
    gpu = std::make_unique<GpuProbe>(std::move(backends), milliseconds(cfg.gpu.detect_retry_ms));
  }
  return std::make_unique<HostSampler>(std::move(provider), std::move(gpu), cfg);
}

} // namespace hostscope::app
