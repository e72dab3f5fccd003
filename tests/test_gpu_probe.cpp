#include "minitest.hpp"
#include "collectors/GpuProbe.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace hostscope::collectors;
using hostscope::model::GpuVendor;
using hostscope::util::IProcessRunner;
using hostscope::util::ProcessResult;
using namespace std::chrono_literals;

namespace {

// Canned process results keyed by program name; counts every invocation.
class StubRunner : public IProcessRunner {
public:
  struct Reply { bool started{true}; int exit_code{0}; std::string out; };
  std::map<std::string, Reply> presence;  // argv == {tool}
  std::map<std::string, Reply> query;     // argv.size() > 1
  std::map<std::string, int> calls;
  std::vector<std::vector<std::string>> seen;

  ProcessResult run(const std::vector<std::string>& argv) override {
    seen.push_back(argv);
    ++calls[argv[0]];
    auto& table = argv.size() == 1 ? presence : query;
    ProcessResult r;
    auto it = table.find(argv[0]);
    if (it == table.end()) { r.started = false; r.exit_code = -1; return r; }
    r.started = it->second.started;
    r.exit_code = it->second.exit_code;
    r.out = it->second.out;
    return r;
  }
};

struct Rig {
  std::shared_ptr<StubRunner> runner = std::make_shared<StubRunner>();
  std::chrono::steady_clock::time_point t{std::chrono::steady_clock::time_point{} + 1h};

  std::unique_ptr<GpuProbe> make(std::chrono::milliseconds retry = 1000ms) {
    std::vector<std::unique_ptr<IGpuBackend>> b;
    b.push_back(std::make_unique<NvidiaSmiBackend>(runner, "nvidia-smi"));
    b.push_back(std::make_unique<RocmSmiBackend>(runner, "rocm-smi"));
    return std::make_unique<GpuProbe>(std::move(b), retry, [this] { return t; });
  }
};

} // namespace

TEST(gpu_probe_detects_nvidia_and_memoizes) {
  Rig rig;
  rig.runner->presence["nvidia-smi"] = {true, 0, "banner"};
  auto probe = rig.make();
  ASSERT_TRUE(probe->detect());
  ASSERT_TRUE(probe->identity().vendor == GpuVendor::Nvidia);
  for (int i = 0; i < 5; ++i) {
    rig.t += 10s;
    ASSERT_TRUE(probe->detect());
  }
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 1);
  ASSERT_EQ(rig.runner->calls["rocm-smi"], 0);
}

TEST(gpu_probe_falls_back_to_amd) {
  Rig rig;
  rig.runner->presence["nvidia-smi"] = {true, 9, ""};
  rig.runner->presence["rocm-smi"] = {true, 0, ""};
  auto probe = rig.make();
  ASSERT_TRUE(probe->detect());
  ASSERT_TRUE(probe->identity().vendor == GpuVendor::Amd);
  ASSERT_TRUE(probe->detect());
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 1);
  ASSERT_EQ(rig.runner->calls["rocm-smi"], 1);
}

TEST(gpu_probe_failure_is_not_cached) {
  Rig rig;
  auto probe = rig.make(0ms);
  ASSERT_TRUE(!probe->detect());
  ASSERT_TRUE(probe->identity().vendor == GpuVendor::None);
  ASSERT_TRUE(!probe->detect());
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 2);
  ASSERT_EQ(rig.runner->calls["rocm-smi"], 2);
  // hot-plugged later
  rig.runner->presence["nvidia-smi"] = {true, 0, ""};
  ASSERT_TRUE(probe->detect());
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 3);
}

TEST(gpu_probe_retry_backoff) {
  Rig rig;
  auto probe = rig.make(1000ms);
  ASSERT_TRUE(!probe->detect());
  rig.t += 500ms;
  ASSERT_TRUE(!probe->detect());
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 1);
  rig.t += 500ms;
  ASSERT_TRUE(!probe->detect());
  ASSERT_EQ(rig.runner->calls["nvidia-smi"], 2);
}

TEST(gpu_probe_samples_nvidia) {
  Rig rig;
  rig.runner->presence["nvidia-smi"] = {true, 0, ""};
  rig.runner->query["nvidia-smi"] = {true, 0,
    "0, NVIDIA GeForce RTX 3080, 42, 1024, 10240, 215.50, 65\r\n"
    "1, NVIDIA GeForce RTX 3070, 10, 512, 8192, 80.00, 50\r\n"};
  auto probe = rig.make();
  std::vector<hostscope::model::GpuSample> out;
  ASSERT_TRUE(probe->sample(out));
  ASSERT_EQ(out.size(), 2u);
  ASSERT_EQ(out[1].index, 1);
  ASSERT_EQ(probe->identity().name, "NVIDIA GeForce RTX 3080");

  const auto& argv = rig.runner->seen.back();
  ASSERT_EQ(argv.size(), 3u);
  ASSERT_EQ(argv[1], "--query-gpu=index,name,utilization.gpu,memory.used,memory.total,power.draw,temperature.gpu");
  ASSERT_EQ(argv[2], "--format=csv,noheader,nounits");

  // the display name is resolved once
  rig.runner->query["nvidia-smi"].out = "0, Renamed, 1, 1, 1, 1, 1\n";
  ASSERT_TRUE(probe->sample(out));
  ASSERT_EQ(probe->identity().name, "NVIDIA GeForce RTX 3080");
}

TEST(gpu_probe_tool_failure_leaves_output_untouched) {
  Rig rig;
  rig.runner->presence["nvidia-smi"] = {true, 0, ""};
  rig.runner->query["nvidia-smi"] = {true, 6, "NVIDIA-SMI has failed"};
  auto probe = rig.make();
  std::vector<hostscope::model::GpuSample> out(1);
  out[0].index = 99;
  ASSERT_TRUE(!probe->sample(out));
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].index, 99);
}

TEST(gpu_probe_samples_amd) {
  Rig rig;
  rig.runner->presence["rocm-smi"] = {true, 0, ""};
  rig.runner->query["rocm-smi"] = {true, 0,
    "device,Card series,GPU use (%),VRAM Total Memory (B),VRAM Total Used Memory (B),"
    "Average Graphics Package Power (W),Temperature (Sensor edge) (C)\n"
    "card0,Radeon RX 7900 XTX,12,25753026560,2147483648,48.0,41.0\n"};
  auto probe = rig.make();
  std::vector<hostscope::model::GpuSample> out;
  ASSERT_TRUE(probe->sample(out));
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].memory_used_mib, 2048.0);
  ASSERT_EQ(out[0].memory_total_mib, 24560.0);
  ASSERT_EQ(out[0].temperature_c, 41);
  ASSERT_EQ(probe->identity().name, "Radeon RX 7900 XTX");
  const auto& argv = rig.runner->seen.back();
  ASSERT_EQ(argv.back(), "--csv");
}

TEST(gpu_probe_sample_without_gpu) {
  Rig rig;
  auto probe = rig.make();
  std::vector<hostscope::model::GpuSample> out;
  ASSERT_TRUE(!probe->sample(out));
  ASSERT_TRUE(out.empty());
}
