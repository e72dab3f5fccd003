#pragma once
#include <memory>
#include <string>
#include "model/Gpu.hpp"
#include "util/Process.hpp"

namespace hostscope::collectors {

// One vendor management tool.
class IGpuBackend {
public:
  virtual ~IGpuBackend() = default;
  [[nodiscard]] virtual hostscope::model::GpuVendor vendor() const = 0;
  // Runs the tool without arguments; a zero exit status means the vendor is present.
  virtual bool detect() = 0;
  // One sampling pass. False when the tool cannot be run or fails.
  virtual bool query(hostscope::model::GpuReading& out) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

class NvidiaSmiBackend : public IGpuBackend {
public:
  NvidiaSmiBackend(std::shared_ptr<hostscope::util::IProcessRunner> runner, std::string tool)
    : runner_(std::move(runner)), tool_(std::move(tool)) {}
  hostscope::model::GpuVendor vendor() const override { return hostscope::model::GpuVendor::Nvidia; }
  bool detect() override;
  bool query(hostscope::model::GpuReading& out) override;
  const char* name() const override { return "nvidia-smi"; }
private:
  std::shared_ptr<hostscope::util::IProcessRunner> runner_;
  std::string tool_;
};

class RocmSmiBackend : public IGpuBackend {
public:
  RocmSmiBackend(std::shared_ptr<hostscope::util::IProcessRunner> runner, std::string tool)
    : runner_(std::move(runner)), tool_(std::move(tool)) {}
  hostscope::model::GpuVendor vendor() const override { return hostscope::model::GpuVendor::Amd; }
  bool detect() override;
  bool query(hostscope::model::GpuReading& out) override;
  const char* name() const override { return "rocm-smi"; }
private:
  std::shared_ptr<hostscope::util::IProcessRunner> runner_;
  std::string tool_;
};

} // namespace hostscope::collectors
