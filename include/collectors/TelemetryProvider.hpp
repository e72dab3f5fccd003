#pragma once
#include <memory>
#include <vector>
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/DriveProbe.hpp"
#include "collectors/HostCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "model/Cpu.hpp"
#include "model/Disk.hpp"
#include "model/Host.hpp"
#include "model/Memory.hpp"
#include "model/Net.hpp"

namespace hostscope::collectors {

// Source of operating-system facts. Every call blocks and reports failure by
// returning false, leaving `out` untouched.
class ITelemetryProvider {
public:
  virtual ~ITelemetryProvider() = default;
  virtual bool cpu_info(std::vector<hostscope::model::CpuInfo>& out) = 0;
  virtual bool cpu_load(hostscope::model::CpuLoad& out) = 0;
  virtual bool disks(hostscope::model::DiskSnapshot& out) = 0;
  virtual bool memory(hostscope::model::Memory& out) = 0;
  virtual bool network(hostscope::model::NetSnapshot& out) = 0;
  virtual bool host(hostscope::model::HostInfo& out) = 0;
  virtual const char* name() const = 0;
};

// /proc, /sys and /etc backed provider.
class LinuxTelemetryProvider : public ITelemetryProvider {
public:
  explicit LinuxTelemetryProvider(std::unique_ptr<IDriveProbe> probe = make_drive_probe());

  bool cpu_info(std::vector<hostscope::model::CpuInfo>& out) override { return cpu_.identity(out); }
  bool cpu_load(hostscope::model::CpuLoad& out) override { return cpu_.sample(out); }
  bool disks(hostscope::model::DiskSnapshot& out) override { return disk_.sample(out); }
  bool memory(hostscope::model::Memory& out) override { return mem_.sample(out); }
  bool network(hostscope::model::NetSnapshot& out) override { return net_.sample(out); }
  bool host(hostscope::model::HostInfo& out) override { return host_.sample(out); }
  const char* name() const override { return "linux"; }

private:
  std::unique_ptr<IDriveProbe> probe_;
  CpuCollector cpu_{};
  MemoryCollector mem_{};
  NetCollector net_{};
  DiskCollector disk_;
  HostCollector host_{};
};

} // namespace hostscope::collectors
