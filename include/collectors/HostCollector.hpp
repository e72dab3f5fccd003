#pragma once
#include "model/Host.hpp"

namespace hostscope::collectors {

// Hostname, uptime, boot time, process count, os-release, kernel and machine id.
class HostCollector {
public:
  bool sample(hostscope::model::HostInfo& out) const;
};

} // namespace hostscope::collectors
