#pragma once
#include <vector>
#include "model/Net.hpp"

namespace hostscope::collectors {

class NetCollector {
public:
  // Every interface in /proc/net/dev, including loopback.
  bool sample(hostscope::model::NetSnapshot& out);
private:
  // keep previous by interface name for deltas
  std::vector<hostscope::model::NetIf> last_{};
  double last_ts_{};
};

} // namespace hostscope::collectors
