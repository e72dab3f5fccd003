#pragma once
#include "model/Memory.hpp"

namespace hostscope::collectors {

class MemoryCollector {
public:
  bool sample(hostscope::model::Memory& out) const; // returns true on success
};

} // namespace hostscope::collectors
