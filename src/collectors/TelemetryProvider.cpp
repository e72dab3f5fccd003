#include "collectors/TelemetryProvider.hpp"

namespace hostscope::collectors {

LinuxTelemetryProvider::LinuxTelemetryProvider(std::unique_ptr<IDriveProbe> probe)
  : probe_(probe ? std::move(probe) : std::make_unique<NullDriveProbe>()), disk_(*probe_) {}

} // namespace hostscope::collectors
