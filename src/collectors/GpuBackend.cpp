#include "collectors/GpuBackend.hpp"
#include "collectors/SmiDecoder.hpp"
#include "util/Log.hpp"

namespace hostscope::collectors {

static bool run_tool(hostscope::util::IProcessRunner& runner, const std::vector<std::string>& argv,
                     std::string& out) {
  auto r = runner.run(argv);
  if (!r.started) {
    hostscope::util::log_error("%s: could not be started", argv.front().c_str());
    return false;
  }
  if (r.exit_code != 0) {
    hostscope::util::log_error("%s: exited with status %d", argv.front().c_str(), r.exit_code);
    return false;
  }
  out = std::move(r.out);
  return true;
}

bool NvidiaSmiBackend::detect() {
  return runner_->run({tool_}).ok();
}

bool NvidiaSmiBackend::query(hostscope::model::GpuReading& out) {
  std::string text;
  if (!run_tool(*runner_, {tool_, nvidia_query_arg(), "--format=csv,noheader,nounits"}, text)) return false;
  hostscope::model::GpuReading r;
  if (!decode_nvidia_smi(text, r)) return false;
  out = std::move(r);
  return true;
}

bool RocmSmiBackend::detect() {
  return runner_->run({tool_}).ok();
}

bool RocmSmiBackend::query(hostscope::model::GpuReading& out) {
  std::string text;
  if (!run_tool(*runner_, {tool_, "--showproductname", "--showuse", "--showmeminfo", "vram",
                           "--showpower", "--showtemp", "--csv"}, text)) return false;
  hostscope::model::GpuReading r;
  if (!decode_rocm_smi_csv(text, r)) return false;
  out = std::move(r);
  return true;
}

} // namespace hostscope::collectors
