#pragma once
#include <array>
#include <string>
#include <string_view>
#include "model/Gpu.hpp"

namespace hostscope::collectors {

// Columns requested from nvidia-smi, in output order. The query argument and
// the decoder are both driven by this table.
struct SmiColumn {
  const char* query;   // --query-gpu property
  const char* field;   // name used in diagnostics
};

inline constexpr std::array<SmiColumn, 7> kNvidiaColumns{{
  {"index",           "index"},
  {"name",            "name"},
  {"utilization.gpu", "load"},
  {"memory.used",     "memory-used"},
  {"memory.total",    "memory-total"},
  {"power.draw",      "power"},
  {"temperature.gpu", "temperature"},
}};

// "--query-gpu=index,name,..."
[[nodiscard]] std::string nvidia_query_arg();

// Decode `--format=csv,noheader,nounits` output. Each non-empty line yields one
// sample; a field that fails to parse is logged and left at zero. Lines with
// fewer than seven fields are logged and skipped. The first device name seen
// is stored in out.device_name. Returns false only when every non-empty line
// was skipped.
bool decode_nvidia_smi(std::string_view text, hostscope::model::GpuReading& out);

// Decode `rocm-smi ... --csv` output keyed by its header row. Memory is
// reported in bytes and converted to MiB. Returns false without a header.
bool decode_rocm_smi_csv(std::string_view text, hostscope::model::GpuReading& out);

} // namespace hostscope::collectors
