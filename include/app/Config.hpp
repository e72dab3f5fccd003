#pragma once

#include <string>
#include "util/Log.hpp"

namespace hostscope::app {

struct Config {
  struct Intervals {
    int cpu_ms{1000};
    int disk_ms{60000};
    int gpu_ms{1000};
    int memory_ms{1000};
    int network_ms{1000};
    int host_ms{1000};
  } intervals;

  struct Gpu {
    bool enabled{true};
    std::string nvidia_smi_path{"auto"};
    std::string rocm_smi_path{"auto"};
    int detect_retry_ms{1000};
  } gpu;

  struct Cpu {
    int history{60};   // CPU load samples kept
  } cpu;

  hostscope::util::LogLevel log_level{hostscope::util::LogLevel::Warn};
};

// Resolve every key TOML -> env -> compiled default. An empty path or a
// missing file leaves only env and defaults. Out-of-range values are clamped.
[[nodiscard]] Config load_config(const std::string& path);

// $XDG_CONFIG_HOME/hostscope/config.toml, else ~/.config/hostscope/config.toml.
[[nodiscard]] std::string config_file_path();

// Environment variable helpers. HOSTSCOPE_X also answers to hostscope_X.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace hostscope::app
