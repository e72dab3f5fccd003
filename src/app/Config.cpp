#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace hostscope::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTSCOPE_", 0) == 0) {
    alt = std::string("hostscope_") + n.substr(10);
  } else if (n.rfind("hostscope_", 0) == 0) {
    alt = std::string("HOSTSCOPE_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostscope/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostscope/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const hostscope::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const hostscope::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const hostscope::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  hostscope::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [intervals] ---
  c.intervals.cpu_ms     = resolve_int(toml, have_toml, "intervals", "cpu_ms",     "HOSTSCOPE_CPU_INTERVAL_MS",     1000);
  c.intervals.disk_ms    = resolve_int(toml, have_toml, "intervals", "disk_ms",    "HOSTSCOPE_DISK_INTERVAL_MS",    60000);
  c.intervals.gpu_ms     = resolve_int(toml, have_toml, "intervals", "gpu_ms",     "HOSTSCOPE_GPU_INTERVAL_MS",     1000);
  c.intervals.memory_ms  = resolve_int(toml, have_toml, "intervals", "memory_ms",  "HOSTSCOPE_MEMORY_INTERVAL_MS",  1000);
  c.intervals.network_ms = resolve_int(toml, have_toml, "intervals", "network_ms", "HOSTSCOPE_NETWORK_INTERVAL_MS", 1000);
  c.intervals.host_ms    = resolve_int(toml, have_toml, "intervals", "host_ms",    "HOSTSCOPE_HOST_INTERVAL_MS",    1000);
  for (int* v : {&c.intervals.cpu_ms, &c.intervals.disk_ms, &c.intervals.gpu_ms,
                 &c.intervals.memory_ms, &c.intervals.network_ms, &c.intervals.host_ms}) {
    *v = std::max(0, *v);
  }

  // --- [gpu] ---
  c.gpu.enabled         = resolve_bool(toml, have_toml, "gpu", "enabled",         "HOSTSCOPE_GPU", true);
  c.gpu.nvidia_smi_path = resolve_string(toml, have_toml, "gpu", "nvidia_smi_path", "HOSTSCOPE_NVIDIA_SMI_PATH", "auto");
  c.gpu.rocm_smi_path   = resolve_string(toml, have_toml, "gpu", "rocm_smi_path",   "HOSTSCOPE_ROCM_SMI_PATH", "auto");
  c.gpu.detect_retry_ms = std::max(0, resolve_int(toml, have_toml, "gpu", "detect_retry_ms", "HOSTSCOPE_GPU_DETECT_RETRY_MS", 1000));

  // --- [cpu] ---
  c.cpu.history = std::clamp(resolve_int(toml, have_toml, "cpu", "history", "HOSTSCOPE_CPU_HISTORY", 60), 1, 86400);

  // --- [log] ---
  auto level = resolve_string(toml, have_toml, "log", "level", "HOSTSCOPE_LOG_LEVEL", "warn");
  c.log_level = hostscope::util::parse_log_level(level, hostscope::util::LogLevel::Warn);

  return c;
}

} // namespace hostscope::app
