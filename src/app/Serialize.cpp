#include "app/Serialize.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/FsType.hpp"
#include "util/Units.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace hostscope::app {

using namespace hostscope::model;

// Shortest representation that round-trips: 215.5, 0.42, 65
static std::string num(double v) {
  char buf[64];
  auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc()) return "0";
  return std::string(buf, p);
}

Json to_json(const CpuInfo& c) {
  Json j;
  j["id"] = c.id;
  j["name"] = c.name;
  j["vendor"] = c.vendor;
  j["count_physical"] = c.physical_cores;
  j["count_logical"] = c.logical_cores;
  return j;
}

Json to_json(const CpuLoad& l) {
  Json j;
  j["usagePercent"] = l.usage_pct;
  j["perCore"] = l.per_core_pct;
  j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(l.timestamp.time_since_epoch()).count();
  return j;
}

Json to_json(const DiskRecord& d) {
  Json j;
  j["mountpoint"] = d.mountpoint;
  j["device"] = d.device;
  j["fs_type"] = static_cast<int>(d.fs_type);
  j["fs_name"] = d.fs_name;
  j["is_virtual_disk"] = d.is_virtual;
  j["free"] = d.free_bytes;
  j["used"] = d.used_bytes;
  j["used_percent"] = d.used_pct;
  j["total"] = d.total_bytes;
  return j;
}

Json to_json(const GpuSample& g) {
  Json j;
  j["card-id"] = g.index;
  j["load"] = g.load;
  j["memoryUsage"] = g.memory_used_mib;
  j["memoryTotal"] = g.memory_total_mib;
  j["power"] = g.power_w;
  j["temperature"] = g.temperature_c;
  return j;
}

Json to_json(const Memory& m) {
  Json j;
  j["total"] = m.total;
  j["available"] = m.available;
  j["used"] = m.used;
  j["usedPercent"] = m.used_pct;
  j["free"] = m.free;
  j["buffers"] = m.buffers;
  j["cached"] = m.cached;
  j["swapTotal"] = m.swap_total;
  j["swapFree"] = m.swap_free;
  j["swapUsed"] = m.swap_used;
  return j;
}

Json to_json(const NetIf& n) {
  Json j;
  j["name"] = n.name;
  j["bytesSent"] = n.bytes_sent;
  j["bytesRecv"] = n.bytes_recv;
  j["packetsSent"] = n.packets_sent;
  j["packetsRecv"] = n.packets_recv;
  j["errin"] = n.errin;
  j["errout"] = n.errout;
  j["dropin"] = n.dropin;
  j["dropout"] = n.dropout;
  return j;
}

Json to_json(const HostInfo& h) {
  Json j;
  j["hostname"] = h.hostname;
  j["uptime"] = h.uptime_s;
  j["bootTime"] = h.boot_time;
  j["procs"] = h.procs;
  j["os"] = h.os;
  j["platform"] = h.platform;
  j["platformFamily"] = h.platform_family;
  j["platformVersion"] = h.platform_version;
  j["kernelVersion"] = h.kernel_version;
  j["kernelArch"] = h.kernel_arch;
  j["hostId"] = h.host_id;
  return j;
}

template <typename P, typename F>
static Json or_null(const P& p, F&& f) {
  return p ? f(*p) : Json(nullptr);
}

Json to_json(const Snapshot& s) {
  Json j;
  j["cpu"] = or_null(s.cpu_info, [](const auto& v) { return to_json(v); });
  j["cpuLoad"] = or_null(s.cpu_load, [](const auto& v) { return to_json(v); });
  j["memory"] = or_null(s.memory, [](const auto& v) { return to_json(v); });
  j["disks"] = or_null(s.disks, [](const auto& v) { return to_json(v.disks); });
  j["network"] = or_null(s.network, [](const auto& v) { return to_json(v.interfaces); });
  j["host"] = or_null(s.host, [](const auto& v) { return to_json(v); });
  Json gpu;
  gpu["vendor"] = gpu_vendor_name(s.gpu.vendor);
  gpu["name"] = s.gpu.name;
  gpu["cards"] = or_null(s.gpu_stats, [](const auto& v) { return to_json(v); });
  j["gpu"] = std::move(gpu);
  return j;
}

std::string dump(const Json& j, bool indent) {
  return j.dump(indent ? 2 : -1, ' ', false, Json::error_handler_t::replace);
}

std::string to_string(const CpuInfo& c) {
  return "socket #" + std::to_string(c.id) + ", name=" + c.name + ", vendor=" + c.vendor +
         ", countPhys=" + std::to_string(c.physical_cores) + ", countLogical=" + std::to_string(c.logical_cores);
}

std::string to_string(const GpuSample& g) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "gfx card #%d, %ld%%, %.0f MiB, %.0f MiB, %sW, %d°C",
                g.index, std::lround(g.load * 100.0), g.memory_used_mib, g.memory_total_mib,
                num(g.power_w).c_str(), g.temperature_c);
  return buf;
}

std::string to_string(const CpuLoad& l) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "cpu %.1f%%, %zu cores", l.usage_pct, l.per_core_pct.size());
  return buf;
}

std::string to_string(const DiskRecord& d) {
  char buf[512];
  std::snprintf(buf, sizeof(buf), "%s on %s (%s%s), %.2f/%.2f GB used, %s%%",
                d.device.c_str(), d.mountpoint.c_str(),
                d.fs_type == FsType::Unrecognized ? d.fs_name.c_str() : hostscope::collectors::fs_type_name(d.fs_type),
                d.is_virtual ? ", virtual" : "",
                hostscope::util::bytes_to_gb(d.used_bytes), hostscope::util::bytes_to_gb(d.total_bytes),
                num(d.used_pct).c_str());
  return buf;
}

std::string to_string(const Memory& m) { return dump(to_json(m), false); }
std::string to_string(const NetIf& n) { return dump(to_json(n), false); }
std::string to_string(const HostInfo& h) { return dump(to_json(h), false); }

std::string to_text(const Snapshot& s) {
  std::string out;
  if (s.host) {
    out += "host    " + s.host->hostname + " (" + s.host->platform + " " + s.host->platform_version +
           ", kernel " + s.host->kernel_version + ", up " + std::to_string(s.host->uptime_s) + "s)\n";
  }
  if (s.cpu_info) {
    for (const auto& c : *s.cpu_info) {
      out += "cpu     " + hostscope::collectors::format_cpu_model_name(c.vendor, c.name) +
             " [" + to_string(c) + "]\n";
    }
  }
  if (s.cpu_load) out += "load    " + to_string(*s.cpu_load) + "\n";
  if (s.memory) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "memory  %.2f/%.2f GiB used (%.1f%%)\n",
                  hostscope::util::bytes_to_gib(s.memory->used), hostscope::util::bytes_to_gib(s.memory->total),
                  s.memory->used_pct);
    out += buf;
  }
  if (s.disks) {
    for (const auto& d : s.disks->disks) out += "disk    " + to_string(d) + "\n";
  }
  if (s.network) {
    for (const auto& n : s.network->interfaces) {
      char buf[256];
      std::snprintf(buf, sizeof(buf), "net     %s rx %llu B (%.0f B/s) tx %llu B (%.0f B/s)\n", n.name.c_str(),
                    static_cast<unsigned long long>(n.bytes_recv), n.rx_bps,
                    static_cast<unsigned long long>(n.bytes_sent), n.tx_bps);
      out += buf;
    }
  }
  if (s.gpu.vendor != GpuVendor::None) {
    out += std::string("gpu     ") + gpu_vendor_name(s.gpu.vendor) + " " + s.gpu.name + "\n";
    if (s.gpu_stats) {
      for (const auto& g : *s.gpu_stats) out += "        " + to_string(g) + "\n";
    }
  }
  return out;
}

} // namespace hostscope::app
