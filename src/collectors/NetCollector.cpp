#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace hostscope::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

bool NetCollector::sample(hostscope::model::NetSnapshot& out) {
  auto txt_opt = hostscope::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0; double ts = now_secs();
  std::vector<hostscope::model::NetIf> cur;
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // iface: rx bytes packets errs drop fifo frame compressed multicast | tx bytes packets errs drop ...
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    hostscope::model::NetIf nif;
    nif.name = hostscope::util::trim(line.substr(0, colon));
    std::istringstream ns(line.substr(colon + 1));
    uint64_t v[16]{};
    int n = 0;
    while (n < 16 && (ns >> v[n])) ++n;
    if (n < 12) continue;
    nif.bytes_recv = v[0]; nif.packets_recv = v[1]; nif.errin = v[2]; nif.dropin = v[3];
    nif.bytes_sent = v[8]; nif.packets_sent = v[9]; nif.errout = v[10]; nif.dropout = v[11];
    for (auto& p : last_) {
      if (p.name == nif.name) {
        double dt = ts - last_ts_; if (dt <= 0.0) dt = 1.0;
        // counters reset when an interface is recreated
        if (nif.bytes_recv >= p.bytes_recv) nif.rx_bps = static_cast<double>(nif.bytes_recv - p.bytes_recv) / dt;
        if (nif.bytes_sent >= p.bytes_sent) nif.tx_bps = static_cast<double>(nif.bytes_sent - p.bytes_sent) / dt;
        break;
      }
    }
    cur.push_back(std::move(nif));
  }
  last_ = cur; last_ts_ = ts;
  out.interfaces = std::move(cur);
  return true;
}

} // namespace hostscope::collectors
