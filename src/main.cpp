#include "app/Config.hpp"
#include "app/HostSampler.hpp"
#include "app/Serialize.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

enum class Format { Text, Json, Pretty };

static void usage(std::ostream& os) {
  os << "Usage: hostscope [--once] [--format text|json|pretty] [--interval-ms N] [--config PATH]\n";
  os << "Notes: polls until Ctrl+C unless --once is given.\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  bool once = false;
  Format format = Format::Text;
  int interval_ms = 1000;
  std::string config_path = hostscope::app::config_file_path();
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a == "--once") once = true;
      else if (a == "--format" && i + 1 < argc) {
        std::string f = argv[++i];
        if (f == "text") format = Format::Text;
        else if (f == "json") format = Format::Json;
        else if (f == "pretty") format = Format::Pretty;
        else { std::cerr << "hostscope: unknown format '" << f << "'\n"; usage(std::cerr); return 2; }
      }
      else if (a == "--interval-ms" && i + 1 < argc) interval_ms = std::stoi(argv[++i]);
      else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
      else { std::cerr << "hostscope: unknown argument '" << a << "'\n"; usage(std::cerr); return 2; }
    } catch (const std::exception&) {
      std::cerr << "hostscope: invalid value for " << a << "\n";
      return 2;
    }
  }
  if (interval_ms < 10) interval_ms = 10;

  auto cfg = hostscope::app::load_config(config_path);
  hostscope::util::set_log_level(cfg.log_level);
  auto sampler = hostscope::app::make_host_sampler(cfg);

  while (!g_stop.load()) {
    auto snap = sampler->snapshot();
    switch (format) {
      case Format::Text:   std::cout << hostscope::app::to_text(snap); break;
      case Format::Json:   std::cout << hostscope::app::encode(snap, false) << "\n"; break;
      case Format::Pretty: std::cout << hostscope::app::encode(snap, true) << "\n"; break;
    }
    std::cout.flush();
    if (once) break;
    if (format == Format::Text) std::cout << "\n";
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms);
    while (!g_stop.load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }
  }
  return 0;
}
