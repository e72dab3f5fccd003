#include "util/Process.hpp"
#include "util/Log.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace hostscope::util {

std::string shell_quote(const std::string& arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

ProcessResult PopenProcessRunner::run(const std::vector<std::string>& argv) {
  ProcessResult r;
  if (argv.empty()) return r;
  std::string cmd;
  for (const auto& a : argv) {
    if (!cmd.empty()) cmd += ' ';
    cmd += shell_quote(a);
  }
  cmd += " 2>/dev/null";

  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    hostscope::util::log_error("process: cannot spawn %s: %s", argv[0].c_str(), std::strerror(errno));
    return r;
  }
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) r.out.append(buf, n);
  int status = ::pclose(fp);
  if (status == -1) {
    hostscope::util::log_error("process: wait for %s failed: %s", argv[0].c_str(), std::strerror(errno));
    return r;
  }
  if (WIFEXITED(status)) {
    r.exit_code = WEXITSTATUS(status);
    // sh reports 127 (not found) and 126 (not executable) for programs it could not exec
    r.started = !(r.exit_code == 127 || r.exit_code == 126);
  } else {
    r.started = true;
    r.exit_code = -1;
  }
  hostscope::util::log_debug("process: %s exited with %d (%zu bytes)", argv[0].c_str(), r.exit_code, r.out.size());
  return r;
}

static bool is_executable(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return false;
  auto pm = std::filesystem::status(path, ec).permissions();
  if (ec) return false;
  using std::filesystem::perms;
  return (pm & (perms::owner_exec | perms::group_exec | perms::others_exec)) != perms::none;
}

std::string resolve_tool(const std::string& configured, const char* name,
                         std::initializer_list<const char*> fallbacks) {
  if (!configured.empty() && configured != "auto") return configured;
  if (const char* path = std::getenv("PATH"); path && *path) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (is_executable(cand)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  for (const char* c : fallbacks) {
    if (is_executable(c)) return c;
  }
  return name;
}

} // namespace hostscope::util
