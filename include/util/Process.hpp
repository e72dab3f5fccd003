#pragma once
#include <initializer_list>
#include <string>
#include <vector>

namespace hostscope::util {

struct ProcessResult {
  bool started{false};   // false when the program could not be spawned or found
  int exit_code{-1};     // -1 when terminated by a signal or never started
  std::string out;       // captured stdout
  [[nodiscard]] bool ok() const { return started && exit_code == 0; }
};

// Runs an external program to completion and captures its stdout.
// Implementations block for the lifetime of the child; there is no timeout.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;
  [[nodiscard]] virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// popen(3) based runner. stderr of the child is discarded.
class PopenProcessRunner : public IProcessRunner {
public:
  [[nodiscard]] ProcessResult run(const std::vector<std::string>& argv) override;
};

// Quote one argument for /bin/sh.
[[nodiscard]] std::string shell_quote(const std::string& arg);

// Resolve a vendor tool. A configured value other than "auto" (or empty) is
// returned as is; otherwise PATH is searched, then the fallback locations.
// When nothing is found the bare name is returned so the shell can still try.
[[nodiscard]] std::string resolve_tool(const std::string& configured, const char* name,
                                       std::initializer_list<const char*> fallbacks);

} // namespace hostscope::util
