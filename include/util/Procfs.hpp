// Helpers for reading /proc, /sys and /etc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace hostscope::util {

// Map an absolute /proc path to an alternate root if HOSTSCOPE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if HOSTSCOPE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /etc path to an alternate root if HOSTSCOPE_ETC_ROOT is set
auto map_etc_path(const std::string& abs) -> std::string;

// Apply whichever of the three remaps matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// First line of a file with trailing whitespace removed.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Trim spaces, tabs, CR and LF from both ends.
auto trim(std::string s) -> std::string;

} // namespace hostscope::util
