#pragma once
#include <string>
#include <string_view>
#include "model/Disk.hpp"

namespace hostscope::collectors {

// Exact, case-sensitive match against the closed FsType list.
// Anything else maps to FsType::Unrecognized.
[[nodiscard]] model::FsType normalize_fs_type(std::string_view name);

// Canonical spelling of an FsType ("" for Unrecognized).
[[nodiscard]] const char* fs_type_name(model::FsType t);

// Kernel filesystem name (ext4, vfat, ntfs3, ...) to the spelling
// normalize_fs_type expects. Unknown names pass through unchanged.
[[nodiscard]] std::string canonical_fs_name(std::string_view kernel_name);

} // namespace hostscope::collectors
