#include "collectors/FsType.hpp"

#include <array>
#include <utility>

namespace hostscope::collectors {

using model::FsType;

namespace {

constexpr std::array<std::pair<std::string_view, FsType>, 11> kNames{{
  {"APFS",  FsType::APFS},
  {"exFAT", FsType::exFAT},
  {"FAT",   FsType::FAT},
  {"FAT32", FsType::FAT32},
  {"EXT",   FsType::EXT},
  {"EXT2",  FsType::EXT2},
  {"EXT3",  FsType::EXT3},
  {"EXT4",  FsType::EXT4},
  {"NTFS",  FsType::NTFS},
  {"JFS",   FsType::JFS},
  {"ZFS",   FsType::ZFS},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 12> kKernelNames{{
  {"ext",   "EXT"},
  {"ext2",  "EXT2"},
  {"ext3",  "EXT3"},
  {"ext4",  "EXT4"},
  {"vfat",  "FAT32"},
  {"msdos", "FAT"},
  {"exfat", "exFAT"},
  {"ntfs",  "NTFS"},
  {"ntfs3", "NTFS"},
  {"zfs",   "ZFS"},
  {"jfs",   "JFS"},
  {"apfs",  "APFS"},
}};

} // namespace

FsType normalize_fs_type(std::string_view name) {
  for (const auto& [n, t] : kNames) {
    if (n == name) return t;
  }
  return FsType::Unrecognized;
}

const char* fs_type_name(FsType t) {
  for (const auto& [n, v] : kNames) {
    if (v == t) return n.data();
  }
  return "";
}

std::string canonical_fs_name(std::string_view kernel_name) {
  for (const auto& [k, c] : kKernelNames) {
    if (k == kernel_name) return std::string(c);
  }
  return std::string(kernel_name);
}

} // namespace hostscope::collectors
