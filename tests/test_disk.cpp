#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/DriveProbe.hpp"
#include <cmath>
#include <optional>
#include <set>

using namespace hostscope::collectors;
using hostscope::model::FsType;

namespace {

// Every mount is fixed; only "virtual" paths lack I/O counters.
class PathProbe : public IDriveProbe {
public:
  std::set<std::string> virtual_paths;
  std::set<std::string> asked;
  bool supported() const override { return true; }
  std::optional<DriveType> drive_type(const std::string& m) override { asked.insert(m); return DriveType::Fixed; }
  std::optional<std::size_t> io_counter_count(const std::string& m) override {
    return virtual_paths.count(m) ? 0u : 1u;
  }
  const char* name() const override { return "path"; }
};

} // namespace

TEST(disk_collector_lists_user_visible_mounts) {
  auto root = fixture::make_root("disk");
  auto data = (root / "data").string();
  auto cloud = (root / "cloud").string();
  std::filesystem::create_directories(data);
  std::filesystem::create_directories(cloud);
  fixture::write(root / "proc/self/mounts",
    "proc /proc proc rw 0 0\n"
    "sysfs /sys sysfs rw 0 0\n"
    "tmpfs /run tmpfs rw 0 0\n"
    "tmpfs /run/user/1000 tmpfs rw 0 0\n"
    "devpts /dev/pts devpts rw 0 0\n"
    "cgroup2 /sys/fs/cgroup cgroup2 rw 0 0\n"
    "/dev/sda1 " + data + " vfat rw 0 0\n"
    "/dev/sda2 " + data + " ext4 rw 0 0\n"
    "gdrive: " + cloud + " fuse.rclone rw 0 0\n"
    "/dev/sdz9 /definitely/not/mounted/here ext4 rw 0 0\n");
  fixture::ScopedEnv env("HOSTSCOPE_PROC_ROOT", root.string());

  PathProbe probe;
  probe.virtual_paths.insert(cloud);
  DiskCollector c(probe);
  hostscope::model::DiskSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.disks.size(), 2u);

  const auto& d = s.disks[0];
  // the later mount on the same path shadows the earlier one
  ASSERT_EQ(d.mountpoint, data);
  ASSERT_EQ(d.device, "/dev/sda2");
  ASSERT_TRUE(d.fs_type == FsType::EXT4);
  ASSERT_EQ(d.fs_name, "EXT4");
  ASSERT_TRUE(!d.is_virtual);
  ASSERT_TRUE(d.total_bytes > 0);
  ASSERT_TRUE(d.used_pct >= 0.0 && d.used_pct <= 100.0);
  // two decimals
  ASSERT_NEAR(d.used_pct * 100.0, std::round(d.used_pct * 100.0), 1e-6);

  const auto& v = s.disks[1];
  ASSERT_EQ(v.mountpoint, cloud);
  ASSERT_TRUE(v.fs_type == FsType::Unrecognized);
  ASSERT_EQ(v.fs_name, "fuse.rclone");
  ASSERT_TRUE(v.is_virtual);

  ASSERT_TRUE(probe.asked.count("/run") == 0);
  ASSERT_TRUE(probe.asked.count("/proc") == 0);
}

TEST(disk_collector_without_mount_table_fails) {
  auto root = fixture::make_root("disk_none");
  fixture::ScopedEnv env("HOSTSCOPE_PROC_ROOT", root.string());
  NullDriveProbe probe;
  DiskCollector c(probe);
  hostscope::model::DiskSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
}

TEST(disk_user_visible_mount_filter) {
  ASSERT_TRUE(is_user_visible_mount("/", "ext4"));
  ASSERT_TRUE(is_user_visible_mount("/home", "btrfs"));
  ASSERT_TRUE(is_user_visible_mount("/tmp", "tmpfs"));
  ASSERT_TRUE(is_user_visible_mount("/running", "ext4"));
  ASSERT_TRUE(!is_user_visible_mount("/run/media", "ext4"));
  ASSERT_TRUE(!is_user_visible_mount("/dev/shm", "tmpfs"));
  ASSERT_TRUE(!is_user_visible_mount("/snap/core/1", "squashfs"));
  ASSERT_TRUE(!is_user_visible_mount("/", "overlay"));
}
