#include "minitest.hpp"
#include "fakes.hpp"
#include "collectors/SystemDeviceInspector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace autogrow;

static fs::path make_sys_root(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("autogrow_test_sys_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sys/block/nvme1n1/nvme1n1p1");
  fs::create_directories(root / "sys/block/nvme1n1/nvme1n1p128");
  fs::create_directories(root / "sys/block/nvme1n1/queue");
  fs::create_directories(root / "sys/class/block/nvme1n1");
  std::ofstream(root / "sys/block/nvme1n1/nvme1n1p1/partition") << "1\n";
  std::ofstream(root / "sys/block/nvme1n1/nvme1n1p1/size") << "188743680\n";   // 90 GiB
  std::ofstream(root / "sys/block/nvme1n1/nvme1n1p128/partition") << "128\n";
  std::ofstream(root / "sys/block/nvme1n1/nvme1n1p128/size") << "2048\n";      // 1 MiB
  std::ofstream(root / "sys/class/block/nvme1n1/size") << "209715200\n";       // 100 GiB
  return root;
}

TEST(inspector_device_bytes_from_sysfs) {
  auto root = make_sys_root("bytes");
  setenv("AUTOGROW_SYS_ROOT", root.c_str(), 1);
  fakes::FakeRunner runner;
  collectors::SystemDeviceInspector ins(runner);
  auto b = ins.device_bytes("/dev/nvme1n1");
  ASSERT_TRUE(b.is_ok());
  ASSERT_EQ(*b, 100ULL * fakes::kGiB);
  ASSERT_TRUE(!ins.device_bytes("/dev/nvme9n1").is_ok());
  unsetenv("AUTOGROW_SYS_ROOT");
  fs::remove_all(root);
}

TEST(inspector_lists_partitions_only) {
  auto root = make_sys_root("parts");
  setenv("AUTOGROW_SYS_ROOT", root.c_str(), 1);
  fakes::FakeRunner runner;
  collectors::SystemDeviceInspector ins(runner);
  auto parts = ins.partitions("/dev/nvme1n1");
  ASSERT_TRUE(parts.is_ok());
  ASSERT_EQ(parts->size(), 2u);
  ASSERT_EQ((*parts)[0].path, "/dev/nvme1n1p1");
  ASSERT_EQ((*parts)[0].bytes, 90ULL * fakes::kGiB);
  ASSERT_EQ((*parts)[1].bytes, 1024ULL * 1024ULL);
  ASSERT_TRUE(!ins.partitions("/dev/nvme9n1").is_ok());
  unsetenv("AUTOGROW_SYS_ROOT");
  fs::remove_all(root);
}

TEST(inspector_growpart_nochange_is_success) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>&) {
    return util::CommandResult{1, "NOCHANGE: partition 1 is size 188743680. it cannot be grown\n", ""};
  };
  collectors::SystemDeviceInspector ins(runner);
  ASSERT_TRUE(ins.grow_partition("/dev/nvme1n1", 1).is_ok());
  ASSERT_EQ(runner.calls[0], (std::vector<std::string>{"growpart", "/dev/nvme1n1", "1"}));
}

TEST(inspector_growpart_failure_is_error) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>&) {
    return util::CommandResult{2, "", "FAILED: failed to resize\n"};
  };
  collectors::SystemDeviceInspector ins(runner);
  auto st = ins.grow_partition("/dev/nvme1n1", 1);
  ASSERT_TRUE(!st.is_ok());
  ASSERT_TRUE(st.message().find("FAILED") != std::string::npos);
}

TEST(inspector_filesystem_commands) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>& argv) {
    if (argv[0] == "blkid") return util::CommandResult{0, "xfs\n", ""};
    return util::CommandResult{0, "", ""};
  };
  collectors::SystemDeviceInspector ins(runner);
  auto type = ins.filesystem_type("/dev/nvme1n1p1");
  ASSERT_TRUE(type.is_ok());
  ASSERT_EQ(*type, "xfs");
  ASSERT_TRUE(ins.grow_filesystem("xfs", "/data").is_ok());
  ASSERT_TRUE(ins.grow_filesystem("ext4", "/dev/xvdf").is_ok());
  ASSERT_EQ(runner.calls[1], (std::vector<std::string>{"xfs_growfs", "-d", "/data"}));
  ASSERT_EQ(runner.calls[2], (std::vector<std::string>{"resize2fs", "/dev/xvdf"}));
}

TEST(inspector_blkid_without_signature_is_error) {
  fakes::FakeRunner runner;
  collectors::SystemDeviceInspector ins(runner);
  ASSERT_TRUE(!ins.filesystem_type("/dev/xvdz").is_ok());
}

TEST(inspector_statvfs_on_tmp) {
  fakes::FakeRunner runner;
  collectors::SystemDeviceInspector ins(runner);
  auto u = ins.filesystem_usage(fs::temp_directory_path().string());
  ASSERT_TRUE(u.is_ok());
  ASSERT_TRUE(u->total_bytes > 0);
  ASSERT_TRUE(u->used_pct >= 0.0 && u->used_pct <= 100.0);
  ASSERT_TRUE(!ins.filesystem_usage("/nonexistent/autogrow/mount").is_ok());
}
