#include "minitest.hpp"
#include "fakes.hpp"
#include "app/GrowthExecutor.hpp"

using namespace autogrow;
using fakes::kGiB;

static constexpr app::PollPolicy kDevicePoll{12, std::chrono::seconds(5)};

TEST(partition_index_cases) {
  ASSERT_EQ(*app::partition_index("nvme1n1", "/dev/nvme1n1p2").value(), 2);
  ASSERT_EQ(*app::partition_index("xvdf", "/dev/xvdf1").value(), 1);
  ASSERT_EQ(*app::partition_index("mmcblk0", "/dev/mmcblk0p12").value(), 12);
  ASSERT_TRUE(!app::partition_index("xvdf", "/dev/xvdf").value().has_value());
  ASSERT_TRUE(!app::partition_index("xvdf", "/dev/xvdg1").is_ok());
  ASSERT_TRUE(!app::partition_index("nvme1n1", "/dev/nvme1n1px").is_ok());
}

TEST(growth_partition_grows_before_filesystem) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/nvme1n1"] = {110 * kGiB};
  ins.fstype = "ext4";
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-a", "nvme1n1", "/data", "/dev/nvme1n1p1"), 110);
  ASSERT_TRUE(st.is_ok());
  int gp = ins.index_of("grow_partition:/dev/nvme1n1:1");
  int ft = ins.index_of("fstype:/dev/nvme1n1p1");
  int gf = ins.index_of("grow_fs:ext4:/dev/nvme1n1p1");
  ASSERT_TRUE(gp >= 0);
  ASSERT_TRUE(gp < ft);
  ASSERT_TRUE(ft < gf);
  ASSERT_TRUE(clock.sleeps.empty());
}

TEST(growth_whole_device_never_grows_partition) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/xvdf"] = {60 * kGiB};
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"), 60);
  ASSERT_TRUE(st.is_ok());
  ASSERT_EQ(ins.count("grow_partition:"), 0);
  ASSERT_EQ(ins.count("grow_fs:ext4:/dev/xvdf"), 1);
}

TEST(growth_xfs_grows_via_mountpoint) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/nvme2n1"] = {200 * kGiB};
  ins.fstype = "xfs";
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-c", "nvme2n1", "/var/lib/data", "/dev/nvme2n1p1"), 200);
  ASSERT_TRUE(st.is_ok());
  ASSERT_EQ(ins.count("grow_fs:xfs:/var/lib/data"), 1);
}

TEST(growth_waits_for_device_size_to_converge) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/xvdf"] = {50 * kGiB, 50 * kGiB, 60 * kGiB};
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"), 60);
  ASSERT_TRUE(st.is_ok());
  ASSERT_EQ(clock.sleeps.size(), 2u);
  ASSERT_EQ(clock.sleeps[0], std::chrono::seconds(5));
}

TEST(growth_convergence_timeout_skips_growth) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/xvdf"] = {50 * kGiB};
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"), 60);
  ASSERT_TRUE(!st.is_ok());
  ASSERT_TRUE(st.error().code == util::Errc::PollTimeout);
  ASSERT_EQ(ins.count("bytes:/dev/xvdf"), 12);
  ASSERT_EQ(clock.sleeps.size(), 11u);
  ASSERT_EQ(ins.count("fstype:"), 0);
  ASSERT_EQ(ins.count("grow_fs:"), 0);
}

TEST(growth_partition_failure_aborts_sequence) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  ins.bytes["/dev/nvme1n1"] = {110 * kGiB};
  ins.grow_partition_status = util::Status::transient("growpart failed");
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-a", "nvme1n1", "/data", "/dev/nvme1n1p1"), 110);
  ASSERT_TRUE(!st.is_ok());
  ASSERT_EQ(ins.count("fstype:"), 0);
}

TEST(growth_unknown_filesystem_falls_back_with_warning) {
  fakes::FakeInspector ins; fakes::FakeClock clock;
  fakes::LogCapture logs;
  ins.bytes["/dev/xvdf"] = {60 * kGiB};
  ins.fstype = "btrfs";
  app::GrowthExecutor g(ins, clock, kDevicePoll);
  auto st = g.grow(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"), 60);
  ASSERT_TRUE(st.is_ok());
  ASSERT_EQ(ins.count("grow_fs:btrfs:/dev/xvdf"), 1);
  ASSERT_TRUE(logs.contains("WARNING"));
}
