#include "minitest.hpp"
#include "fakes.hpp"
#include "app/FreeSpaceReconciler.hpp"

using namespace autogrow;
using fakes::kGiB;

TEST(reconcile_partial_free_space_grows_cloud_volume) {
  auto r = app::reconcile(100 * kGiB, 90 * kGiB, 20);
  ASSERT_TRUE(r.cloud_resize_needed);
  ASSERT_EQ(r.additional_needed_gb, 10);
  ASSERT_EQ(r.target_total_gb, 110);
}

TEST(reconcile_enough_free_space_skips_cloud) {
  auto r = app::reconcile(100 * kGiB, 70 * kGiB, 20);
  ASSERT_TRUE(!r.cloud_resize_needed);
  ASSERT_EQ(r.target_total_gb, 100);
}

TEST(reconcile_fully_allocated_adds_whole_increment) {
  auto r = app::reconcile(100 * kGiB, 100 * kGiB, 20);
  ASSERT_TRUE(r.cloud_resize_needed);
  ASSERT_EQ(r.target_total_gb, 120);
}

TEST(reconciler_sums_partitions_on_the_root_device) {
  fakes::FakeInspector ins;
  ins.bytes["/dev/nvme1n1"] = {100 * kGiB};
  ins.parts["/dev/nvme1n1"] = {{"/dev/nvme1n1p1", 1 * kGiB}, {"/dev/nvme1n1p2", 89 * kGiB}};
  app::FreeSpaceReconciler rec(ins, 20);
  auto r = rec.reconcile(fakes::volume("vol-a", "nvme1n1", "/data", "/dev/nvme1n1p2"));
  ASSERT_TRUE(r.is_ok());
  ASSERT_TRUE(r->cloud_resize_needed);
  ASSERT_EQ(r->target_total_gb, 110);
}

TEST(reconciler_whole_device_counts_as_allocated) {
  fakes::FakeInspector ins;
  ins.bytes["/dev/xvdf"] = {50 * kGiB};
  app::FreeSpaceReconciler rec(ins, 10);
  auto r = rec.reconcile(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"));
  ASSERT_TRUE(r.is_ok());
  ASSERT_EQ(r->target_total_gb, 60);
}

TEST(reconciler_reports_size_errors) {
  fakes::FakeInspector ins;
  app::FreeSpaceReconciler rec(ins, 10);
  auto r = rec.reconcile(fakes::volume("vol-b", "xvdf", "/srv", "/dev/xvdf"));
  ASSERT_TRUE(!r.is_ok());
  ASSERT_TRUE(r.error().code == util::Errc::TransientPerVolume);
}
