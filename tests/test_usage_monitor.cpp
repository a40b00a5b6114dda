#include "minitest.hpp"
#include "fakes.hpp"
#include "app/UsageMonitor.hpp"
#include "collectors/SystemDeviceInspector.hpp"

using namespace autogrow;

TEST(decide_below_or_at_threshold_is_not_needed) {
  auto d = app::decide(fakes::usage_gb(100, 80.0), 80.0, 10);
  ASSERT_TRUE(!d.needed);
  ASSERT_EQ(d.usage_percent, 80.0);
}

TEST(decide_above_threshold_targets_total_plus_increase) {
  auto d = app::decide(fakes::usage_gb(100, 85.5), 80.0, 10);
  ASSERT_TRUE(d.needed);
  ASSERT_EQ(d.naive_target_gb, 110.0);
}

TEST(usage_monitor_failed_query_is_not_needed) {
  fakes::FakeInspector ins;
  fakes::LogCapture logs;
  app::UsageMonitor m(ins, 80.0, 10);
  auto d = m.evaluate(fakes::volume("vol-a", "xvdf", "/missing", "/dev/xvdf"));
  ASSERT_TRUE(!d.needed);
  ASSERT_EQ(d.usage_percent, 0.0);
  ASSERT_TRUE(logs.contains("Error checking disk usage for /missing"));
}

TEST(usage_percent_matches_df_rounding) {
  ASSERT_EQ(collectors::usage_percent(0, 0), 0.0);
  ASSERT_EQ(collectors::usage_percent(1, 2), 33.3);
  ASSERT_EQ(collectors::usage_percent(90, 10), 90.0);
}
