#include "minitest.hpp"
#include "fakes.hpp"
#include "util/Log.hpp"

using namespace autogrow;

TEST(log_parse_levels) {
  ASSERT_TRUE(util::parse_log_level("debug", util::LogLevel::Info) == util::LogLevel::Debug);
  ASSERT_TRUE(util::parse_log_level("WARNING", util::LogLevel::Info) == util::LogLevel::Warn);
  ASSERT_TRUE(util::parse_log_level("Error", util::LogLevel::Info) == util::LogLevel::Error);
  ASSERT_TRUE(util::parse_log_level("verbose", util::LogLevel::Info) == util::LogLevel::Info);
}

TEST(log_format_and_filtering) {
  fakes::LogCapture logs;
  util::log_info("Scaler", "volume %s at %d%%", "vol-0abc", 91);
  ASSERT_EQ(logs.lines.size(), 1u);
  const auto& line = logs.lines[0];
  // "YYYY-MM-DD HH:MM:SS - INFO - autogrow: Scaler: volume vol-0abc at 91%"
  ASSERT_EQ(line.substr(19), " - INFO - autogrow: Scaler: volume vol-0abc at 91%");
  ASSERT_EQ(line[4], '-');
  ASSERT_EQ(line[13], ':');

  util::set_log_level(util::LogLevel::Warn);
  util::log_info("Scaler", "dropped");
  util::log_error("Scaler", "kept");
  ASSERT_EQ(logs.lines.size(), 2u);
  ASSERT_TRUE(logs.contains(" - ERROR - autogrow: Scaler: kept"));
}
