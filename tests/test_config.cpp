#include "minitest.hpp"
#include "app/Config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace autogrow;

static std::string write_config(const char* tag, const std::string& body) {
  auto p = fs::temp_directory_path() / (std::string("autogrow_test_cfg_") + tag + "_" + std::to_string(::getpid()) + ".toml");
  std::ofstream(p) << body;
  return p.string();
}

static const char* kGood =
  "[general]\n"
  "interval = 120\n"
  "threshold = 85.5\n"
  "increase_type = \"size\"\n"
  "increase_gb = 15\n"
  "region = \"us-east-2\"\n"
  "\n"
  "[notification]\n"
  "enabled = true\n"
  "email_sender = \"ops@example.com\"\n"
  "email_recipients = [\"a@example.com\", \"b@example.com\"]\n"
  "\n"
  "[exclude]\n"
  "volumes = [\"vol-0aaa\", \"vol-0bbb\"]  # never touch these\n";

TEST(config_loads_all_fields) {
  auto path = write_config("good", kGood);
  auto cfg = app::load_config(path);
  ASSERT_TRUE(cfg.is_ok());
  ASSERT_EQ(cfg->interval.count(), 120);
  ASSERT_EQ(cfg->threshold_pct, 85.5);
  ASSERT_EQ(cfg->increase_gb, 15);
  ASSERT_EQ(cfg->region, "us-east-2");
  ASSERT_TRUE(cfg->notification_enabled);
  ASSERT_EQ(cfg->email_sender, "ops@example.com");
  ASSERT_EQ(cfg->email_recipients.size(), 2u);
  ASSERT_TRUE(cfg->is_excluded("vol-0bbb"));
  ASSERT_TRUE(!cfg->is_excluded("vol-0ccc"));
  fs::remove(path);
}

TEST(config_defaults_region_and_notifications_off) {
  auto path = write_config("defaults",
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = size\nincrease_gb = 10\n[notification]\nenabled = false\n");
  auto cfg = app::load_config(path);
  ASSERT_TRUE(cfg.is_ok());
  ASSERT_EQ(cfg->region, std::string(app::kDefaultRegion));
  ASSERT_TRUE(!cfg->notification_enabled);
  ASSERT_TRUE(cfg->excluded_volumes.empty());
  fs::remove(path);
}

TEST(config_missing_file_is_fatal) {
  auto cfg = app::load_config("/nonexistent/autogrow/config.toml");
  ASSERT_TRUE(!cfg.is_ok());
  ASSERT_TRUE(cfg.error().code == util::Errc::FatalStartup);
}

TEST(config_rejects_bad_values) {
  const char* bodies[] = {
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = size\nincrease_gb = 10\n",
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = percent\nincrease_gb = 10\n[notification]\n",
    "[general]\ninterval = 0\nthreshold = 80\nincrease_type = size\nincrease_gb = 10\n[notification]\n",
    "[general]\ninterval = 60\nthreshold = 120\nincrease_type = size\nincrease_gb = 10\n[notification]\n",
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = size\nincrease_gb = ten\n[notification]\n",
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = size\n[notification]\n",
    "[general]\ninterval = 60\nthreshold = 80\nincrease_type = size\nincrease_gb = 10\n[notification]\nenabled = true\n",
  };
  int i = 0;
  for (const char* body : bodies) {
    auto path = write_config(("bad" + std::to_string(i++)).c_str(), body);
    auto cfg = app::load_config(path);
    ASSERT_TRUE(!cfg.is_ok());
    ASSERT_TRUE(cfg.error().code == util::Errc::FatalStartup);
    fs::remove(path);
  }
}

TEST(resolve_path_precedence) {
  setenv("AUTOGROW_TEST_PATH", "/from/env", 1);
  ASSERT_EQ(app::resolve_path("/from/flag", "AUTOGROW_TEST_PATH", "/default"), "/from/flag");
  ASSERT_EQ(app::resolve_path("", "AUTOGROW_TEST_PATH", "/default"), "/from/env");
  unsetenv("AUTOGROW_TEST_PATH");
  ASSERT_EQ(app::resolve_path("", "AUTOGROW_TEST_PATH", "/default"), "/default");
}
