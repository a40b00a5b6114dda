#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Notifier.hpp"

using namespace autogrow;

static model::ScaleReport row() {
  model::ScaleReport r;
  r.volume = fakes::volume("vol-0abc", "nvme1n1", "/data", "");
  r.previous_size_gb = 90;
  r.expanded_by_gb = 20;
  r.new_partition_size_gb = 110;
  r.new_volume_size_gb = 110;
  return r;
}

TEST(report_html_contains_rows) {
  auto html = app::render_scale_report_html("i-0123", 80.0, {row()});
  ASSERT_TRUE(html.find("i-0123") != std::string::npos);
  ASSERT_TRUE(html.find("<td style=\"border: 1px solid #ddd; padding: 8px;\">vol-0abc</td>") != std::string::npos);
  ASSERT_TRUE(html.find("80%") != std::string::npos);
  ASSERT_TRUE(html.find(">110</td>") != std::string::npos);
  // empty partition path
  ASSERT_TRUE(html.find(">N/A</td>") != std::string::npos);
}

TEST(report_html_escapes_values) {
  auto r = row();
  r.volume.mountpoint = "/mnt/<x>&y";
  auto html = app::render_scale_report_html("i-0123", 80.0, {r});
  ASSERT_TRUE(html.find("/mnt/&lt;x&gt;&amp;y") != std::string::npos);
}

TEST(instance_id_via_imds_v2) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>& argv) {
    for (const auto& a : argv) if (a.find("/api/token") != std::string::npos) return util::CommandResult{0, "TOKEN", ""};
    return util::CommandResult{0, "i-0123456789\n", ""};
  };
  ASSERT_EQ(app::fetch_instance_id(runner), "i-0123456789");
  ASSERT_EQ(runner.calls.size(), 2u);
  bool token_header = false;
  for (const auto& a : runner.calls[1]) if (a == "X-aws-ec2-metadata-token: TOKEN") token_header = true;
  ASSERT_TRUE(token_header);
}

TEST(instance_id_unknown_when_imds_fails) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>&) { return util::CommandResult{7, "", "connection refused"}; };
  ASSERT_EQ(app::fetch_instance_id(runner), "unknown");
}

TEST(ses_notifier_sends_one_email) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>& argv) {
    if (argv[0] == "curl") return util::CommandResult{0, "x", ""};
    return util::CommandResult{0, "{\"MessageId\": \"1\"}", ""};
  };
  app::SesNotifier n(runner, "eu-west-1", "ops@example.com", {"a@example.com", "b@example.com"}, 80.0);
  n.send_scale_report({row()});
  const auto& argv = runner.calls.back();
  ASSERT_EQ(argv[0], "aws");
  ASSERT_EQ(argv[1], "ses");
  ASSERT_EQ(argv[2], "send-email");
  int recipients = 0;
  for (const auto& a : argv) if (a == "a@example.com" || a == "b@example.com") ++recipients;
  ASSERT_EQ(recipients, 2);
}

TEST(ses_notifier_skips_empty_report_and_swallows_failure) {
  fakes::FakeRunner runner;
  runner.handler = [](const std::vector<std::string>&) { return util::CommandResult{255, "", "MessageRejected"}; };
  app::SesNotifier n(runner, "eu-west-1", "ops@example.com", {"a@example.com"}, 80.0);
  n.send_scale_report({});
  ASSERT_TRUE(runner.calls.empty());
  n.send_scale_report({row()});
  ASSERT_TRUE(!runner.calls.empty());
}
