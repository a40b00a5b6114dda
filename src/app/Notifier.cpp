#include "app/Notifier.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <sstream>

namespace autogrow::app {

static constexpr const char* kImdsBase = "http://169.254.169.254/latest";

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out.push_back(c);
    }
  }
  return out;
}

static std::string or_na(const std::string& s) { return s.empty() ? std::string("N/A") : html_escape(s); }

static std::string format_pct(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g%%", v);
  return buf;
}

std::string scale_report_subject(const std::string& instance_id) {
  return "EBS Volume Scaling Alert: Volumes Resized on Instance " + instance_id;
}

std::string render_scale_report_html(const std::string& instance_id, double threshold_pct,
                                     const std::vector<model::ScaleReport>& rows) {
  static const char* kCell = "border: 1px solid #ddd; padding: 8px;";
  static const char* kNum = "border: 1px solid #ddd; padding: 8px; text-align: right;";
  std::ostringstream os;
  os << "<html>\n<body>\n"
     << "<p>Hello,</p>\n"
     << "<p>EBS Volume Auto-scaling has been triggered for volumes on instance: <b>" << html_escape(instance_id)
     << "</b> with the following details:</p>\n"
     << "<table style=\"border-collapse: collapse; width: 100%;\">\n<thead>\n<tr style=\"background-color: #f2f2f2;\">\n";
  for (const char* h : {"Volume ID", "Mount Point", "Device Name", "Partition Path"}) {
    os << "<th style=\"" << kCell << " text-align: left;\">" << h << "</th>\n";
  }
  for (const char* h : {"Scale Threshold", "Expanded by size(GB)", "Previous Device size(GB)", "New Device size(GB)",
                        "New Overall Volume size(GB)"}) {
    os << "<th style=\"" << kNum << "\">" << h << "</th>\n";
  }
  os << "</tr>\n</thead>\n<tbody>\n";
  for (const auto& r : rows) {
    os << "<tr>\n"
       << "<td style=\"" << kCell << "\">" << or_na(r.volume.volume_id) << "</td>\n"
       << "<td style=\"" << kCell << "\">" << or_na(r.volume.mountpoint) << "</td>\n"
       << "<td style=\"" << kCell << "\">" << or_na(r.volume.device_name) << "</td>\n"
       << "<td style=\"" << kCell << "\">" << or_na(r.volume.partition_path) << "</td>\n"
       << "<td style=\"" << kNum << "\">" << format_pct(threshold_pct) << "</td>\n"
       << "<td style=\"" << kNum << "\">" << r.expanded_by_gb << "</td>\n"
       << "<td style=\"" << kNum << "\">" << r.previous_size_gb << "</td>\n"
       << "<td style=\"" << kNum << "\">" << r.new_partition_size_gb << "</td>\n"
       << "<td style=\"" << kNum << "\">" << r.new_volume_size_gb << "</td>\n"
       << "</tr>\n";
  }
  os << "</tbody>\n</table>\n<br><br>\n<p>Regards,</p>\n<p>EBS Volume Auto-scaler</p>\n</body>\n</html>\n";
  return os.str();
}

std::string fetch_instance_id(util::ICommandRunner& runner) {
  util::log_info("Notifier", "Getting instance ID using IMDSv2 metadata service...");
  auto token = runner.run({"curl", "-s", "-f", "-m", "5", "-X", "PUT", std::string(kImdsBase) + "/api/token",
                           "-H", "X-aws-ec2-metadata-token-ttl-seconds: 21600"});
  if (!token.ok() || util::rtrim(token.out).empty()) {
    util::log_error("Notifier", "Error getting metadata token (curl exit %d)", token.exit_code);
    return "unknown";
  }
  auto id = runner.run({"curl", "-s", "-f", "-m", "5", "-H", "X-aws-ec2-metadata-token: " + util::rtrim(token.out),
                        std::string(kImdsBase) + "/meta-data/instance-id"});
  auto instance_id = util::rtrim(id.out);
  if (!id.ok() || instance_id.empty()) {
    util::log_error("Notifier", "Got empty instance ID (curl exit %d)", id.exit_code);
    return "unknown";
  }
  return instance_id;
}

void SesNotifier::send_scale_report(const std::vector<model::ScaleReport>& rows) {
  if (rows.empty()) {
    util::log_error("Notifier", "No scale info provided for sending notification. Skipping...");
    return;
  }
  for (const auto& r : rows) {
    util::log_info("Notifier", "Found scaled volume: %s, preparing to send notification...", r.volume.volume_id.c_str());
  }
  const auto instance_id = fetch_instance_id(runner_);

  std::vector<std::string> argv{"aws", "ses", "send-email", "--region", region_, "--from", sender_, "--to"};
  argv.insert(argv.end(), recipients_.begin(), recipients_.end());
  argv.insert(argv.end(), {"--subject", scale_report_subject(instance_id),
                           "--html", render_scale_report_html(instance_id, threshold_pct_, rows)});
  auto r = runner_.run(argv);
  if (!r.ok()) {
    util::log_error("Notifier", "Failed to send notification for scaled volumes (exit %d): %s", r.exit_code,
                    util::rtrim(r.err).c_str());
    return;
  }
  util::log_info("Notifier", "Notification sent for volumes scaled on instance %s to %zu recipients",
                 instance_id.c_str(), recipients_.size());
}

} // namespace autogrow::app
