#pragma once
#include "model/Volume.hpp"
#include "util/Exec.hpp"
#include <string>
#include <vector>

namespace autogrow::app {

// Best-effort delivery of a sweep's scale report. Implementations log
// their own failures and never throw.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual void send_scale_report(const std::vector<model::ScaleReport>& rows) = 0;
};

class NullNotifier : public INotifier {
public:
  void send_scale_report(const std::vector<model::ScaleReport>&) override {}
};

[[nodiscard]] std::string render_scale_report_html(const std::string& instance_id, double threshold_pct,
                                                   const std::vector<model::ScaleReport>& rows);

[[nodiscard]] std::string scale_report_subject(const std::string& instance_id);

// Instance id from the IMDSv2 metadata service via curl; "unknown" on failure
[[nodiscard]] std::string fetch_instance_id(util::ICommandRunner& runner);

// Sends the HTML report through `aws ses send-email`
class SesNotifier : public INotifier {
public:
  SesNotifier(util::ICommandRunner& runner, std::string region, std::string sender,
              std::vector<std::string> recipients, double threshold_pct)
      : runner_(runner), region_(std::move(region)), sender_(std::move(sender)),
        recipients_(std::move(recipients)), threshold_pct_(threshold_pct) {}

  void send_scale_report(const std::vector<model::ScaleReport>& rows) override;

private:
  util::ICommandRunner& runner_;
  std::string region_;
  std::string sender_;
  std::vector<std::string> recipients_;
  double threshold_pct_;
};

} // namespace autogrow::app
