#include "app/Scaler.hpp"
#include "util/Log.hpp"

#include <cmath>
#include <exception>

namespace autogrow::app {

using ProcessResult = util::Result<std::optional<model::ScaleReport>>;

Scaler::Scaler(const ScalerConfig& cfg, std::vector<model::VolumeRecord> volumes, ICloudVolumeApi& api,
               collectors::IDeviceInspector& inspector, INotifier& notifier, util::IClock& clock,
               PollPolicy modification_poll, PollPolicy device_poll)
    : cfg_(cfg), volumes_(std::move(volumes)), inspector_(inspector), notifier_(notifier), clock_(clock),
      monitor_(inspector, cfg.threshold_pct, cfg.increase_gb),
      reconciler_(inspector, cfg.increase_gb),
      orchestrator_(api, clock, modification_poll),
      growth_(inspector, clock, device_poll) {}

long long Scaler::current_gb(const std::string& path) {
  auto bytes = inspector_.device_bytes(path);
  if (!bytes) {
    util::log_warn("Scaler", "Cannot read size of %s for the report: %s", path.c_str(), bytes.message().c_str());
    return 0;
  }
  return static_cast<long long>(std::ceil(static_cast<double>(*bytes) / model::kBytesPerGiB));
}

model::ScaleReport Scaler::build_report(const model::VolumeRecord& volume, const model::ScalingDecision& decision) {
  model::ScaleReport r;
  r.volume = volume;
  r.previous_size_gb = static_cast<long long>(std::ceil(decision.naive_target_gb - static_cast<double>(cfg_.increase_gb)));
  r.expanded_by_gb = cfg_.increase_gb;
  r.new_partition_size_gb = current_gb(volume.partition_path);
  r.new_volume_size_gb = current_gb(volume.device_path());
  return r;
}

ProcessResult Scaler::process(const model::VolumeRecord& volume) {
  auto decision = monitor_.evaluate(volume);
  if (!decision.needed) {
    util::log_info("Scaler", "Volume %s (%s) usage %.1f%% is below threshold %g%%. No scaling needed.",
                   volume.volume_id.c_str(), volume.mountpoint.c_str(), decision.usage_percent, cfg_.threshold_pct);
    return std::optional<model::ScaleReport>{};
  }
  util::log_info("Scaler", "Volume %s (%s) usage %.1f%% exceeds threshold %g%%. Scaling by %lldGB",
                 volume.volume_id.c_str(), volume.mountpoint.c_str(), decision.usage_percent, cfg_.threshold_pct,
                 cfg_.increase_gb);

  auto plan = reconciler_.reconcile(volume);
  if (!plan) return plan.error();

  model::ResizeOutcome outcome;
  if (plan->cloud_resize_needed) {
    outcome = orchestrator_.resize(volume.volume_id, plan->target_total_gb);
    if (!outcome.success) return outcome.error;
  } else {
    outcome.final_size_gb = plan->target_total_gb;
    outcome.success = true;
  }

  auto st = growth_.grow(volume, outcome.final_size_gb);
  if (!st) return st.error();

  util::log_info("Scaler", "Volume %s scaled: volume size %lldGB, filesystem on %s grown", volume.volume_id.c_str(),
                 outcome.final_size_gb, volume.partition_path.c_str());
  return std::optional<model::ScaleReport>{build_report(volume, decision)};
}

SweepSummary Scaler::run_sweep() {
  SweepSummary summary;
  util::log_info("Scaler", "Checking %zu volumes", volumes_.size());
  for (const auto& volume : volumes_) {
    if (cfg_.is_excluded(volume.volume_id)) {
      util::log_debug("Scaler", "Skipping excluded volume %s", volume.volume_id.c_str());
      ++summary.excluded;
      continue;
    }
    ++summary.evaluated;
    try {
      auto r = process(volume);
      if (!r) {
        ++summary.failed;
        util::log_error("Scaler", "Failed to scale volume %s (%s): %s", volume.volume_id.c_str(),
                        util::errc_name(r.error().code), r.message().c_str());
      } else if (r->has_value()) {
        ++summary.scaled;
        summary.reports.push_back(**r);
      }
    } catch (const std::exception& e) {
      ++summary.failed;
      util::log_error("Scaler", "Error processing volume %s: %s", volume.volume_id.c_str(), e.what());
    } catch (...) {
      ++summary.failed;
      util::log_error("Scaler", "Error processing volume %s: unknown exception", volume.volume_id.c_str());
    }
  }

  if (!summary.reports.empty()) {
    try {
      notifier_.send_scale_report(summary.reports);
    } catch (const std::exception& e) {
      util::log_error("Scaler", "Notification failed: %s", e.what());
    } catch (...) {
      util::log_error("Scaler", "Notification failed: unknown exception");
    }
  }
  util::log_info("Scaler", "Sweep done: %d evaluated, %d scaled, %d failed, %d excluded", summary.evaluated,
                 summary.scaled, summary.failed, summary.excluded);
  return summary;
}

void Scaler::run(bool daemon, const std::atomic<bool>& stop) {
  if (!daemon) {
    run_sweep();
    return;
  }
  util::log_info("Scaler", "Running in daemon mode with %lld second interval",
                 static_cast<long long>(cfg_.interval.count()));
  while (!stop.load()) {
    run_sweep();
    // one-second slices, stop is checked between them
    for (long long s = 0; s < cfg_.interval.count() && !stop.load(); ++s) {
      clock_.sleep_for(std::chrono::seconds(1));
    }
  }
  util::log_info("Scaler", "Stop requested, exiting");
}

} // namespace autogrow::app
