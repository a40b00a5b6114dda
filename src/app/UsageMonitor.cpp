#include "app/UsageMonitor.hpp"
#include "util/Log.hpp"

namespace autogrow::app {

model::ScalingDecision decide(const model::FsUsage& usage, double threshold_pct, long long increase_gb) {
  model::ScalingDecision d;
  d.usage_percent = usage.used_pct;
  if (usage.used_pct > threshold_pct) {
    d.needed = true;
    d.naive_target_gb = static_cast<double>(usage.total_bytes) / model::kBytesPerGiB + static_cast<double>(increase_gb);
  }
  return d;
}

model::ScalingDecision UsageMonitor::evaluate(const model::VolumeRecord& volume) {
  auto usage = inspector_.filesystem_usage(volume.mountpoint);
  if (!usage) {
    util::log_error("UsageMonitor", "Error checking disk usage for %s: %s", volume.mountpoint.c_str(),
                    usage.message().c_str());
    return model::ScalingDecision{};
  }
  return decide(*usage, threshold_pct_, increase_gb_);
}

} // namespace autogrow::app
