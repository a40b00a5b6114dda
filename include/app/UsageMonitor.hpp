#pragma once
#include "collectors/IDeviceInspector.hpp"
#include "model/Volume.hpp"

namespace autogrow::app {

// needed = used% > threshold; target = current total + increase (GiB, unrounded)
[[nodiscard]] model::ScalingDecision decide(const model::FsUsage& usage, double threshold_pct, long long increase_gb);

class UsageMonitor {
public:
  UsageMonitor(collectors::IDeviceInspector& inspector, double threshold_pct, long long increase_gb)
      : inspector_(inspector), threshold_pct_(threshold_pct), increase_gb_(increase_gb) {}

  // A failed usage query logs and yields a zeroed, not-needed decision
  [[nodiscard]] model::ScalingDecision evaluate(const model::VolumeRecord& volume);

private:
  collectors::IDeviceInspector& inspector_;
  double threshold_pct_;
  long long increase_gb_;
};

} // namespace autogrow::app
