#pragma once
#include "app/Config.hpp"
#include "app/FreeSpaceReconciler.hpp"
#include "app/GrowthExecutor.hpp"
#include "app/ICloudVolumeApi.hpp"
#include "app/Notifier.hpp"
#include "app/ResizeOrchestrator.hpp"
#include "app/UsageMonitor.hpp"
#include "collectors/IDeviceInspector.hpp"
#include "model/Volume.hpp"
#include "util/Clock.hpp"
#include "util/Result.hpp"
#include <atomic>
#include <optional>
#include <vector>

namespace autogrow::app {

struct SweepSummary {
  int evaluated{0};   // usage checked
  int excluded{0};
  int scaled{0};
  int failed{0};
  std::vector<model::ScaleReport> reports;
};

// Control loop: sweeps the tracked volumes in order, one at a time.
// A failure or exception in one volume's pipeline is logged and the sweep moves on.
class Scaler {
public:
  Scaler(const ScalerConfig& cfg, std::vector<model::VolumeRecord> volumes, ICloudVolumeApi& api,
         collectors::IDeviceInspector& inspector, INotifier& notifier, util::IClock& clock,
         PollPolicy modification_poll = kModificationPoll, PollPolicy device_poll = kDeviceSizePoll);

  SweepSummary run_sweep();

  // One sweep, or sweeps every cfg.interval until stop is set (daemon)
  void run(bool daemon, const std::atomic<bool>& stop);

  [[nodiscard]] const std::vector<model::VolumeRecord>& volumes() const { return volumes_; }

private:
  // nullopt when the volume is below threshold
  util::Result<std::optional<model::ScaleReport>> process(const model::VolumeRecord& volume);
  model::ScaleReport build_report(const model::VolumeRecord& volume, const model::ScalingDecision& decision);
  long long current_gb(const std::string& path);

  const ScalerConfig& cfg_;
  std::vector<model::VolumeRecord> volumes_;
  collectors::IDeviceInspector& inspector_;
  INotifier& notifier_;
  util::IClock& clock_;
  UsageMonitor monitor_;
  FreeSpaceReconciler reconciler_;
  ResizeOrchestrator orchestrator_;
  GrowthExecutor growth_;
};

} // namespace autogrow::app
