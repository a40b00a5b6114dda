#pragma once
#include "app/ResizeOrchestrator.hpp"
#include "collectors/IDeviceInspector.hpp"
#include "model/Volume.hpp"
#include "util/Clock.hpp"
#include "util/Result.hpp"
#include <optional>
#include <string>

namespace autogrow::app {

// Partition number encoded in partition_path relative to device_name:
// nvme1n1 + /dev/nvme1n1p2 -> 2, xvdf + /dev/xvdf1 -> 1, xvdf + /dev/xvdf -> nullopt.
// Error when the path does not belong to the device.
[[nodiscard]] util::Result<std::optional<int>> partition_index(const std::string& device_name,
                                                              const std::string& partition_path);

// Waits for the kernel to see the new device size, then grows partition and filesystem
class GrowthExecutor {
public:
  GrowthExecutor(collectors::IDeviceInspector& inspector, util::IClock& clock, PollPolicy poll = kDeviceSizePoll)
      : inspector_(inspector), clock_(clock), poll_(poll) {}

  [[nodiscard]] util::Status grow(const model::VolumeRecord& volume, long long expected_total_gb);

private:
  util::Status wait_for_device_size(const std::string& device_path, long long expected_total_gb);

  collectors::IDeviceInspector& inspector_;
  util::IClock& clock_;
  PollPolicy poll_;
};

} // namespace autogrow::app
