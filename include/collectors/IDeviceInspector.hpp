#pragma once
#include "model/Volume.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace autogrow::collectors {

// Local device and filesystem capabilities used by the scaling pipeline.
// The system implementation reads sysfs and runs the partition/filesystem
// tools; tests substitute an in-memory one.
class IDeviceInspector {
public:
  virtual ~IDeviceInspector() = default;

  // Live usage of the filesystem mounted at mountpoint
  [[nodiscard]] virtual util::Result<model::FsUsage> filesystem_usage(const std::string& mountpoint) = 0;

  // OS-visible size of a block device or partition, e.g. /dev/nvme1n1
  [[nodiscard]] virtual util::Result<uint64_t> device_bytes(const std::string& path) = 0;

  // Partitions carved out of root_device (/dev/nvme1n1), in name order.
  // Empty when the device has no partition table.
  [[nodiscard]] virtual util::Result<std::vector<model::PartitionInfo>> partitions(const std::string& root_device) = 0;

  // Filesystem signature on path, e.g. "xfs", "ext4"
  [[nodiscard]] virtual util::Result<std::string> filesystem_type(const std::string& path) = 0;

  // Extend partition `index` of parent_device to the end of the free space.
  // Already-maximal partitions report success.
  [[nodiscard]] virtual util::Status grow_partition(const std::string& parent_device, int index) = 0;

  // Grow a live filesystem; target is the mountpoint for xfs, the device path otherwise
  [[nodiscard]] virtual util::Status grow_filesystem(const std::string& fstype, const std::string& target) = 0;
};

} // namespace autogrow::collectors
