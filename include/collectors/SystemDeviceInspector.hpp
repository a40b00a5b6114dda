#pragma once
#include "collectors/IDeviceInspector.hpp"
#include "util/Exec.hpp"

namespace autogrow::collectors {

// statvfs + /sys/class/block for sizes, blkid/growpart/xfs_growfs/resize2fs for the rest
class SystemDeviceInspector : public IDeviceInspector {
public:
  explicit SystemDeviceInspector(util::ICommandRunner& runner) : runner_(runner) {}

  util::Result<model::FsUsage> filesystem_usage(const std::string& mountpoint) override;
  util::Result<uint64_t> device_bytes(const std::string& path) override;
  util::Result<std::vector<model::PartitionInfo>> partitions(const std::string& root_device) override;
  util::Result<std::string> filesystem_type(const std::string& path) override;
  util::Status grow_partition(const std::string& parent_device, int index) override;
  util::Status grow_filesystem(const std::string& fstype, const std::string& target) override;

private:
  util::ICommandRunner& runner_;
};

// used / (used + avail) as df reports it, rounded to one decimal
[[nodiscard]] double usage_percent(uint64_t used_bytes, uint64_t avail_bytes);

} // namespace autogrow::collectors
