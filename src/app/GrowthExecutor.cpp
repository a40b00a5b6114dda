#include "app/GrowthExecutor.hpp"
#include "util/Log.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>

namespace autogrow::app {

util::Result<std::optional<int>> partition_index(const std::string& device_name, const std::string& partition_path) {
  using R = util::Result<std::optional<int>>;
  const std::string base = std::filesystem::path(partition_path).filename().string();
  if (base == device_name) return std::optional<int>{};
  if (device_name.empty() || base.rfind(device_name, 0) != 0) {
    return R::transient(partition_path + " is not on device " + device_name);
  }
  std::string suffix = base.substr(device_name.size());
  // nvme0n1p1, mmcblk0p1, loop0p1: a 'p' separates the index when the device name ends in a digit
  if (std::isdigit(static_cast<unsigned char>(device_name.back())) && !suffix.empty() && suffix.front() == 'p') {
    suffix.erase(0, 1);
  }
  if (suffix.empty() || suffix.size() > 4) return R::transient("no partition number in " + partition_path);
  for (char c : suffix) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return R::transient("no partition number in " + partition_path);
  }
  return std::optional<int>{std::stoi(suffix)};
}

util::Status GrowthExecutor::wait_for_device_size(const std::string& device_path, long long expected_total_gb) {
  util::log_info("Growth", "Checking if volume scaling reflected on root device %s with desired size %lldGB",
                 device_path.c_str(), expected_total_gb);
  for (int attempt = 1; attempt <= poll_.attempts; ++attempt) {
    auto bytes = inspector_.device_bytes(device_path);
    if (!bytes) {
      util::log_error("Growth", "Error checking device size: %s", bytes.message().c_str());
    } else {
      auto current_gb = static_cast<long long>(std::ceil(static_cast<double>(*bytes) / model::kBytesPerGiB));
      if (current_gb == expected_total_gb) {
        util::log_info("Growth", "Root device %s has size synced to desired %lldGB", device_path.c_str(),
                       expected_total_gb);
        return util::Status::ok();
      }
      util::log_info("Growth", "Device size check attempt %d/%d: current size %lldGB, waiting for %lldGB", attempt,
                     poll_.attempts, current_gb, expected_total_gb);
    }
    if (attempt < poll_.attempts) clock_.sleep_for(poll_.delay);
  }
  return util::Status::timeout("Root device " + device_path + " did not reach expected size after " +
                               std::to_string(poll_.attempts) + " attempts");
}

util::Status GrowthExecutor::grow(const model::VolumeRecord& volume, long long expected_total_gb) {
  const std::string device_path = volume.device_path();
  util::log_info("Growth", "Starting filesystem expansion for %s", volume.partition_path.c_str());

  auto st = wait_for_device_size(device_path, expected_total_gb);
  if (!st) return st;

  auto index = partition_index(volume.device_name, volume.partition_path);
  if (!index) return index.status();
  if (index->has_value()) {
    util::log_info("Growth", "Growing partition %s on device %s", volume.partition_path.c_str(), device_path.c_str());
    st = inspector_.grow_partition(device_path, index->value());
    if (!st) return util::Status::transient("Failed to grow partition '" + volume.partition_path + "': " + st.message());
    util::log_info("Growth", "Successfully grew partition: %s", volume.partition_path.c_str());
  }

  auto fstype = inspector_.filesystem_type(volume.partition_path);
  if (!fstype) return util::Status::transient("Cannot determine filesystem type: " + fstype.message());

  const std::string& type = *fstype;
  std::string target = volume.partition_path;
  if (type == "xfs") {
    // xfs only grows online, addressed by mountpoint
    target = volume.mountpoint;
  } else if (type != "ext2" && type != "ext3" && type != "ext4") {
    util::log_warn("Growth", "Unrecognized filesystem type '%s' on %s; trying the ext grow command", type.c_str(),
                   volume.partition_path.c_str());
  }
  util::log_info("Growth", "Expanding %s filesystem on %s", type.c_str(), target.c_str());
  st = inspector_.grow_filesystem(type, target);
  if (!st) return util::Status::transient("Failed to expand " + type + " filesystem: " + st.message());

  util::log_info("Growth", "Successfully expanded %s filesystem on %s", type.c_str(), volume.partition_path.c_str());
  return util::Status::ok();
}

} // namespace autogrow::app
