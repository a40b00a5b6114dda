#pragma once
#include "collectors/IDeviceInspector.hpp"
#include "model/Volume.hpp"
#include <optional>
#include <string>
#include <vector>

namespace autogrow::collectors {

struct MountEntry {
  std::string device;
  std::string mountpoint;
  std::string fstype;
};

// Parse /proc/self/mounts text; octal escapes (\040) are decoded
[[nodiscard]] std::vector<MountEntry> parse_mounts(const std::string& text);

// EBS NVMe controllers report "vol0123..." as serial; returns "vol-0123..."
[[nodiscard]] std::optional<std::string> normalize_ebs_serial(const std::string& serial);

// Builds the tracked volume list from /sys/block and /proc/self/mounts
class VolumeDiscovery {
public:
  explicit VolumeDiscovery(IDeviceInspector& inspector) : inspector_(inspector) {}
  [[nodiscard]] std::vector<model::VolumeRecord> discover();

private:
  IDeviceInspector& inspector_;
};

} // namespace autogrow::collectors
