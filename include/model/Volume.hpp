#pragma once
#include "util/Result.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace autogrow::model {

inline constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

// Identity of one tracked cloud volume, loaded once at startup
struct VolumeRecord {
  std::string volume_id;       // e.g., vol-0123456789abcdef0
  std::string device_name;     // e.g., nvme1n1 (no /dev/ prefix)
  std::string mountpoint;      // e.g., /data
  std::string partition_path;  // e.g., /dev/nvme1n1p1, or /dev/nvme1n1 when unpartitioned

  [[nodiscard]] std::string device_path() const { return "/dev/" + device_name; }
  bool operator==(const VolumeRecord&) const = default;
};

struct FsUsage {
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  uint64_t avail_bytes{};
  double   used_pct{};  // 0..100
};

struct ScalingDecision {
  bool   needed{false};
  double usage_percent{};
  double naive_target_gb{};  // current fs total + increase, unrounded
};

struct Reconciliation {
  double free_space_gb{};         // raw device capacity not covered by partitions
  long long additional_needed_gb{};
  long long target_total_gb{};    // volume size to converge to
  bool cloud_resize_needed{false};
};

struct ResizeOutcome {
  bool requested{false};   // a modify call was issued in this sweep
  long long final_size_gb{};
  bool success{false};
  util::Error error{};     // meaningful when !success
};

struct ScaleReport {
  VolumeRecord volume;
  long long previous_size_gb{};
  long long expanded_by_gb{};
  long long new_partition_size_gb{};
  long long new_volume_size_gb{};
};

struct PartitionInfo {
  std::string path;  // /dev/nvme1n1p1
  uint64_t bytes{};
};

} // namespace autogrow::model
