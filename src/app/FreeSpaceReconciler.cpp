#include "app/FreeSpaceReconciler.hpp"
#include "util/Log.hpp"

#include <cmath>

namespace autogrow::app {

model::Reconciliation reconcile(uint64_t volume_bytes, uint64_t allocated_bytes, long long increase_gb) {
  model::Reconciliation r;
  const double volume_gb = static_cast<double>(volume_bytes) / model::kBytesPerGiB;
  const double allocated_gb = static_cast<double>(allocated_bytes) / model::kBytesPerGiB;
  r.free_space_gb = volume_gb - allocated_gb;
  r.additional_needed_gb = static_cast<long long>(std::ceil(static_cast<double>(increase_gb) - r.free_space_gb));
  if (r.additional_needed_gb > 0) {
    r.cloud_resize_needed = true;
    r.target_total_gb = static_cast<long long>(std::ceil(volume_gb + static_cast<double>(r.additional_needed_gb)));
  } else {
    r.cloud_resize_needed = false;
    r.target_total_gb = static_cast<long long>(std::ceil(volume_gb));
  }
  return r;
}

util::Result<model::Reconciliation> FreeSpaceReconciler::reconcile(const model::VolumeRecord& volume) {
  using R = util::Result<model::Reconciliation>;
  const auto root = volume.device_path();
  auto total = inspector_.device_bytes(root);
  if (!total) return R::transient("cannot size root device " + root + ": " + total.message());

  auto parts = inspector_.partitions(root);
  if (!parts) return R::transient("cannot list partitions of " + root + ": " + parts.message());

  uint64_t allocated = 0;
  if (parts->empty()) {
    // no partition table: the filesystem owns the whole device
    allocated = *total;
  } else {
    for (const auto& p : *parts) {
      if (p.path.rfind(root, 0) != 0) continue;
      allocated += p.bytes;
    }
  }

  auto r = app::reconcile(*total, allocated, increase_gb_);
  util::log_debug("Reconciler", "%s: device %.2fGB, allocated %.2fGB, free %.2fGB, additional %lldGB",
                  volume.volume_id.c_str(), static_cast<double>(*total) / model::kBytesPerGiB,
                  static_cast<double>(allocated) / model::kBytesPerGiB, r.free_space_gb, r.additional_needed_gb);
  if (r.cloud_resize_needed && r.additional_needed_gb < increase_gb_) {
    util::log_info("Reconciler", "Combining available unused space of %.2fGB on volume %s for scaling to reach %lldGB",
                   r.free_space_gb, volume.volume_id.c_str(), r.target_total_gb);
  } else if (!r.cloud_resize_needed) {
    util::log_info("Reconciler", "Found enough free space on volume %s to expand within %lldGB",
                   volume.volume_id.c_str(), r.target_total_gb);
  }
  return r;
}

} // namespace autogrow::app
