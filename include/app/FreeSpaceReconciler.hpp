#pragma once
#include "collectors/IDeviceInspector.hpp"
#include "model/Volume.hpp"
#include "util/Result.hpp"
#include <cstdint>

namespace autogrow::app {

// free = total - allocated; additional = ceil(increase - free).
// additional <= 0: target = ceil(total), no cloud resize.
// otherwise:       target = ceil(total + additional).
[[nodiscard]] model::Reconciliation reconcile(uint64_t volume_bytes, uint64_t allocated_bytes, long long increase_gb);

// Gathers the root device size and its partition sizes, then reconciles
class FreeSpaceReconciler {
public:
  FreeSpaceReconciler(collectors::IDeviceInspector& inspector, long long increase_gb)
      : inspector_(inspector), increase_gb_(increase_gb) {}

  [[nodiscard]] util::Result<model::Reconciliation> reconcile(const model::VolumeRecord& volume);

private:
  collectors::IDeviceInspector& inspector_;
  long long increase_gb_;
};

} // namespace autogrow::app
