#pragma once
#include "util/Result.hpp"
#include <string>

namespace autogrow::app {

struct VolumeDescription {
  long long size_gb{};
  std::string state;  // creating|available|in-use|modifying|...
};

struct ModificationStatus {
  std::string state;    // modifying|optimizing|completed|failed
  std::string message;  // provider status message, may be empty
};

// Block-storage control plane. Every call may fail; errors carry the provider's text.
class ICloudVolumeApi {
public:
  virtual ~ICloudVolumeApi() = default;
  [[nodiscard]] virtual util::Result<VolumeDescription> describe_volume(const std::string& volume_id) = 0;
  // Accepted requests return ok; a rejected request is an error
  [[nodiscard]] virtual util::Status modify_volume(const std::string& volume_id, long long size_gb) = 0;
  // Latest modification record; an error when none exists
  [[nodiscard]] virtual util::Result<ModificationStatus> describe_modification(const std::string& volume_id) = 0;
};

} // namespace autogrow::app
