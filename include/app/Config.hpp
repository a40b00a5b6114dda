#pragma once
#include "util/Result.hpp"
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace autogrow::app {

inline constexpr const char* kDefaultConfigPath = "/etc/autogrow/config.toml";
inline constexpr const char* kDefaultVolumeCachePath = "/var/lib/autogrow/volumes.toml";
inline constexpr const char* kDefaultRegion = "eu-west-1";

// Immutable after load; handed by const reference to every component
struct ScalerConfig {
  std::chrono::seconds interval{300};
  double threshold_pct{80.0};     // (0,100]
  std::string increase_type{"size"};
  long long increase_gb{10};      // > 0
  std::string region{kDefaultRegion};

  bool notification_enabled{false};
  std::string email_sender;
  std::vector<std::string> email_recipients;

  std::set<std::string> excluded_volumes;

  [[nodiscard]] bool is_excluded(const std::string& volume_id) const {
    return excluded_volumes.count(volume_id) != 0;
  }
};

// Parse and validate a config file. Every failure is Errc::FatalStartup.
[[nodiscard]] util::Result<ScalerConfig> load_config(const std::string& path);

// Validation shared by load_config and tests building configs by hand
[[nodiscard]] util::Status validate_config(const ScalerConfig& cfg);

// Resolve a path from an explicit flag, then an env variable, then a default
[[nodiscard]] std::string resolve_path(const std::string& flag_value, const char* env_name, const char* def);

} // namespace autogrow::app
