#pragma once
#include "app/Config.hpp"
#include "util/Exec.hpp"
#include "util/Result.hpp"
#include <string>
#include <vector>

namespace autogrow::app {

// Tools the scaler shells out to; curl only matters when notifications are on
[[nodiscard]] std::vector<std::string> required_tools(bool notification_enabled);

// Existence + read permission
[[nodiscard]] util::Status check_config_readable(const std::string& config_path);

// Creates the directory holding the cache file (0755) when absent, then checks it is writable
[[nodiscard]] util::Status ensure_cache_dir(const std::string& cache_path);

// Startup checks run after the config is loaded. Every failure is Errc::FatalStartup.
// Order: tools, cache directory, root, cloud credentials.
[[nodiscard]] util::Status check_prerequisites(const ScalerConfig& cfg, const std::string& cache_path,
                                               util::ICommandRunner& runner);

} // namespace autogrow::app
