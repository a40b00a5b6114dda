#include "app/Prerequisites.hpp"
#include "app/AwsCliVolumeApi.hpp"
#include "util/Log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace autogrow::app {

using util::Status;

std::vector<std::string> required_tools(bool notification_enabled) {
  std::vector<std::string> tools{"aws", "blkid", "growpart", "xfs_growfs", "resize2fs"};
  if (notification_enabled) tools.push_back("curl");
  return tools;
}

Status check_config_readable(const std::string& config_path) {
  struct stat st{};
  if (::stat(config_path.c_str(), &st) != 0) {
    return Status::fatal("Configuration file " + config_path + " does not exist");
  }
  if (!S_ISREG(st.st_mode) || ::access(config_path.c_str(), R_OK) != 0) {
    return Status::fatal("Configuration file " + config_path + " is not readable");
  }
  return Status::ok();
}

Status ensure_cache_dir(const std::string& cache_path) {
  std::filesystem::path dir = std::filesystem::path(cache_path).parent_path();
  if (dir.empty()) dir = ".";
  struct stat st{};
  if (::stat(dir.c_str(), &st) != 0) {
    util::log_info("Prereq", "Creating cache directory %s", dir.c_str());
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return Status::fatal("Cannot create cache directory " + dir.string() + ": " + ec.message());
    if (::chmod(dir.c_str(), 0755) != 0) {
      return Status::fatal("Cannot set permissions on " + dir.string() + ": " + std::strerror(errno));
    }
  } else if (!S_ISDIR(st.st_mode)) {
    return Status::fatal("Cache directory " + dir.string() + " is not a directory");
  }
  if (::access(dir.c_str(), W_OK) != 0) {
    return Status::fatal("Cache directory " + dir.string() + " is not writable");
  }
  return Status::ok();
}

Status check_prerequisites(const ScalerConfig& cfg, const std::string& cache_path, util::ICommandRunner& runner) {
  util::log_info("Prereq", "Checking prerequisites...");
  std::string missing;
  for (const auto& tool : required_tools(cfg.notification_enabled)) {
    if (util::find_in_path(tool).empty()) missing += (missing.empty() ? "" : ", ") + tool;
  }
  if (!missing.empty()) return Status::fatal("Required tools not found on PATH: " + missing);

  auto st = ensure_cache_dir(cache_path);
  if (!st) return st;

  if (::geteuid() != 0) return Status::fatal("This program must be run as root");

  AwsCliVolumeApi api(runner, cfg.region);
  st = api.check_credentials();
  if (!st) return st;

  util::log_info("Prereq", "All prerequisites satisfied");
  return Status::ok();
}

} // namespace autogrow::app
