#include "collectors/SystemDeviceInspector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>

namespace autogrow::collectors {

static constexpr uint64_t kSectorSize = 512; // sysfs size is always in 512-byte units

static std::string base_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

static std::string first_line(const std::string& s) {
  auto nl = s.find('\n');
  return util::rtrim(nl == std::string::npos ? s : s.substr(0, nl));
}

double usage_percent(uint64_t used_bytes, uint64_t avail_bytes) {
  uint64_t denom = used_bytes + avail_bytes;
  if (denom == 0) return 0.0;
  double pct = 100.0 * static_cast<double>(used_bytes) / static_cast<double>(denom);
  return std::round(pct * 10.0) / 10.0;
}

util::Result<model::FsUsage> SystemDeviceInspector::filesystem_usage(const std::string& mountpoint) {
  struct statvfs vfs{};
  if (::statvfs(mountpoint.c_str(), &vfs) != 0) {
    return util::Result<model::FsUsage>::transient("statvfs " + mountpoint + ": " + std::strerror(errno));
  }
  model::FsUsage u;
  u.total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
  uint64_t free_bytes = static_cast<uint64_t>(vfs.f_bfree) * vfs.f_frsize;
  u.avail_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
  u.used_bytes = (u.total_bytes > free_bytes) ? (u.total_bytes - free_bytes) : 0ULL;
  u.used_pct = usage_percent(u.used_bytes, u.avail_bytes);
  return u;
}

util::Result<uint64_t> SystemDeviceInspector::device_bytes(const std::string& path) {
  auto name = base_name(path);
  auto sectors = util::read_file_u64("/sys/class/block/" + name + "/size");
  if (!sectors) return util::Result<uint64_t>::transient("cannot read size of " + path);
  return *sectors * kSectorSize;
}

util::Result<std::vector<model::PartitionInfo>> SystemDeviceInspector::partitions(const std::string& root_device) {
  using R = util::Result<std::vector<model::PartitionInfo>>;
  auto name = base_name(root_device);
  const std::string dir = "/sys/block/" + name;
  if (!util::path_exists(dir)) return R::transient("no such block device: " + root_device);

  std::vector<model::PartitionInfo> out;
  for (const auto& entry : util::list_dir(dir)) {
    if (entry.rfind(name, 0) != 0) continue;
    if (!util::path_exists(dir + "/" + entry + "/partition")) continue;
    auto sectors = util::read_file_u64(dir + "/" + entry + "/size");
    if (!sectors) return R::transient("cannot read size of partition " + entry);
    out.push_back(model::PartitionInfo{"/dev/" + entry, *sectors * kSectorSize});
  }
  return out;
}

util::Result<std::string> SystemDeviceInspector::filesystem_type(const std::string& path) {
  std::vector<std::string> argv{"blkid", "-o", "value", "-s", "TYPE", path};
  auto r = runner_.run(argv);
  if (!r.ok()) {
    return util::Result<std::string>::transient("blkid failed for " + path + " (exit " +
                                                std::to_string(r.exit_code) + "): " + util::rtrim(r.err));
  }
  auto type = first_line(r.out);
  if (type.empty()) return util::Result<std::string>::transient("no filesystem signature on " + path);
  return type;
}

util::Status SystemDeviceInspector::grow_partition(const std::string& parent_device, int index) {
  std::vector<std::string> argv{"growpart", parent_device, std::to_string(index)};
  auto r = runner_.run(argv);
  if (r.ok()) return util::Status::ok();
  // growpart exits 1 with NOCHANGE when the partition already spans the free space
  if (r.exit_code == 1 && (r.out.find("NOCHANGE") != std::string::npos || r.err.find("NOCHANGE") != std::string::npos)) {
    util::log_info("DeviceInspector", "Partition %d on %s already at maximum size", index, parent_device.c_str());
    return util::Status::ok();
  }
  return util::Status::transient(util::join_argv(argv) + " failed (exit " + std::to_string(r.exit_code) +
                                 "): " + util::rtrim(r.err.empty() ? r.out : r.err));
}

util::Status SystemDeviceInspector::grow_filesystem(const std::string& fstype, const std::string& target) {
  std::vector<std::string> argv;
  if (fstype == "xfs") argv = {"xfs_growfs", "-d", target};
  else argv = {"resize2fs", target};
  auto r = runner_.run(argv);
  if (r.ok()) return util::Status::ok();
  return util::Status::transient(util::join_argv(argv) + " failed (exit " + std::to_string(r.exit_code) +
                                 "): " + util::rtrim(r.err.empty() ? r.out : r.err));
}

} // namespace autogrow::collectors
