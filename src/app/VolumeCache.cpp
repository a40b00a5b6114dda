#include "app/VolumeCache.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <filesystem>

namespace autogrow::app {

std::vector<model::VolumeRecord> VolumeCache::read() const {
  std::vector<model::VolumeRecord> out;
  util::TomlReader toml;
  if (!toml.load(path_)) return out;

  // Repeated sections merge in TomlReader, so ids are unique here
  for (const auto& id : toml.section_names()) {
    model::VolumeRecord rec;
    rec.volume_id = id;
    rec.device_name = toml.get_string(id, "device_name");
    rec.mountpoint = toml.get_string(id, "mountpoint");
    rec.partition_path = toml.get_string(id, "partition_path");
    if (rec.device_name.empty() || rec.mountpoint.empty() || rec.partition_path.empty()) {
      util::log_error("VolumeCache", "Incomplete record for %s in %s. Dropping it", id.c_str(), path_.c_str());
      continue;
    }
    out.push_back(std::move(rec));
  }
  return out;
}

util::Status VolumeCache::write(const std::vector<model::VolumeRecord>& volumes) const {
  std::error_code ec;
  auto dir = std::filesystem::path(path_).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  if (ec) return util::Status::transient("cannot create " + dir.string() + ": " + ec.message());

  util::TomlReader toml;
  for (const auto& v : volumes) {
    toml.set(v.volume_id, "device_name", v.device_name);
    toml.set(v.volume_id, "mountpoint", v.mountpoint);
    toml.set(v.volume_id, "partition_path", v.partition_path);
  }
  if (!toml.save(path_)) return util::Status::transient("cannot write " + path_);
  return util::Status::ok();
}

std::vector<model::VolumeRecord> VolumeCache::load_or_discover(
    const std::function<std::vector<model::VolumeRecord>()>& discover, bool refresh) const {
  if (!refresh) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
      util::log_info("VolumeCache", "No volume information found. Syncing system volume info...");
    } else {
      auto cached = read();
      if (!cached.empty()) return cached;
      util::log_info("VolumeCache", "Volume information file is empty. Syncing system volume info...");
    }
  } else {
    util::log_info("VolumeCache", "Rediscovering volumes and replacing %s", path_.c_str());
  }

  auto volumes = discover();
  if (!volumes.empty()) {
    auto st = write(volumes);
    if (!st) util::log_error("VolumeCache", "Error saving volume information: %s", st.message().c_str());
  }
  return volumes;
}

} // namespace autogrow::app
