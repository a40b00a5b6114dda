#include "collectors/VolumeDiscovery.hpp"
#include "util/Exec.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace autogrow::collectors {

static bool is_virtual_device(const std::string& name) {
  for (const char* p : {"loop", "ram", "zram", "dm-", "md", "sr", "fd"}) {
    if (name.rfind(p, 0) == 0) return true;
  }
  return false;
}

static std::string unescape_mount_field(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::vector<MountEntry> parse_mounts(const std::string& text) {
  std::vector<MountEntry> out;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    out.push_back(MountEntry{unescape_mount_field(device), unescape_mount_field(mountpoint), fstype});
  }
  return out;
}

std::optional<std::string> normalize_ebs_serial(const std::string& serial) {
  auto s = util::rtrim(serial);
  while (!s.empty() && s.front() == ' ') s.erase(s.begin());
  if (s.rfind("vol-", 0) == 0 && s.size() > 4) return s;
  if (s.rfind("vol", 0) == 0 && s.size() > 3) return "vol-" + s.substr(3);
  return std::nullopt;
}

std::vector<model::VolumeRecord> VolumeDiscovery::discover() {
  std::vector<model::VolumeRecord> out;

  // device path -> first mountpoint
  std::unordered_map<std::string, std::string> mounted;
  if (auto txt = util::read_file_string("/proc/self/mounts")) {
    for (auto& m : parse_mounts(*txt)) mounted.emplace(m.device, m.mountpoint);
  } else {
    util::log_error("Discovery", "Cannot read /proc/self/mounts");
    return out;
  }

  std::unordered_set<std::string> seen_ids;
  for (const auto& dev : util::list_dir("/sys/block")) {
    if (is_virtual_device(dev)) continue;
    const std::string dev_dir = "/sys/block/" + dev;

    auto serial = util::read_file_string(dev_dir + "/device/serial");
    std::optional<std::string> volume_id = serial ? normalize_ebs_serial(*serial) : std::nullopt;
    if (!volume_id) {
      util::log_info("Discovery", "Device %s is not an EBS volume. Skipping...", dev.c_str());
      continue;
    }

    std::vector<std::string> parts;
    for (const auto& e : util::list_dir(dev_dir)) {
      if (e.rfind(dev, 0) == 0 && util::path_exists(dev_dir + "/" + e + "/partition")) parts.push_back(e);
    }

    model::VolumeRecord rec;
    rec.volume_id = *volume_id;
    rec.device_name = dev;

    if (!parts.empty()) {
      // Track the largest mounted filesystem on the device
      uint64_t best_total = 0;
      bool found = false;
      for (const auto& p : parts) {
        const std::string part_path = "/dev/" + p;
        auto it = mounted.find(part_path);
        if (it == mounted.end()) {
          util::log_info("Discovery", "Partition %s is not mounted. Skipping...", p.c_str());
          continue;
        }
        auto usage = inspector_.filesystem_usage(it->second);
        if (!usage) {
          util::log_error("Discovery", "Error processing partition %s: %s", p.c_str(), usage.message().c_str());
          continue;
        }
        if (!found || usage->total_bytes > best_total) {
          found = true;
          best_total = usage->total_bytes;
          rec.partition_path = part_path;
          rec.mountpoint = it->second;
        }
      }
      if (!found) continue;
    } else {
      auto it = mounted.find("/dev/" + dev);
      if (it == mounted.end()) {
        util::log_info("Discovery", "Device %s is not mounted. Skipping...", dev.c_str());
        continue;
      }
      rec.partition_path = "/dev/" + dev;
      rec.mountpoint = it->second;
    }

    if (!seen_ids.insert(rec.volume_id).second) {
      util::log_warn("Discovery", "Volume %s seen twice; keeping the first device", rec.volume_id.c_str());
      continue;
    }
    util::log_info("Discovery", "Found volume %s on %s mounted at %s (%s)", rec.volume_id.c_str(),
                   rec.device_name.c_str(), rec.mountpoint.c_str(), rec.partition_path.c_str());
    out.push_back(std::move(rec));
  }
  return out;
}

} // namespace autogrow::collectors
