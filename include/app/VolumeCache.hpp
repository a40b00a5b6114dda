#pragma once
#include "model/Volume.hpp"
#include "util/Result.hpp"
#include <functional>
#include <string>
#include <vector>

namespace autogrow::app {

// Persisted volume identities: one TOML section per volume id, in discovery order
class VolumeCache {
public:
  explicit VolumeCache(std::string path) : path_(std::move(path)) {}

  // Records from disk. Missing file and empty file both yield an empty list.
  [[nodiscard]] std::vector<model::VolumeRecord> read() const;

  [[nodiscard]] util::Status write(const std::vector<model::VolumeRecord>& volumes) const;

  // Cached records, or discover() + write when the cache is absent/empty or refresh is set
  [[nodiscard]] std::vector<model::VolumeRecord> load_or_discover(
      const std::function<std::vector<model::VolumeRecord>()>& discover, bool refresh = false) const;

  [[nodiscard]] const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace autogrow::app
