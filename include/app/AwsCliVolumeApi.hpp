#pragma once
#include "app/ICloudVolumeApi.hpp"
#include "util/Exec.hpp"
#include <string>
#include <vector>

namespace autogrow::app {

// EC2 volume calls through the aws CLI in text output mode
class AwsCliVolumeApi : public ICloudVolumeApi {
public:
  AwsCliVolumeApi(util::ICommandRunner& runner, std::string region)
      : runner_(runner), region_(std::move(region)) {}

  util::Result<VolumeDescription> describe_volume(const std::string& volume_id) override;
  util::Status modify_volume(const std::string& volume_id, long long size_gb) override;
  util::Result<ModificationStatus> describe_modification(const std::string& volume_id) override;

  // Cheap authenticated call used to check credentials at startup
  [[nodiscard]] util::Status check_credentials();

private:
  [[nodiscard]] util::CommandResult ec2(std::vector<std::string> args);

  util::ICommandRunner& runner_;
  std::string region_;
};

// Split a text-mode output row on tabs/whitespace
[[nodiscard]] std::vector<std::string> split_text_row(const std::string& row);

} // namespace autogrow::app
