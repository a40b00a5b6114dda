#include "app/AwsCliVolumeApi.hpp"
#include "util/Log.hpp"

#include <charconv>

namespace autogrow::app {

using util::Result;
using util::Status;

std::vector<std::string> split_text_row(const std::string& row) {
  std::vector<std::string> out;
  std::string line = util::rtrim(row);
  auto nl = line.find('\n');
  if (nl != std::string::npos) line = util::rtrim(line.substr(0, nl));
  size_t start = 0;
  while (start <= line.size()) {
    size_t tab = line.find('\t', start);
    out.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
    if (tab == std::string::npos) break;
    start = tab + 1;
  }
  return out;
}

static std::string failure_text(const util::CommandResult& r) {
  auto err = util::rtrim(r.err);
  if (err.empty()) err = util::rtrim(r.out);
  return "aws exited " + std::to_string(r.exit_code) + (err.empty() ? std::string() : ": " + err);
}

util::CommandResult AwsCliVolumeApi::ec2(std::vector<std::string> args) {
  std::vector<std::string> argv{"aws", "ec2"};
  argv.insert(argv.end(), args.begin(), args.end());
  argv.insert(argv.end(), {"--region", region_, "--output", "text"});
  util::log_debug("AwsCli", "%s", util::join_argv(argv).c_str());
  return runner_.run(argv);
}

Result<VolumeDescription> AwsCliVolumeApi::describe_volume(const std::string& volume_id) {
  auto r = ec2({"describe-volumes", "--volume-ids", volume_id, "--query", "Volumes[0].[Size,State]"});
  if (!r.ok()) return Result<VolumeDescription>::transient("describe-volumes " + volume_id + ": " + failure_text(r));

  auto fields = split_text_row(r.out);
  if (fields.size() < 2 || fields[0] == "None") {
    return Result<VolumeDescription>::transient("describe-volumes " + volume_id + ": no such volume");
  }
  VolumeDescription d;
  const auto& size = fields[0];
  auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), d.size_gb);
  if (ec != std::errc() || ptr != size.data() + size.size()) {
    return Result<VolumeDescription>::transient("describe-volumes " + volume_id + ": unexpected size '" + size + "'");
  }
  d.state = fields[1];
  return d;
}

Status AwsCliVolumeApi::modify_volume(const std::string& volume_id, long long size_gb) {
  auto r = ec2({"modify-volume", "--volume-id", volume_id, "--size", std::to_string(size_gb),
                "--query", "VolumeModification.ModificationState"});
  if (!r.ok()) return Status::transient("modify-volume " + volume_id + " rejected: " + failure_text(r));
  util::log_debug("AwsCli", "modify-volume %s accepted, state %s", volume_id.c_str(), util::rtrim(r.out).c_str());
  return Status::ok();
}

Result<ModificationStatus> AwsCliVolumeApi::describe_modification(const std::string& volume_id) {
  auto r = ec2({"describe-volumes-modifications", "--volume-ids", volume_id,
                "--query", "VolumesModifications[0].[ModificationState,StatusMessage]"});
  if (!r.ok()) {
    return Result<ModificationStatus>::transient("describe-volumes-modifications " + volume_id + ": " + failure_text(r));
  }
  auto fields = split_text_row(r.out);
  if (fields.empty() || fields[0].empty() || fields[0] == "None") {
    return Result<ModificationStatus>::transient("No modification found for volume " + volume_id);
  }
  ModificationStatus m;
  m.state = fields[0];
  if (fields.size() > 1 && fields[1] != "None") m.message = fields[1];
  return m;
}

Status AwsCliVolumeApi::check_credentials() {
  auto r = ec2({"describe-volumes", "--max-results", "5", "--query", "length(Volumes)"});
  if (!r.ok()) return Status::fatal("AWS credentials validation failed: " + failure_text(r));
  return Status::ok();
}

} // namespace autogrow::app
