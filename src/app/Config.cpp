#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cctype>
#include <cstdlib>

namespace autogrow::app {

using util::Result;
using util::Status;

static Result<ScalerConfig> fatal(std::string msg) {
  return Result<ScalerConfig>::fail(util::Errc::FatalStartup, std::move(msg));
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

Status validate_config(const ScalerConfig& cfg) {
  if (cfg.interval.count() <= 0) return Status::fatal("general.interval must be > 0");
  if (!(cfg.threshold_pct > 0.0 && cfg.threshold_pct <= 100.0))
    return Status::fatal("general.threshold must be in (0, 100]");
  if (lower(cfg.increase_type) != "size")
    return Status::fatal("Only 'size' increase type is supported: " + cfg.increase_type);
  if (cfg.increase_gb <= 0) return Status::fatal("general.increase_gb must be > 0");
  if (cfg.region.empty()) return Status::fatal("general.region must not be empty");
  if (cfg.notification_enabled) {
    if (cfg.email_sender.empty()) return Status::fatal("Missing or empty value for notification.email_sender");
    if (cfg.email_recipients.empty()) return Status::fatal("Missing or empty value for notification.email_recipients");
  }
  return Status::ok();
}

Result<ScalerConfig> load_config(const std::string& path) {
  util::TomlReader toml;
  if (!toml.load(path)) return fatal("Configuration file not found or unreadable: " + path);

  for (const char* section : {"general", "notification"}) {
    if (!toml.has_section(section)) return fatal(std::string("Missing required section: ") + section);
  }
  for (const char* key : {"interval", "threshold", "increase_type", "increase_gb"}) {
    if (toml.get_string("general", key).empty())
      return fatal(std::string("Missing or empty value for general.") + key);
  }

  ScalerConfig cfg;
  auto interval = toml.try_get_int("general", "interval");
  if (!interval) return fatal("general.interval is not an integer: " + toml.get_string("general", "interval"));
  cfg.interval = std::chrono::seconds(*interval);

  auto threshold = toml.try_get_double("general", "threshold");
  if (!threshold) return fatal("general.threshold is not a number: " + toml.get_string("general", "threshold"));
  cfg.threshold_pct = *threshold;

  cfg.increase_type = toml.get_string("general", "increase_type");

  auto increase = toml.try_get_int("general", "increase_gb");
  if (!increase) return fatal("general.increase_gb is not an integer: " + toml.get_string("general", "increase_gb"));
  cfg.increase_gb = *increase;

  cfg.region = toml.get_string("general", "region", kDefaultRegion);

  cfg.notification_enabled = toml.get_bool("notification", "enabled", false);
  if (cfg.notification_enabled) {
    cfg.email_sender = toml.get_string("notification", "email_sender");
    cfg.email_recipients = toml.get_list("notification", "email_recipients");
  }

  for (auto& v : toml.get_list("exclude", "volumes")) cfg.excluded_volumes.insert(v);

  auto st = validate_config(cfg);
  if (!st) return Result<ScalerConfig>(st.error());
  return cfg;
}

std::string resolve_path(const std::string& flag_value, const char* env_name, const char* def) {
  if (!flag_value.empty()) return flag_value;
  if (const char* v = std::getenv(env_name); v && *v) return std::string(v);
  return std::string(def);
}

} // namespace autogrow::app
