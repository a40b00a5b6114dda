#include "app/AwsCliVolumeApi.hpp"
#include "app/Config.hpp"
#include "app/Notifier.hpp"
#include "app/Prerequisites.hpp"
#include "app/Scaler.hpp"
#include "app/VolumeCache.hpp"
#include "collectors/SystemDeviceInspector.hpp"
#include "collectors/VolumeDiscovery.hpp"
#include "util/Clock.hpp"
#include "util/Exec.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void usage() {
  std::cout << "Usage: autogrow [-d|--daemon] [--config PATH] [--volume-cache PATH]\n"
               "                [--rediscover] [--skip-prerequisites] [-h|--help]\n";
  std::cout << "Notes: without --daemon a single sweep runs and the process exits.\n"
               "       AUTOGROW_CONFIG / AUTOGROW_VOLUME_CACHE override the default paths,\n"
               "       AUTOGROW_LOG_LEVEL=debug|info|warn|error sets verbosity.\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  bool daemon = false;
  bool rediscover = false;
  bool skip_prereq = false;
  std::string config_flag, cache_flag;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-d" || a == "--daemon") daemon = true;
    else if (a == "--config" && i + 1 < argc) config_flag = argv[++i];
    else if (a == "--volume-cache" && i + 1 < argc) cache_flag = argv[++i];
    else if (a == "--rediscover") rediscover = true;
    else if (a == "--skip-prerequisites") skip_prereq = true;
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else {
      std::cerr << "autogrow: unknown argument: " << a << "\n";
      usage();
      return 1;
    }
  }

  using namespace autogrow;
  const auto config_path = app::resolve_path(config_flag, "AUTOGROW_CONFIG", app::kDefaultConfigPath);
  const auto cache_path = app::resolve_path(cache_flag, "AUTOGROW_VOLUME_CACHE", app::kDefaultVolumeCachePath);

  if (auto st = app::check_config_readable(config_path); !st) {
    util::log_error("Main", "%s", st.message().c_str());
    return 1;
  }
  auto cfg = app::load_config(config_path);
  if (!cfg) {
    util::log_error("Main", "Invalid configuration %s: %s", config_path.c_str(), cfg.message().c_str());
    return 1;
  }

  util::ProcessRunner runner;
  if (!skip_prereq) {
    if (auto st = app::check_prerequisites(*cfg, cache_path, runner); !st) {
      util::log_error("Main", "Prerequisite check failed: %s", st.message().c_str());
      return 1;
    }
  }

  collectors::SystemDeviceInspector inspector(runner);
  app::AwsCliVolumeApi api(runner, cfg->region);
  std::unique_ptr<app::INotifier> notifier;
  if (cfg->notification_enabled) {
    notifier = std::make_unique<app::SesNotifier>(runner, cfg->region, cfg->email_sender, cfg->email_recipients,
                                                  cfg->threshold_pct);
  } else {
    notifier = std::make_unique<app::NullNotifier>();
  }

  app::VolumeCache cache(cache_path);
  auto volumes = cache.load_or_discover(
      [&] {
        collectors::VolumeDiscovery discovery(inspector);
        return discovery.discover();
      },
      rediscover);
  if (volumes.empty()) {
    util::log_error("Main", "No EBS volumes found to monitor");
    return 1;
  }
  util::log_info("Main", "Tracking %zu volumes from %s", volumes.size(), cache_path.c_str());

  util::SteadyClock clock;
  app::Scaler scaler(*cfg, std::move(volumes), api, inspector, *notifier, clock);
  scaler.run(daemon, g_stop);
  return 0;
}
