#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using reaper::observability::IntField;
using reaper::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void PrintUsage() {
  std::cerr << "Usage: replica-reaper <config.yaml> [--once] OR replica-reaper --config <config.yaml> [--once]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        once = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--once") {
      once = true;
    } else if (arg == "--config" && i + 1 < argc && config_path.empty()) {
      config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
      config_path = arg;
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = reaper::config::ConfigLoader::LoadFromYaml(config_path);
    if (once) config.mutable_reaper()->set_once(true);

    reaper::observability::InitializeLogging(config);
    reaper::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = reaper::factory::Build(config);

    if (app.options.once) {
      const auto stats = app.daemon->RunOnce();
      REAPER_LOG_INFO("replica reaper finished single pass",
                      {IntField("deleted", static_cast<int64_t>(stats.deleted)), IntField("uncommitted", static_cast<int64_t>(stats.uncommitted))});
      reaper::observability::ShutdownMetrics();
      reaper::observability::ShutdownLogging();
      return 0;
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.daemon->Start();
    REAPER_LOG_INFO("replica reaper started", {StringField("config", config_path), StringField("mode", app.options.ModeName())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REAPER_LOG_INFO("shutting down replica reaper");

    app.daemon->Stop();
    reaper::observability::ShutdownMetrics();
    reaper::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    REAPER_LOG_ERROR("fatal error", {StringField("error", e.what())});
    reaper::observability::ShutdownMetrics();
    reaper::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
