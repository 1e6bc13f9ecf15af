#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/maintenance/cleanup_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/reference_store.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: refstored [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? refstore::config::ConfigLoader::Defaults() : refstore::config::ConfigLoader::LoadFromYaml(config_path);

    refstore::observability::InitializeTracing(config);
    refstore::observability::InitializeMetrics(config);
    refstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = refstore::factory::Build(config);

    // Register signal handlers before starting the sweeper to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (app.sweeper) {
      app.sweeper->Start();
    } else {
      REFSTORE_LOG_WARN("cleanup sweeper disabled");
    }
    REFSTORE_LOG_INFO("refstored started", {refstore::observability::StringField("root", app.store->root().string())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REFSTORE_LOG_INFO("Shutting down refstored");

    if (app.sweeper) {
      app.sweeper->Stop();
    }
    refstore::observability::ShutdownLogging();
    refstore::observability::ShutdownMetrics();
    refstore::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    REFSTORE_LOG_ERROR("Fatal error", {refstore::observability::StringField("error", e.what())});
    refstore::observability::ShutdownLogging();
    refstore::observability::ShutdownMetrics();
    refstore::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
