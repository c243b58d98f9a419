#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
  } else {
    std::cerr << "Usage: chunkstore <config.yaml> OR chunkstore --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chunkstore::config::ConfigLoader::LoadFromYaml(config_path);

    chunkstore::observability::InitializeMetrics(config);
    chunkstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = chunkstore::factory::Build(config);

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.garbage_collector->Start();
    CHUNKSTORE_LOG_INFO("chunk store started", {chunkstore::observability::UintField("gc_size", app.store->GcSize()),
                                                chunkstore::observability::UintField("capacity", app.store->Capacity())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHUNKSTORE_LOG_INFO("shutting down chunk store");

    app.garbage_collector->Stop();
    chunkstore::observability::ShutdownLogging();
    chunkstore::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    CHUNKSTORE_LOG_ERROR("fatal error", {chunkstore::observability::StringField("error", e.what())});
    chunkstore::observability::ShutdownLogging();
    chunkstore::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
