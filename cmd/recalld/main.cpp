#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  recall::observability::ShutdownLogging();
  recall::observability::ShutdownMetrics();
  recall::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: recalld <config.yaml> OR recalld --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = recall::config::ConfigLoader::LoadFromYaml(config_path);

    recall::observability::InitializeTracing(config);
    recall::observability::InitializeMetrics(config);
    recall::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = recall::factory::BuildRuntime(config);

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime.Start();
    RECALL_LOG_INFO("recalld started", {recall::observability::StringField("config", config_path),
                                        recall::observability::IntField("workers", config.maintenance().workers())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RECALL_LOG_INFO("Shutting down recalld");
    runtime.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RECALL_LOG_ERROR("Fatal error", {recall::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
