#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using srepl::config::ConfigLoader;
using srepl::factory::Build;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // watch the current directory with defaults
  } else if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: srepl [<config.yaml>] OR srepl --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ConfigLoader::Defaults() : ConfigLoader::LoadFromYaml(config_path);

    srepl::observability::InitializeLogging(config);

    // Register signal handlers before the first event is read.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Build session (dependency graph)
    // ------------------------------------------------------------
    auto session = Build(config, g_running);

    SREPL_LOG_INFO("srepl watching", {srepl::observability::StringField("root", config.watch().root())});

    session.orchestrator->Run(*session.events);

    SREPL_LOG_INFO("Shutting down srepl");

    const auto restored = session.orchestrator->Rollback();
    SREPL_LOG_INFO("annotations removed", {srepl::observability::IntField("files", static_cast<std::int64_t>(restored))});

    srepl::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SREPL_LOG_ERROR("Fatal error", {srepl::observability::StringField("error", e.what())});
    srepl::observability::ShutdownLogging();
    return 1;
  }

  return 0;
}
