#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/mapping/typescript_mapper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/watch/inotify_event_source.hpp"
#include "internal/watch/process_runner.hpp"

namespace srepl::factory {

using namespace srepl;

namespace fs = std::filesystem;

namespace {

std::vector<watch::ProcessRunner::Command> BuildCommands(const srepl::runtime::config::RuntimeConfig& config) {
  std::vector<watch::ProcessRunner::Command> commands;
  for (const auto& runner : config.runners()) {
    if (runner.command().empty()) {
      throw util::ConfigurationFault("runner without command");
    }
    watch::ProcessRunner::Command command;
    command.extensions.assign(runner.extensions().begin(), runner.extensions().end());
    command.argv.assign(runner.command().begin(), runner.command().end());
    command.entry = runner.entry();
    commands.push_back(std::move(command));
  }
  return commands;
}

watch::Toolchain BuildToolchain(const srepl::runtime::config::ToolchainConfig& config, const fs::path& root) {
  if (config.kind() != "typescript") {
    throw util::ConfigurationFault("unsupported toolchain kind '" + config.kind() + "'");
  }

  watch::Toolchain toolchain;
  toolchain.name = config.name();
  toolchain.extensions.assign(config.extensions().begin(), config.extensions().end());
  toolchain.make_mapper = [root, config_file = config.config_file()]() -> mapping::PositionMapperPtr {
    return mapping::TypescriptMapper::Create(root, config_file);
  };
  return toolchain;
}

} // namespace

watch::OrchestratorOptions BuildOrchestratorOptions(const srepl::runtime::config::RuntimeConfig& config) {
  watch::OrchestratorOptions options;
  options.root            = fs::absolute(config.watch().root()).lexically_normal();
  options.log_file        = config.log_file();
  options.debounce_window = std::chrono::milliseconds(config.debounce_ms());
  for (const auto& toolchain : config.toolchains()) {
    options.toolchains.push_back(BuildToolchain(toolchain, options.root));
  }
  return options;
}

RuntimeDependencies Build(const srepl::runtime::config::RuntimeConfig& config, const volatile std::sig_atomic_t& running) {
  RuntimeDependencies deps;

  auto options = BuildOrchestratorOptions(config);
  const auto root = options.root;

  deps.runner       = std::make_shared<watch::ProcessRunner>(BuildCommands(config));
  deps.orchestrator = std::make_unique<watch::Orchestrator>(std::move(options), deps.runner);

  std::vector<std::string> ignore(config.watch().ignore().begin(), config.watch().ignore().end());
  deps.events = std::make_unique<watch::InotifyEventSource>(root, std::move(ignore), static_cast<int>(config.watch().poll_interval_ms()), running);

  SREPL_LOG_INFO("watch session ready", {observability::StringField("root", root.string()),
                                         observability::StringField("log_file", deps.orchestrator->log_file().string())});
  return deps;
}

} // namespace srepl::factory
