#pragma once

#include <csignal>
#include <memory>

#include "config/config.pb.h"

#include "internal/watch/event_source.hpp"
#include "internal/watch/module_runner.hpp"
#include "internal/watch/orchestrator.hpp"

namespace srepl::factory {

/*
  RuntimeDependencies

  Owns everything a watch session needs.
  Everything here lives for the lifetime of the session.
*/
struct RuntimeDependencies {
  std::shared_ptr<watch::ModuleRunner> runner;
  std::unique_ptr<watch::Orchestrator> orchestrator;
  std::unique_ptr<watch::EventSource>  events;
};

/*
  Build

  Constructs the session from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete runner, mapper and event
  source types.
*/
RuntimeDependencies Build(const srepl::runtime::config::RuntimeConfig& config, const volatile std::sig_atomic_t& running);

// Orchestrator options derived from config, without the event source.
watch::OrchestratorOptions BuildOrchestratorOptions(const srepl::runtime::config::RuntimeConfig& config);

} // namespace srepl::factory
