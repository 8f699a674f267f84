#pragma once

#include <filesystem>
#include <memory>

#include "internal/watch/capture_context.hpp"

namespace srepl::watch {

struct RunRequest {
  std::filesystem::path artifact_path;
  std::filesystem::path source_path;
};

/*
  Execution environment abstraction.

  Run() executes the artifact from a clean slate and returns only once the
  module (and its entry point) has completed, so the probe log is quiescent
  afterwards.
*/
class ModuleRunner {
 public:
  virtual ~ModuleRunner() = default;

  // Whether the artifact's extension is an executable kind.
  virtual bool Handles(const std::filesystem::path& artifact_path) const = 0;

  // Throws util::ExecutionFailed when the module fails.
  virtual void Run(const RunRequest& request, const CaptureContext& capture) = 0;
};

using ModuleRunnerPtr = std::shared_ptr<ModuleRunner>;

} // namespace srepl::watch
