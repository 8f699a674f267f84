#pragma once

#include <string>
#include <vector>

#include "internal/watch/module_runner.hpp"

namespace srepl::watch {

/*
  Runs each artifact in a fresh child process.

  A command is an argv template selected by artifact extension; the
  placeholders "{artifact}", "{artifact_url}", "{source}" and "{entry}"
  are substituted per run. Calling the entry function, and awaiting it, is
  the command's job; the run ends when the child exits. The
  capture context reaches the child through SREPL_CAPTURE and
  SREPL_LOG_FILE.
*/
class ProcessRunner final : public ModuleRunner {
 public:
  struct Command {
    std::vector<std::string> extensions;
    std::vector<std::string> argv;
    std::string              entry;
  };

  explicit ProcessRunner(std::vector<Command> commands);

  bool Handles(const std::filesystem::path& artifact_path) const override;

  void Run(const RunRequest& request, const CaptureContext& capture) override;

  // Expanded argv for `request`; empty when no command handles it.
  std::vector<std::string> ExpandCommand(const RunRequest& request) const;

  // file:// URL of an absolute path, percent-encoded.
  static std::string FileUrl(const std::filesystem::path& path);

 private:
  const Command* CommandFor(const std::filesystem::path& artifact_path) const;

  std::vector<Command> commands_;
};

} // namespace srepl::watch
