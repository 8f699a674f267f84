#include "internal/watch/process_runner.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace srepl::watch {

using srepl::observability::IntField;
using srepl::observability::StringField;
using srepl::util::ExecutionFailed;

namespace {

void ReplaceAll(std::string& text, std::string_view placeholder, const std::string& value) {
  std::size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
}

bool IsUrlPathByte(unsigned char c) {
  return std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~';
}

bool IsContextVariable(std::string_view assignment) {
  for (std::string_view name : {std::string_view(kCaptureEnv), std::string_view(kLogFileEnv)}) {
    if (assignment.size() > name.size() && assignment.substr(0, name.size()) == name && assignment[name.size()] == '=') {
      return true;
    }
  }
  return false;
}

// Parent environment with the capture context replaced.
std::vector<std::string> ChildEnvironment(const CaptureContext& capture) {
  std::vector<std::string> env;
  for (char** var = environ; var && *var; ++var) {
    if (!IsContextVariable(*var)) {
      env.emplace_back(*var);
    }
  }

  env.push_back(std::string(kCaptureEnv) + (capture.enabled ? "=1" : "=0"));
  if (capture.enabled) {
    env.push_back(std::string(kLogFileEnv) + "=" + capture.log_file.string());
  }
  return env;
}

std::vector<char*> ToPointers(std::vector<std::string>& strings) {
  std::vector<char*> pointers;
  pointers.reserve(strings.size() + 1);
  for (auto& s : strings) {
    pointers.push_back(s.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

} // namespace

ProcessRunner::ProcessRunner(std::vector<Command> commands) : commands_(std::move(commands)) {
}

const ProcessRunner::Command* ProcessRunner::CommandFor(const std::filesystem::path& artifact_path) const {
  const auto extension = artifact_path.extension().string();
  if (extension.empty()) {
    return nullptr;
  }
  for (const auto& command : commands_) {
    for (const auto& candidate : command.extensions) {
      if (candidate == extension) {
        return &command;
      }
    }
  }
  return nullptr;
}

bool ProcessRunner::Handles(const std::filesystem::path& artifact_path) const {
  return CommandFor(artifact_path) != nullptr;
}

std::string ProcessRunner::FileUrl(const std::filesystem::path& path) {
  std::string url = "file://";
  for (unsigned char c : path.string()) {
    if (IsUrlPathByte(c)) {
      url.push_back(static_cast<char>(c));
      continue;
    }
    char escaped[4];
    std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
    url += escaped;
  }
  return url;
}

std::vector<std::string> ProcessRunner::ExpandCommand(const RunRequest& request) const {
  const auto* command = CommandFor(request.artifact_path);
  if (!command) {
    return {};
  }

  std::vector<std::string> argv;
  argv.reserve(command->argv.size());
  for (auto arg : command->argv) {
    ReplaceAll(arg, "{artifact_url}", FileUrl(request.artifact_path));
    ReplaceAll(arg, "{artifact}", request.artifact_path.string());
    ReplaceAll(arg, "{source}", request.source_path.string());
    ReplaceAll(arg, "{entry}", command->entry);
    argv.push_back(std::move(arg));
  }
  return argv;
}

void ProcessRunner::Run(const RunRequest& request, const CaptureContext& capture) {
  auto argv = ExpandCommand(request);
  if (argv.empty()) {
    throw ExecutionFailed("no runner for " + request.artifact_path.string());
  }

  auto env           = ChildEnvironment(capture);
  auto argv_pointers = ToPointers(argv);
  auto env_pointers  = ToPointers(env);

  SREPL_LOG_DEBUG("spawning module", {StringField("program", argv.front()), StringField("artifact", request.artifact_path.string())});

  pid_t pid = 0;
  int   rc  = posix_spawnp(&pid, argv.front().c_str(), nullptr, nullptr, argv_pointers.data(), env_pointers.data());
  if (rc != 0) {
    throw ExecutionFailed("cannot spawn " + argv.front() + ": " + std::strerror(rc));
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ExecutionFailed("waitpid failed: " + std::string(std::strerror(errno)));
    }
  }

  if (WIFSIGNALED(status)) {
    throw ExecutionFailed(request.artifact_path.string() + " terminated by signal " + std::to_string(WTERMSIG(status)));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    SREPL_LOG_DEBUG("module exited with failure", {IntField("exit_code", WEXITSTATUS(status))});
    throw ExecutionFailed(request.artifact_path.string() + " exited with status " + std::to_string(WEXITSTATUS(status)));
  }
}

} // namespace srepl::watch
