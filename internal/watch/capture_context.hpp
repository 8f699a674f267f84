#pragma once

#include <filesystem>

namespace srepl::watch {

/*
  Explicit capture context handed to the execution environment.

  Probes only record while `enabled` is set, and only the orchestrator
  flips it, for exactly the duration of one module run. Default is
  disabled so that module loads outside a cycle never emit entries.
*/
struct CaptureContext {
  bool                  enabled{false};
  std::filesystem::path log_file;
};

// Environment variables carrying the context into a child process.
inline constexpr const char* kCaptureEnv = "SREPL_CAPTURE";
inline constexpr const char* kLogFileEnv = "SREPL_LOG_FILE";

// Enables capture for the lifetime of the scope, on every exit path.
class CaptureScope {
 public:
  explicit CaptureScope(CaptureContext& context) : context_(context) {
    context_.enabled = true;
  }

  ~CaptureScope() {
    context_.enabled = false;
  }

  CaptureScope(const CaptureScope&)            = delete;
  CaptureScope& operator=(const CaptureScope&) = delete;

 private:
  CaptureContext& context_;
};

} // namespace srepl::watch
