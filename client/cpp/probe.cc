#include "client/cpp/probe.h"

#include <cstdlib>
#include <mutex>
#include <string_view>

#include "internal/log/log_codec.hpp"
#include "internal/util/file_io.hpp"
#include "internal/watch/capture_context.hpp"

namespace srepl::client {

namespace fs = std::filesystem;

namespace {

std::mutex& RecordMutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace

CaptureState CurrentCapture() {
  CaptureState state;

  const char* flag = std::getenv(srepl::watch::kCaptureEnv);
  const char* path = std::getenv(srepl::watch::kLogFileEnv);
  if (!flag || std::string_view(flag) != "1" || !path || *path == '\0') {
    return state;
  }

  state.enabled  = true;
  state.log_file = fs::absolute(path).lexically_normal();
  return state;
}

void Record(const CaptureState& capture, const char* file, std::uint32_t line, const std::string& rendered) {
  srepl::log::LogEntry entry;
  entry.file_path = fs::absolute(file).lexically_normal();
  entry.line      = line;
  entry.result    = rendered;
  RecordEntry(capture, entry);
}

void RecordEntry(const CaptureState& capture, const srepl::log::LogEntry& entry) {
  auto encoded = srepl::log::Encode(capture.log_file.parent_path(), entry);
  encoded.push_back('\n');

  // one line per append so concurrent probes never interleave
  std::lock_guard<std::mutex> lock(RecordMutex());
  srepl::util::AppendFile(capture.log_file, encoded);
}

} // namespace srepl::client
