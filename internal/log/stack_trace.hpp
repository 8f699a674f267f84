#pragma once

#include <optional>
#include <string_view>

#include "internal/log/inspect.hpp"
#include "internal/log/log_entry.hpp"

namespace srepl::log {

/*
  Derives a log entry from a textual call stack (V8 format).

  Frame 0 is the probe itself; frame 1 is its immediate caller and is the
  location recorded. Frames from non-file contexts yield no location and
  the observation is dropped silently.
*/

// Extracts "path:line:column" from one trimmed "at ..." frame.
std::optional<std::string_view> FindLocationInFrame(std::string_view frame);

std::optional<FileLocation> DeriveCallerLocation(std::string_view stack_text);

template <typename T>
std::optional<LogEntry> DeriveFromStack(std::string_view stack_text, const T& value) {
  auto location = DeriveCallerLocation(stack_text);
  if (!location) {
    return std::nullopt;
  }

  LogEntry entry;
  entry.file_path = location->path;
  entry.line      = location->line;
  entry.column    = location->column;
  entry.result    = Inspect(value);
  return entry;
}

} // namespace srepl::log
