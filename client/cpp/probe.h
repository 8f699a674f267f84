#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/log/inspect.hpp"
#include "internal/log/log_entry.hpp"
#include "internal/log/stack_trace.hpp"

namespace srepl::client {

/*
  Probe library linked into modules that run under a watch session.

    auto greeting = SREPL_P(Join(words, ", "));

  SREPL_P returns its argument unchanged. While the session's capture
  context is enabled (SREPL_CAPTURE=1 in the environment) it also appends
  one line to the probe log named by SREPL_LOG_FILE, recording the caller's
  file, line and the inspected value. Outside a cycle it records nothing.
*/

struct CaptureState {
  bool                  enabled{false};
  std::filesystem::path log_file;
};

// Reads the capture context handed down by the orchestrator.
CaptureState CurrentCapture();

// Appends one encoded entry; column is unknown for structured locations.
void Record(const CaptureState& capture, const char* file, std::uint32_t line, const std::string& rendered);

void RecordEntry(const CaptureState& capture, const srepl::log::LogEntry& entry);

template <typename T>
std::decay_t<T> P(T&& value, const char* file, std::uint32_t line) {
  const auto capture = CurrentCapture();
  if (capture.enabled) {
    Record(capture, file, line, srepl::log::Inspect(value));
  }
  return std::forward<T>(value);
}

// For hosts that only know their caller as V8 stack text, such as the
// probe callback of an embedded JavaScript engine. Frame 0 of `stack_text`
// is the probe, frame 1 the location recorded (with its column). A stack
// without a file location records nothing.
template <typename T>
std::decay_t<T> PFromStack(T&& value, std::string_view stack_text) {
  const auto capture = CurrentCapture();
  if (capture.enabled) {
    if (auto entry = srepl::log::DeriveFromStack(stack_text, value)) {
      RecordEntry(capture, *entry);
    }
  }
  return std::forward<T>(value);
}

} // namespace srepl::client

#define SREPL_P(...) ::srepl::client::P((__VA_ARGS__), __FILE__, static_cast<std::uint32_t>(__LINE__))
