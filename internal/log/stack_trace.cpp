#include "internal/log/stack_trace.hpp"

#include <string>
#include <vector>

#include "internal/log/log_codec.hpp"

namespace srepl::log {
namespace {

constexpr std::string_view kFramePrefix   = "at ";
constexpr std::string_view kFileUriPrefix = "file://";

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

std::string_view StripFileUri(std::string_view location) {
  if (location.substr(0, kFileUriPrefix.size()) == kFileUriPrefix) {
    location.remove_prefix(kFileUriPrefix.size());
  }
  return location;
}

} // namespace

std::optional<std::string_view> FindLocationInFrame(std::string_view frame) {
  if (frame.substr(0, kFramePrefix.size()) != kFramePrefix) {
    return std::nullopt;
  }
  frame.remove_prefix(kFramePrefix.size());
  if (frame.empty()) {
    return std::nullopt;
  }

  // "at fn (location)"
  if (frame.back() == ')') {
    const auto paren_start = frame.rfind('(');
    if (paren_start == std::string_view::npos) {
      return std::nullopt;
    }
    return StripFileUri(frame.substr(paren_start + 1, frame.size() - paren_start - 2));
  }

  // "at location" (anonymous caller, e.g. module top level)
  return StripFileUri(frame);
}

std::optional<FileLocation> DeriveCallerLocation(std::string_view stack_text) {
  std::vector<std::string_view> frames;
  std::size_t                   start = 0;
  while (start <= stack_text.size()) {
    auto end = stack_text.find('\n', start);
    if (end == std::string_view::npos) {
      end = stack_text.size();
    }
    const auto line = Trim(stack_text.substr(start, end - start));
    // header lines ("Error", "Error: message") are not frames
    if (line.substr(0, kFramePrefix.size()) == kFramePrefix) {
      frames.push_back(line);
    }
    start = end + 1;
  }

  if (frames.size() < 2) {
    return std::nullopt;
  }

  const auto location = FindLocationInFrame(frames[1]);
  if (!location || location->empty()) {
    return std::nullopt;
  }
  return ParseFileLocation(*location);
}

} // namespace srepl::log
