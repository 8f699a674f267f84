#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace srepl::log {

/*
  One probe observation.

  `line` and `column` are 1-based and live in the coordinate space of the
  file named by `file_path` (the executed artifact until the entry has been
  mapped back to authored source).
*/
struct LogEntry {
  std::filesystem::path   file_path;
  uint32_t                line{0};
  std::optional<uint32_t> column;
  std::string             result;
};

// A location parsed out of a log line or a stack frame.
struct FileLocation {
  std::string             path;
  uint32_t                line{0};
  std::optional<uint32_t> column;
};

} // namespace srepl::log
