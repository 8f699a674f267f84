#pragma once

#include <filesystem>
#include <optional>

namespace srepl::watch {

/*
  Stream of changed paths.

  Next() blocks until a path changes and returns std::nullopt once the
  session has been asked to stop; no further events are delivered after
  that.
*/
class EventSource {
 public:
  virtual ~EventSource() = default;

  virtual std::optional<std::filesystem::path> Next() = 0;
};

} // namespace srepl::watch
