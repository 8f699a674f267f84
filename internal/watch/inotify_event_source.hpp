#pragma once

#include <csignal>
#include <deque>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/watch/event_source.hpp"

namespace srepl::watch {

/*
  Recursive directory watch on Linux inotify.

  Reports files that were closed after writing or moved into place (the
  two ways editors save). Directories created later are watched as they
  appear, and files already inside them are reported. A directory that
  cannot be watched mid-session is skipped. `running` is polled every `poll_interval_ms` so that a signal
  handler clearing it ends the stream.
*/
class InotifyEventSource final : public EventSource {
 public:
  InotifyEventSource(std::filesystem::path root, std::vector<std::string> ignore, int poll_interval_ms, const volatile std::sig_atomic_t& running);
  ~InotifyEventSource() override;

  InotifyEventSource(const InotifyEventSource&)            = delete;
  InotifyEventSource& operator=(const InotifyEventSource&) = delete;

  std::optional<std::filesystem::path> Next() override;

 private:
  // Regular files met during the scan are appended to `existing_files` when given.
  void AddWatchRecursive(const std::filesystem::path& dir, std::vector<std::filesystem::path>* existing_files = nullptr);
  // Failures are logged and the directory is skipped.
  void WatchNewDirectory(const std::filesystem::path& dir);
  void AddWatch(const std::filesystem::path& dir);
  bool IsIgnored(const std::filesystem::path& dir) const;
  void ReadEvents();

  std::filesystem::path                          root_;
  std::vector<std::string>                       ignore_;
  int                                            poll_interval_ms_;
  const volatile std::sig_atomic_t&              running_;
  int                                            fd_{-1};
  std::unordered_map<int, std::filesystem::path> watches_;
  std::deque<std::filesystem::path>              pending_;
};

} // namespace srepl::watch
