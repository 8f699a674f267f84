#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>

#include "internal/util/time.hpp"

namespace srepl::watch {

/*
  Remembers when this session last wrote each executed artifact so the
  change event caused by that write is recognized as self-inflicted.
*/
class DebounceTable {
 public:
  explicit DebounceTable(std::chrono::milliseconds window);

  void Record(const std::filesystem::path& path, srepl::util::TimePoint written_at);

  // True when `path` was written within the window before `now`. The
  // record is dropped either way, as are all other expired records.
  bool Consume(const std::filesystem::path& path, srepl::util::TimePoint now);

  std::size_t size() const {
    return writes_.size();
  }

 private:
  void Prune(srepl::util::TimePoint now);

  std::chrono::milliseconds                               window_;
  std::map<std::filesystem::path, srepl::util::TimePoint> writes_;
};

} // namespace srepl::watch
