#include "internal/watch/debounce_table.hpp"

namespace srepl::watch {

DebounceTable::DebounceTable(std::chrono::milliseconds window) : window_(window) {
}

void DebounceTable::Record(const std::filesystem::path& path, srepl::util::TimePoint written_at) {
  writes_[path] = written_at;
}

bool DebounceTable::Consume(const std::filesystem::path& path, srepl::util::TimePoint now) {
  bool hit = false;

  auto it = writes_.find(path);
  if (it != writes_.end()) {
    hit = now - it->second < window_;
    writes_.erase(it);
  }

  Prune(now);
  return hit;
}

void DebounceTable::Prune(srepl::util::TimePoint now) {
  for (auto it = writes_.begin(); it != writes_.end();) {
    if (now - it->second >= window_) {
      it = writes_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace srepl::watch
