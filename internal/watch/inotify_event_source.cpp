#include "internal/watch/inotify_event_source.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace srepl::watch {

namespace fs = std::filesystem;

using srepl::observability::StringField;

namespace {

constexpr uint32_t kDirectoryMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_ONLYDIR;

} // namespace

InotifyEventSource::InotifyEventSource(fs::path root, std::vector<std::string> ignore, int poll_interval_ms,
                                       const volatile std::sig_atomic_t& running)
    : root_(std::move(root)), ignore_(std::move(ignore)), poll_interval_ms_(poll_interval_ms), running_(running) {
  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }

  try {
    AddWatchRecursive(root_);
  } catch (...) {
    close(fd_);
    throw;
  }
}

InotifyEventSource::~InotifyEventSource() {
  if (fd_ >= 0) {
    close(fd_);
  }
}

bool InotifyEventSource::IsIgnored(const fs::path& dir) const {
  const auto name = dir.filename().string();
  return std::find(ignore_.begin(), ignore_.end(), name) != ignore_.end();
}

void InotifyEventSource::AddWatch(const fs::path& dir) {
  const int wd = inotify_add_watch(fd_, dir.c_str(), kDirectoryMask);
  if (wd < 0) {
    // directories can vanish between listing and watching
    if (errno == ENOENT || errno == ENOTDIR) {
      return;
    }
    throw std::system_error(errno, std::generic_category(), "inotify_add_watch " + dir.string());
  }
  watches_[wd] = dir;
}

void InotifyEventSource::AddWatchRecursive(const fs::path& dir, std::vector<fs::path>* existing_files) {
  AddWatch(dir);

  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory(ec)) {
      if (existing_files && it->is_regular_file(ec)) {
        existing_files->push_back(it->path());
      }
      continue;
    }
    if (IsIgnored(it->path())) {
      it.disable_recursion_pending();
      continue;
    }
    AddWatch(it->path());
  }
  if (ec) {
    SREPL_LOG_WARN("incomplete directory scan", {StringField("dir", dir.string()), StringField("error", ec.message())});
  }
}

void InotifyEventSource::WatchNewDirectory(const fs::path& dir) {
  // Files can land in a new directory before its watch exists.
  std::vector<fs::path> existing_files;
  try {
    AddWatchRecursive(dir, &existing_files);
  } catch (const std::system_error& e) {
    SREPL_LOG_WARN("directory not watched", {StringField("dir", dir.string()), StringField("error", e.what())});
  }
  for (auto& file : existing_files) {
    pending_.push_back(std::move(file));
  }
}

void InotifyEventSource::ReadEvents() {
  alignas(inotify_event) char buffer[16 * 1024];

  while (true) {
    const ssize_t length = read(fd_, buffer, sizeof(buffer));
    if (length < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        return;
      }
      throw std::system_error(errno, std::generic_category(), "read inotify");
    }
    if (length == 0) {
      return;
    }

    for (ssize_t offset = 0; offset < length;) {
      const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
      offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

      if (event->mask & IN_Q_OVERFLOW) {
        SREPL_LOG_WARN("inotify queue overflow, change events were lost");
        continue;
      }

      auto watch = watches_.find(event->wd);
      if (watch == watches_.end()) {
        continue;
      }
      if (event->mask & IN_IGNORED) {
        watches_.erase(watch);
        continue;
      }
      if (event->len == 0) {
        continue;
      }

      const auto path = watch->second / event->name;
      if (event->mask & IN_ISDIR) {
        if ((event->mask & (IN_CREATE | IN_MOVED_TO)) && !IsIgnored(path)) {
          WatchNewDirectory(path);
        }
        continue;
      }
      if (event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) {
        pending_.push_back(path);
      }
    }
  }
}

std::optional<fs::path> InotifyEventSource::Next() {
  while (running_) {
    if (!pending_.empty()) {
      auto path = std::move(pending_.front());
      pending_.pop_front();
      return path;
    }

    pollfd pfd{fd_, POLLIN, 0};
    const int rc = poll(&pfd, 1, poll_interval_ms_);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll inotify");
    }
    if (rc > 0) {
      ReadEvents();
    }
  }
  return std::nullopt;
}

} // namespace srepl::watch
