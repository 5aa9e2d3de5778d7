#include "change_watcher.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::watch {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kFileMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                               IN_DELETE_SELF | IN_MOVE_SELF;

bool IsHiddenName(const fs::path& path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

std::optional<ChangeKind> KindFromMask(uint32_t mask) {
  if (mask & IN_CREATE) return ChangeKind::kCreate;
  if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) return ChangeKind::kModify;
  if (mask & IN_DELETE) return ChangeKind::kRemove;
  if (mask & (IN_MOVED_FROM | IN_MOVED_TO)) return ChangeKind::kRename;
  return std::nullopt;
}

} // namespace

ChangeWatcher::ChangeWatcher(std::shared_ptr<const store::NoteStore> store, std::chrono::milliseconds debounce)
    : store_(std::move(store)), debouncer_(debounce) {
  wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    throw util::WatchError(std::string("eventfd failed: ") + std::strerror(errno));
  }
}

ChangeWatcher::~ChangeWatcher() {
  Close();
  if (wake_fd_ >= 0) ::close(wake_fd_);
}

void ChangeWatcher::Stop() {
  stop_ = true;
  const uint64_t one = 1;
  if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    NOTEWATCH_LOG_WARN("Failed to wake change watcher", {observability::StringField("error", std::strerror(errno))});
  }
}

void ChangeWatcher::Open() {
  const auto& root = store_->Root();

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw util::WatchError("note directory does not exist: " + root.string());
  }

  inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    throw util::WatchError(std::string("inotify_init1 failed: ") + std::strerror(errno));
  }

  root_wd_ = -1;
  AddWatchRecursive(root, false, util::SteadyClock::now());
}

void ChangeWatcher::Close() {
  if (inotify_fd_ >= 0) {
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  watches_.clear();
}

void ChangeWatcher::AddWatchRecursive(const fs::path& dir, bool report_existing, util::SteadyTimePoint now) {
  const int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kFileMask);
  if (wd < 0) {
    const std::string reason = std::strerror(errno);
    if (dir == store_->Root()) {
      throw util::WatchError("cannot watch " + dir.string() + ": " + reason);
    }
    NOTEWATCH_LOG_WARN("Cannot watch subdirectory", {observability::StringField("path", dir.string()), observability::StringField("error", reason)});
    return;
  }
  if (dir == store_->Root()) root_wd_ = wd;
  watches_[wd] = dir;

  std::error_code ec;
  for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    if (IsHiddenName(path)) continue;

    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      AddWatchRecursive(path, report_existing, now);
    } else if (report_existing && store_->IsNotePath(path)) {
      // created before the watch on its directory existed
      debouncer_.Add({path, ChangeKind::kCreate}, now);
    }
  }
}

void ChangeWatcher::HandleEvents(util::SteadyTimePoint now) {
  alignas(struct inotify_event) char buffer[16 * 1024];

  while (true) {
    const ssize_t len = ::read(inotify_fd_, buffer, sizeof(buffer));
    if (len < 0) {
      if (errno == EAGAIN || errno == EINTR) return;
      throw util::WatchError(std::string("inotify read failed: ") + std::strerror(errno));
    }
    if (len == 0) return;

    for (char* ptr = buffer; ptr < buffer + len;) {
      const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
      ptr += sizeof(struct inotify_event) + event->len;

      // events were dropped; the caller has to rescan
      if (event->mask & IN_Q_OVERFLOW) {
        throw util::WatchError("inotify queue overflow, changes were lost");
      }

      if (event->wd == root_wd_ && (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED))) {
        throw util::WatchError("note directory is gone: " + store_->Root().string());
      }

      if (event->mask & IN_IGNORED) {
        watches_.erase(event->wd);
        continue;
      }

      auto dir = watches_.find(event->wd);
      if (dir == watches_.end() || event->len == 0) continue;

      const fs::path path = dir->second / event->name;
      if (IsHiddenName(path)) continue;

      if (event->mask & IN_ISDIR) {
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
          AddWatchRecursive(path, true, now);
        }
        continue;
      }

      if (!store_->IsNotePath(path)) continue;

      if (auto kind = KindFromMask(event->mask)) {
        debouncer_.Add({path, *kind}, now);
      }
    }
  }
}

void ChangeWatcher::Run(const Callback& callback) {
  Open();

  NOTEWATCH_LOG_INFO("Watching note directory", {observability::StringField("path", store_->Root().string())});

  try {
    while (!stop_) {
      int timeout_ms = -1;
      if (auto deadline = debouncer_.NextDeadline()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - util::SteadyClock::now()).count();
        timeout_ms     = remaining > 0 ? static_cast<int>(remaining) + 1 : 0;
      }

      struct pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
      const int     rc     = ::poll(fds, 2, timeout_ms);
      if (rc < 0) {
        if (errno == EINTR) continue;
        throw util::WatchError(std::string("poll failed: ") + std::strerror(errno));
      }

      if (fds[1].revents & POLLIN) {
        uint64_t drained = 0;
        if (::read(wake_fd_, &drained, sizeof(drained)) < 0 && errno != EAGAIN) {
          throw util::WatchError(std::string("wake read failed: ") + std::strerror(errno));
        }
      }

      if (fds[0].revents & POLLIN) {
        HandleEvents(util::SteadyClock::now());
      }

      for (const auto& change : debouncer_.Drain(util::SteadyClock::now())) {
        callback(change);
      }
    }
  } catch (...) {
    Close();
    throw;
  }

  Close();
}

} // namespace notewatch::watch
