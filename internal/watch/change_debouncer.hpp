#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <vector>

#include "internal/util/time.hpp"
#include "internal/watch/file_change.hpp"

namespace notewatch::watch {

/*
  Per-path debounce window.

  The window opens with the first notification for a path. Everything that
  arrives before it closes collapses into one change carrying the latest kind.
  Not thread-safe; owned by the watcher thread.
*/
class ChangeDebouncer {
 public:
  explicit ChangeDebouncer(std::chrono::milliseconds window);

  void Add(const FileChange& change, util::SteadyTimePoint now);

  // Changes whose window closed at or before `now`, in path order.
  std::vector<FileChange> Drain(util::SteadyTimePoint now);

  // Earliest window close, nullopt when nothing is pending.
  std::optional<util::SteadyTimePoint> NextDeadline() const;

  std::size_t Pending() const {
    return pending_.size();
  }

 private:
  struct Entry {
    ChangeKind            kind;
    util::SteadyTimePoint deadline;
  };

  std::chrono::milliseconds                window_;
  std::map<std::filesystem::path, Entry> pending_;
};

} // namespace notewatch::watch
