#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include "internal/watch/file_change.hpp"

namespace notewatch::dispatch {

enum class WorkKind : std::uint8_t {
  kChange = 0, // re-detect from disk
  kSync   = 1, // explicit sync of one note
};

struct WorkItem {
  std::filesystem::path path;
  WorkKind              kind   = WorkKind::kChange;
  watch::ChangeKind     change = watch::ChangeKind::kModify;
};

/*
  Per-path FIFO work queue.

  At most one item per path is handed out at a time; the next item for
  that path becomes ready when the worker calls Complete. A new item is
  coalesced into any pending item of the same kind for its path, so a
  path holds at most one pending item per kind.
*/
class PathScheduler {
 public:
  // false once shut down
  bool Enqueue(const WorkItem& item);

  // blocking wait; nullopt after shutdown once nothing is ready
  std::optional<WorkItem> Dequeue();

  void Complete(const std::filesystem::path& path);

  // With drop_pending, queued items are discarded; in-flight items still complete.
  void Shutdown(bool drop_pending);

  // Blocks until nothing is queued or in flight.
  void WaitIdle();

  std::size_t Pending() const;

 private:
  struct PathState {
    bool                 in_flight = false;
    std::deque<WorkItem> pending;
  };

  bool IdleLocked() const {
    return ready_.empty() && in_flight_ == 0;
  }

  mutable std::mutex                         mutex_;
  std::condition_variable                    cv_;
  std::condition_variable                    idle_cv_;
  std::map<std::filesystem::path, PathState> paths_;
  std::deque<std::filesystem::path>          ready_;
  std::size_t                                in_flight_ = 0;
  bool                                       shutdown_  = false;
};

} // namespace notewatch::dispatch
