#include "path_scheduler.hpp"

#include <algorithm>

namespace notewatch::dispatch {

bool PathScheduler::Enqueue(const WorkItem& item) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;

    auto& state   = paths_[item.path];
    auto  pending = std::find_if(state.pending.begin(), state.pending.end(),
                                 [&](const WorkItem& queued) { return queued.kind == item.kind; });
    if (pending != state.pending.end()) {
      pending->change = item.change;
      return true;
    }

    const bool was_idle = !state.in_flight && state.pending.empty();
    state.pending.push_back(item);
    if (!was_idle) return true;

    ready_.push_back(item.path);
  }
  cv_.notify_one();
  return true;
}

std::optional<WorkItem> PathScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !ready_.empty(); });

  if (ready_.empty()) return std::nullopt;

  auto path = std::move(ready_.front());
  ready_.pop_front();

  auto& state     = paths_[path];
  state.in_flight = true;
  ++in_flight_;

  WorkItem item = std::move(state.pending.front());
  state.pending.pop_front();
  return item;
}

void PathScheduler::Complete(const std::filesystem::path& path) {
  bool notify_work = false;
  bool notify_idle = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = paths_.find(path);
    if (it == paths_.end() || !it->second.in_flight) return;

    it->second.in_flight = false;
    --in_flight_;

    if (!it->second.pending.empty()) {
      ready_.push_back(path);
      notify_work = true;
    } else {
      paths_.erase(it);
    }
    notify_idle = IdleLocked();
  }
  if (notify_work) cv_.notify_one();
  if (notify_idle) idle_cv_.notify_all();
}

void PathScheduler::Shutdown(bool drop_pending) {
  bool notify_idle = false;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    if (drop_pending) {
      ready_.clear();
      for (auto it = paths_.begin(); it != paths_.end();) {
        it->second.pending.clear();
        it = it->second.in_flight ? std::next(it) : paths_.erase(it);
      }
    }
    notify_idle = IdleLocked();
  }
  cv_.notify_all();
  if (notify_idle) idle_cv_.notify_all();
}

void PathScheduler::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return IdleLocked(); });
}

std::size_t PathScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [path, state] : paths_) count += state.pending.size();
  return count;
}

} // namespace notewatch::dispatch
