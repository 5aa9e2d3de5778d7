#include "change_debouncer.hpp"

namespace notewatch::watch {

ChangeDebouncer::ChangeDebouncer(std::chrono::milliseconds window) : window_(window) {
}

void ChangeDebouncer::Add(const FileChange& change, util::SteadyTimePoint now) {
  auto it = pending_.find(change.path);
  if (it == pending_.end()) {
    pending_.emplace(change.path, Entry{change.kind, now + window_});
    return;
  }
  it->second.kind = change.kind;
}

std::vector<FileChange> ChangeDebouncer::Drain(util::SteadyTimePoint now) {
  std::vector<FileChange> due;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->second.deadline <= now) {
      due.push_back({it->first, it->second.kind});
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
  return due;
}

std::optional<util::SteadyTimePoint> ChangeDebouncer::NextDeadline() const {
  std::optional<util::SteadyTimePoint> next;
  for (const auto& [path, entry] : pending_) {
    if (!next || entry.deadline < *next) next = entry.deadline;
  }
  return next;
}

} // namespace notewatch::watch
