#include "event_normalizer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::watch {

using model::EventCause;
using model::EventKind;
using model::NoteEvent;

EventNormalizer::EventNormalizer(std::shared_ptr<const store::NoteStore> store) : store_(std::move(store)) {
}

std::optional<NoteEvent> EventNormalizer::Normalize(const FileChange& change) {
  const auto path  = store_->Resolve(change.path);
  auto       prior = Snapshot(path);

  std::optional<model::Note> current;
  try {
    current = store_->Read(path);
  } catch (const util::NotFound&) {
    // removed, or renamed away before we got to read it
  }

  if (!current) {
    if (!prior) return std::nullopt;

    Forget(path);
    NoteEvent event;
    event.kind   = EventKind::kDeleted;
    event.cause  = EventCause::kFileSystem;
    event.path   = path;
    event.before = std::move(prior);
    return event;
  }

  if (prior && prior->content_hash == current->content_hash) {
    NOTEWATCH_LOG_DEBUG("Unchanged content, no event", {observability::StringField("path", path.string())});
    return std::nullopt;
  }

  Remember(*current);

  NoteEvent event;
  event.kind   = prior ? EventKind::kUpdated : EventKind::kCreated;
  event.cause  = EventCause::kFileSystem;
  event.path   = path;
  event.before = std::move(prior);
  event.after  = std::move(current);
  return event;
}

NoteEvent EventNormalizer::Sync(const model::Note& note) {
  NoteEvent event;
  event.kind   = EventKind::kSynced;
  event.cause  = EventCause::kSyncCommand;
  event.path   = note.path;
  event.before = Snapshot(note.path);
  event.after  = note;

  Remember(note);
  return event;
}

void EventNormalizer::Remember(const model::Note& note) {
  std::lock_guard lock(mutex_);
  snapshots_[note.path] = note;
}

void EventNormalizer::Forget(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  snapshots_.erase(path);
}

std::optional<model::Note> EventNormalizer::Snapshot(const std::filesystem::path& path) const {
  std::lock_guard lock(mutex_);
  auto            it = snapshots_.find(path);
  if (it == snapshots_.end()) return std::nullopt;
  return it->second;
}

std::size_t EventNormalizer::Prime() {
  std::size_t count = 0;
  for (const auto& path : store_->List()) {
    try {
      Remember(store_->Read(path));
      ++count;
    } catch (const std::exception& e) {
      NOTEWATCH_LOG_WARN("Cannot snapshot note", {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
    }
  }
  return count;
}

} // namespace notewatch::watch
