#include "note_event.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace notewatch::model {

std::string_view EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kCreated:
      return "Created";
    case EventKind::kUpdated:
      return "Updated";
    case EventKind::kSynced:
      return "Synced";
    case EventKind::kDeleted:
      return "Deleted";
  }
  return "Unknown";
}

std::optional<EventKind> ParseEventKind(std::string_view name) {
  const auto lowered = util::ToLower(name);
  if (lowered == "created") return EventKind::kCreated;
  if (lowered == "updated") return EventKind::kUpdated;
  if (lowered == "synced") return EventKind::kSynced;
  if (lowered == "deleted") return EventKind::kDeleted;
  return std::nullopt;
}

const Note& NoteEvent::Subject() const {
  if (after) return *after;
  if (before) return *before;
  throw util::InvalidArgument("event without snapshot: " + path.string());
}

} // namespace notewatch::model
