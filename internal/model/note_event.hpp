#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "internal/model/note.hpp"

namespace notewatch::model {

enum class EventKind : std::uint8_t {
  kCreated = 0,
  kUpdated = 1,
  kSynced  = 2,
  kDeleted = 3,
};

enum class EventCause : std::uint8_t {
  kFileSystem  = 0,
  kSyncCommand = 1,
};

// "Created", "Updated", "Synced", "Deleted"
std::string_view EventKindName(EventKind kind);

// Case-insensitive inverse of EventKindName.
std::optional<EventKind> ParseEventKind(std::string_view name);

struct NoteEvent {
  EventKind             kind  = EventKind::kUpdated;
  EventCause            cause = EventCause::kFileSystem;
  std::filesystem::path path;

  std::optional<Note> before;
  std::optional<Note> after;

  // The snapshot observers act on: `after`, or `before` for deletions.
  const Note& Subject() const;
};

} // namespace notewatch::model
