#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/model/note_event.hpp"
#include "internal/store/note_store.hpp"
#include "internal/watch/file_change.hpp"

namespace notewatch::watch {

/*
  Event Normalizer.

  Keeps the last known snapshot per path and turns a coalesced change into
  at most one NoteEvent:

    no snapshot, file exists          -> Created
    snapshot, file exists, new hash   -> Updated
    snapshot, file gone               -> Deleted
    same hash                         -> nothing

  Thread-safe; workers normalize different paths concurrently.
*/
class EventNormalizer {
 public:
  explicit EventNormalizer(std::shared_ptr<const store::NoteStore> store);

  std::optional<model::NoteEvent> Normalize(const FileChange& change);

  // Synced event for a note read from disk. Never suppressed by hash.
  model::NoteEvent Sync(const model::Note& note);

  // Records `note` as the last known state of its path.
  void Remember(const model::Note& note);
  void Forget(const std::filesystem::path& path);

  std::optional<model::Note> Snapshot(const std::filesystem::path& path) const;

  // Loads a snapshot for every note currently on disk. Returns the count.
  std::size_t Prime();

 private:
  std::shared_ptr<const store::NoteStore> store_;

  mutable std::mutex                            mutex_;
  std::map<std::filesystem::path, model::Note> snapshots_;
};

} // namespace notewatch::watch
