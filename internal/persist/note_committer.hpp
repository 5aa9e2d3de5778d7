#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/model/observer.hpp"
#include "internal/store/note_store.hpp"

namespace notewatch::persist {

struct CommitOptions {
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds backoff{100};
};

/*
  Persistence Layer.

  Writes a merged note back through the store. The on-disk hash must still
  be the one the dispatch started from, otherwise MergeConflictError is
  thrown and the external edit is left untouched. Write failures are
  retried with doubling backoff, then surface as PersistenceError.
*/
class NoteCommitter {
 public:
  NoteCommitter(std::shared_ptr<const store::NoteStore> store, CommitOptions options);

  // Returns the note as written, with its new content hash. Unchanged or
  // deleted notes are returned as is without touching the disk.
  model::Note Commit(const model::MergedNote& merged) const;

 private:
  std::shared_ptr<const store::NoteStore> store_;
  CommitOptions                           options_;
};

} // namespace notewatch::persist
