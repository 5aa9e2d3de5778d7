#include "note_committer.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::persist {

using observability::IntField;
using observability::StringField;

NoteCommitter::NoteCommitter(std::shared_ptr<const store::NoteStore> store, CommitOptions options)
    : store_(std::move(store)), options_(options) {
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

model::Note NoteCommitter::Commit(const model::MergedNote& merged) const {
  if (!merged.changed || merged.deleted) {
    return merged.note;
  }

  const auto path    = merged.note.path.string();
  auto       backoff = options_.backoff;

  for (std::uint32_t attempt = 1;; ++attempt) {
    const auto on_disk = store_->CurrentHash(merged.note.path);
    if (!on_disk || *on_disk != merged.base_hash) {
      throw util::MergeConflictError("note changed on disk during processing: " + path);
    }

    try {
      model::Note written  = merged.note;
      written.content_hash = store_->Write(merged.note);
      return written;
    } catch (const util::PersistenceError& e) {
      if (attempt >= options_.max_attempts) {
        throw util::PersistenceError("giving up after " + std::to_string(attempt) + " attempts: " + e.what());
      }
      NOTEWATCH_LOG_WARN("Note write failed, retrying",
                         {StringField("path", path), IntField("attempt", attempt), IntField("backoff_ms", backoff.count()), StringField("error", e.what())});
    }

    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

} // namespace notewatch::persist
