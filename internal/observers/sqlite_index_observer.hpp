#pragma once

#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"

namespace notewatch::observers {

/*
  SQLite frontmatter index.

  Mirrors every note's frontmatter into two tables:

    notes(id, path, title, updated_at_ms)
    frontmatter(note_id, key, value)   -- one row per list element

  On sync, each ```sql block in the note body is run read-only against the
  index and its result is rendered as a markdown table right after the
  block, between BEGIN SQL / END SQL comments.
*/
class SqliteIndexObserver {
 public:
  explicit SqliteIndexObserver(std::shared_ptr<db::sqlite::SqliteDB> db);

  // Index changes are rolled back once `stop` is signalled.
  model::ObserverResult Process(const model::NoteEvent& event, std::stop_token stop = {});

  // Markdown table for a read-only query, or "Error: ..." text.
  std::string RunQuery(std::string_view sql);

  // Body with every sql block's result refreshed.
  std::string RenderQueries(std::string_view body);

 private:
  void Migrate();
  bool Upsert(const model::Note& note, const std::stop_token& stop);
  bool Remove(const std::string& path, const std::stop_token& stop);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::mutex                            mutex_;
};

} // namespace notewatch::observers
