#include "sqlite_index_observer.hpp"

#include <sstream>
#include <vector>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace notewatch::observers {

using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;

namespace {

constexpr std::string_view kOpenFence  = "```sql\n";
constexpr std::string_view kCloseFence = "\n```";
constexpr std::string_view kBeginMark  = "<!-- BEGIN SQL -->";
constexpr std::string_view kEndMark    = "<!-- END SQL -->";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string EscapeCell(const std::string& value) {
  std::string out;
  for (char c : value) {
    if (c == '|')
      out += "\\|";
    else if (c == '\n')
      out.push_back(' ');
    else
      out.push_back(c);
  }
  return out;
}

std::string Row(const std::vector<std::string>& cells) {
  std::string row = "|";
  for (const auto& cell : cells) row += " " + EscapeCell(cell) + " |";
  return row;
}

} // namespace

SqliteIndexObserver::SqliteIndexObserver(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  Migrate();
}

void SqliteIndexObserver::Migrate() {
  db_->Exec(R"(
    CREATE TABLE IF NOT EXISTS notes (
      id            INTEGER PRIMARY KEY AUTOINCREMENT,
      path          TEXT NOT NULL UNIQUE,
      title         TEXT NOT NULL,
      updated_at_ms INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS frontmatter (
      note_id INTEGER NOT NULL REFERENCES notes(id) ON DELETE CASCADE,
      key     TEXT NOT NULL,
      value   TEXT NOT NULL
    );
    CREATE INDEX IF NOT EXISTS frontmatter_key_value ON frontmatter(key, value);
  )");
}

bool SqliteIndexObserver::Upsert(const model::Note& note, const std::stop_token& stop) {
  SqliteTransaction tx(db_);

  {
    auto st = db_->Prepare("INSERT INTO notes(path, title, updated_at_ms) VALUES(?, ?, ?) "
                           "ON CONFLICT(path) DO UPDATE SET title = excluded.title, updated_at_ms = excluded.updated_at_ms;");
    BindText(st.get(), 1, note.path.string());
    BindText(st.get(), 2, note.title);
    sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    db_->Step(st.get());
  }

  sqlite3_int64 note_id = 0;
  {
    auto st = db_->Prepare("SELECT id FROM notes WHERE path = ?;");
    BindText(st.get(), 1, note.path.string());
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
      throw util::PersistenceError("note missing from index after upsert: " + note.path.string());
    }
    note_id = sqlite3_column_int64(st.get(), 0);
  }

  {
    auto st = db_->Prepare("DELETE FROM frontmatter WHERE note_id = ?;");
    sqlite3_bind_int64(st.get(), 1, note_id);
    db_->Step(st.get());
  }

  auto insert = db_->Prepare("INSERT INTO frontmatter(note_id, key, value) VALUES(?, ?, ?);");
  for (const auto& [key, value] : note.frontmatter.Entries()) {
    std::vector<std::string> values;
    if (const auto* list = std::get_if<std::vector<std::string>>(&value))
      values = *list;
    else
      values.push_back(model::MetaValueToString(value));

    for (const auto& v : values) {
      sqlite3_reset(insert.get());
      sqlite3_bind_int64(insert.get(), 1, note_id);
      BindText(insert.get(), 2, key);
      BindText(insert.get(), 3, v);
      db_->Step(insert.get());
    }
  }

  if (stop.stop_requested()) return false;
  tx.Commit();
  return true;
}

bool SqliteIndexObserver::Remove(const std::string& path, const std::stop_token& stop) {
  SqliteTransaction tx(db_);
  auto              st = db_->Prepare("DELETE FROM notes WHERE path = ?;");
  BindText(st.get(), 1, path);
  db_->Step(st.get());

  if (stop.stop_requested()) return false;
  tx.Commit();
  return true;
}

std::string SqliteIndexObserver::RunQuery(std::string_view sql) {
  auto*       db   = db_->Handle();
  const auto  text = std::string(sql);
  const char* tail = nullptr;

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, text.c_str(), -1, &raw, &tail) != SQLITE_OK) {
    return std::string("Error: ") + sqlite3_errmsg(db);
  }
  Statement st(raw);
  if (!st) return "Error: empty statement";
  if (tail && !util::Trim(tail).empty()) return "Error: only one statement per block";
  if (!sqlite3_stmt_readonly(st.get())) return "Error: only read-only statements are allowed";

  const int                columns = sqlite3_column_count(st.get());
  std::vector<std::string> header;
  for (int i = 0; i < columns; ++i) header.emplace_back(sqlite3_column_name(st.get(), i));

  std::ostringstream out;
  out << Row(header) << "\n";
  out << Row(std::vector<std::string>(columns, "---")) << "\n";

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    std::vector<std::string> cells;
    for (int i = 0; i < columns; ++i) cells.push_back(ColText(st.get(), i));
    out << Row(cells) << "\n";
  }
  if (rc != SQLITE_DONE) return std::string("Error: ") + sqlite3_errmsg(db);

  auto table = out.str();
  table.pop_back();
  return table;
}

std::string SqliteIndexObserver::RenderQueries(std::string_view body) {
  std::string out;
  std::size_t cursor = 0;

  while (true) {
    auto open = body.find(kOpenFence, cursor);
    while (open != std::string_view::npos && open != 0 && body[open - 1] != '\n') {
      open = body.find(kOpenFence, open + 1);
    }
    if (open == std::string_view::npos) break;

    const auto code_begin = open + kOpenFence.size();
    const auto close      = body.find(kCloseFence, code_begin - 1);
    if (close == std::string_view::npos) break;

    const auto block_end = close + kCloseFence.size();
    out.append(body.substr(cursor, block_end - cursor));

    const auto query = body.substr(code_begin, close >= code_begin ? close - code_begin : 0);

    // skip a previous result directly after the block
    auto       next     = block_end;
    const auto existing = std::string("\n") + std::string(kBeginMark);
    if (body.compare(next, existing.size(), existing) == 0) {
      const auto end = body.find(kEndMark, next);
      if (end != std::string_view::npos) next = end + kEndMark.size();
    }

    out += "\n";
    out += kBeginMark;
    out += "\n";
    out += RunQuery(query);
    out += "\n";
    out += kEndMark;

    cursor = next;
  }

  out.append(body.substr(cursor));
  return out;
}

model::ObserverResult SqliteIndexObserver::Process(const model::NoteEvent& event, std::stop_token stop) {
  std::lock_guard lock(mutex_);

  if (event.kind == model::EventKind::kDeleted) {
    if (!Remove(event.path.string(), stop)) return model::ObserverResult::Failed("cancelled, index unchanged");
    return model::ObserverResult::Unchanged();
  }
  if (!event.after) return model::ObserverResult::Unchanged();

  if (!Upsert(*event.after, stop)) {
    return model::ObserverResult::Failed("cancelled, index unchanged");
  }

  if (event.kind != model::EventKind::kSynced) {
    return model::ObserverResult::Unchanged();
  }

  auto body = RenderQueries(event.after->body);
  if (stop.stop_requested()) {
    return model::ObserverResult::Failed("cancelled while running SQL blocks");
  }
  if (body == event.after->body) {
    return model::ObserverResult::Unchanged();
  }

  NOTEWATCH_LOG_DEBUG("SQL blocks refreshed", {observability::StringField("path", event.path.string())});

  model::ObserverResult result;
  result.status = model::ObserverStatus::kModified;
  result.body   = std::move(body);
  return result;
}

} // namespace notewatch::observers
