#include "sqlite_db.hpp"

#include <filesystem>

#include "internal/util/errors.hpp"

namespace notewatch::db::sqlite {

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (!InMemory()) {
    const auto      parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::PersistenceError("cannot create index directory " + parent.string() + ": " + ec.message());
    }
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::PersistenceError("cannot open index " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Fail(const std::string& what) const {
  throw util::PersistenceError(what + " (" + path_ + "): " + sqlite3_errmsg(db_));
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw util::PersistenceError("sqlite exec (" + path_ + "): " + msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    Fail("sqlite prepare");
  }
  return Statement(raw);
}

void SqliteDB::Step(sqlite3_stmt* st) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    Fail("sqlite step");
  }
}

void SqliteDB::Configure() {
  // SQL blocks read while the observer writes
  if (!InMemory()) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    Fail("sqlite busy_timeout");
  }
}

} // namespace notewatch::db::sqlite
