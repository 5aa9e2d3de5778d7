#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace notewatch::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Index database handle.

  Opens (or creates) the file and sets it up for one writer and any
  number of readers. ":memory:" gives a private in-process index.
  Failures are PersistenceError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  // Runs one or more statements without results (schema, pragmas, tx control).
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Steps a statement that returns no rows.
  void Step(sqlite3_stmt* st);

 private:
  void Configure();
  [[noreturn]] void Fail(const std::string& what) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace notewatch::db::sqlite
