#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace notewatch::db::sqlite {

/*
  Write transaction over the index.

  Takes the write lock on entry (BEGIN IMMEDIATE), so readers running SQL
  blocks never see a half-indexed note. Rolled back unless Commit() ran.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      done_ = false;
};

} // namespace notewatch::db::sqlite
