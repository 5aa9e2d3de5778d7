#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::PersistenceError& e) {
    NOTEWATCH_LOG_ERROR("Index rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  done_ = true;
}

} // namespace notewatch::db::sqlite
