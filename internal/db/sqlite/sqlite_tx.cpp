#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (sqlite3_get_autocommit(db_->Handle())) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::StoreError& e) {
    FLOWSTORE_LOG_WARN("rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace flowstore::db::sqlite
