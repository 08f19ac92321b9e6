#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace voucher::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const util::StorageError& e) {
      VOUCHER_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const util::StorageError&) {
    // a failed COMMIT leaves the transaction open
    if (!sqlite3_get_autocommit(db_->Handle())) {
      db_->Exec("ROLLBACK;");
    }
    finished_ = true;
    throw;
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace voucher::db::sqlite
