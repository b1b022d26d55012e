#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace netmap::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex(), std::defer_lock) {
  if (!lock_.try_lock_for(db_->BusyTimeout())) {
    throw util::StoreTransactionError("sqlite transaction lock timed out on " + db_->Path());
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
      NETMAP_LOG_WARN("sqlite rollback failed",
                      {observability::StringField("path", db_->Path()), observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
    }
  }
}

Result SqliteTransaction::Commit() {
  const int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    // still inside the transaction; the destructor rolls it back
    return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
  // the transaction mutex is still held until this object dies
  RunCommitHooks();
  return Result::Ok();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace netmap::db::sqlite
