#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace netmap::db::sqlite {

namespace {

[[noreturn]] void ThrowSqlite(int rc, const std::string& msg) {
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::StoreTransactionError(msg);
  }
  throw util::StoreCorruptionError(msg);
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout, bool wal_mode)
    : path_(std::move(path)), busy_timeout_(busy_timeout), wal_mode_(wal_mode) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreCorruptionError("open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowSqlite(rc, msg);
  }
}

void SqliteDB::Configure() {
  if (wal_mode_) {
    // WAL lets readers in other processes proceed while a batch commits
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks held by other processes instead of failing immediately
  const int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count()));
  if (rc != SQLITE_OK) ThrowSqlite(rc, std::string("busy_timeout: ") + sqlite3_errmsg(db_));

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  sql::RunMigrations(db, sql::GraphSchema());
}

} // namespace netmap::db::sqlite
