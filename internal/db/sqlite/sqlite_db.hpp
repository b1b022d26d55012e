#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace netmap::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction, so transactions on it are
  serialized through tx_mutex_. A transaction that cannot get the mutex (or
  the file lock, when another process holds it) within busy_timeout fails
  as Busy and the batch is retried.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000), bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return busy_timeout_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  bool                      wal_mode_ = true;
  std::timed_mutex          tx_mutex_;
};

// Creates the graph tables if they are missing.
void BootstrapSchema(SqliteDB& db);

} // namespace netmap::db::sqlite
