#pragma once

#include <string>
#include <vector>

namespace netmap::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Graph schema, in application order. Every statement is idempotent so the
  list can be replayed on an existing database.
*/
const std::vector<std::string>& GraphSchema();

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace netmap::db::sql
