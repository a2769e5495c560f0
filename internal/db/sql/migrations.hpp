#pragma once

#include <string>
#include <vector>

namespace miner::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements ExecuteSQL(); the statement lists below are
  idempotent (CREATE ... IF NOT EXISTS) and run on every start.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace miner::db::sql
