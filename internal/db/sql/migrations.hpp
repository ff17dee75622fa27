#pragma once

#include <string>
#include <vector>

namespace reaper::db::sql {

// Runs one DDL statement; implemented by each catalog backend.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Applies the statements in order. Every statement is idempotent, so
// reapers starting together against one catalog may all run it.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// `replicas` table plus the (rse_id, state, updated_at_ms) index the
// claim query scans.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace reaper::db::sql
