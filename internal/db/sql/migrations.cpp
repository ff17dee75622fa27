#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace reaper::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  REAPER_LOG_DEBUG("catalog schema applied", {observability::IntField("statements", static_cast<std::int64_t>(ordered_sql.size()))});
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS replicas (scope TEXT NOT NULL, name TEXT NOT NULL, rse_id TEXT NOT NULL, state INTEGER NOT NULL, bytes INTEGER NOT NULL DEFAULT 0, path TEXT, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (scope, name, rse_id));",
      "CREATE INDEX IF NOT EXISTS replicas_rse_state_idx ON replicas (rse_id, state, updated_at_ms);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS replicas (scope TEXT NOT NULL, name TEXT NOT NULL, rse_id TEXT NOT NULL, state SMALLINT NOT NULL, bytes BIGINT NOT NULL DEFAULT 0, path TEXT, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (scope, name, rse_id));",
      "CREATE INDEX IF NOT EXISTS replicas_rse_state_idx ON replicas (rse_id, state, updated_at_ms);"};
  return kSchema;
}

} // namespace reaper::db::sql
