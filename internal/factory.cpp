#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/lease/repository_lease_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/disk/disk_physical_deleter.hpp"
#include "internal/util/time.hpp"
#if REAPER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if REAPER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace reaper::factory {

using observability::IntField;
using observability::StringField;

namespace {

#if REAPER_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgConnectionPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const reaper::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if REAPER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    REAPER_LOG_INFO("catalog opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if REAPER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0
                                     ? db::postgres::PgConnectionPool::kDefaultMaxConnections
                                     : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgConnectionPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    REAPER_LOG_INFO("catalog opened", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  // the in-memory catalog is process-local: only useful for a single daemon with threads
  REAPER_LOG_WARN("catalog opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::chrono::milliseconds CheckClockOffset(db::Repository& repository, const util::ClockSource& local,
                                           std::chrono::seconds max_offset) {
  auto       tx       = repository.Begin();
  const auto db_ms    = static_cast<int64_t>(repository.DatabaseTimeMs(*tx));
  tx->Commit();
  const auto local_ms = static_cast<int64_t>(util::ToUnixMillis(local.Now()));

  const std::chrono::milliseconds offset(db_ms - local_ms);
  if (std::chrono::abs(offset) > max_offset) {
    REAPER_LOG_ERROR("offset between local and catalog clock too big",
                     {IntField("offset_ms", offset.count()), IntField("max_offset_seconds", max_offset.count())});
    throw std::runtime_error("local clock differs from catalog clock by " + std::to_string(offset.count()) + "ms");
  }
  REAPER_LOG_DEBUG("catalog clock checked", {IntField("offset_ms", offset.count())});
  return offset;
}

/*
    Build full application dependency graph
*/
Application Build(const reaper::runtime::config::RuntimeConfig& config) {
  Application app;

  app.options = config::ReaperOptions::FromConfig(config.reaper());
  if (app.options.rse_ids.empty()) {
    throw std::runtime_error("reaper.rse_ids must name at least one RSE");
  }
  if (config.storage().root_path().empty()) {
    throw std::runtime_error("storage.root_path must be set");
  }

  auto clock = std::make_shared<const util::SystemClockSource>();

  app.repository  = BuildRepository(config.database());
  if (app.options.max_clock_offset_seconds > 0) {
    CheckClockOffset(*app.repository, *clock, std::chrono::seconds(app.options.max_clock_offset_seconds));
  }
  app.lease_store = std::make_shared<lease::RepositoryLeaseStore>(app.repository);
  app.deleter     = std::make_shared<storage::DiskPhysicalDeleter>(config.storage().root_path());
  app.reaper      = std::make_shared<core::Reaper>(app.lease_store, app.deleter, clock);
  app.daemon      = std::make_unique<runtime::ReaperDaemon>(app.reaper, app.options);

  return app;
}

} // namespace reaper::factory
