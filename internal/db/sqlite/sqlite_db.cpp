#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace reaper::db::sqlite {
namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

// WAL keeps catalog readers in other processes unblocked while one reaper claims.
constexpr const char* kPragmas[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA temp_store=MEMORY;",
};

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  if (sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr) != SQLITE_OK) {
    std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::DatabaseError("cannot open replica catalog " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw util::DatabaseError("sqlite: " + msg);
}

void SqliteDB::ApplyPragmas(std::chrono::milliseconds busy_timeout) {
  for (const char* pragma : kPragmas) Exec(pragma);

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw util::DatabaseError(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace reaper::db::sqlite
