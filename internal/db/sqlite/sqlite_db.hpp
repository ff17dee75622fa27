#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace reaper::db::sqlite {

/*
  Owns the process's single connection to a sqlite replica catalog.

  Reaper threads of one process share the connection and take
  TransactionMutex() for the lifetime of a transaction. Reapers in
  other processes open their own connection; the database write lock
  plus the busy timeout keeps their claims apart.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  static constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = kDefaultBusyTimeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

 private:
  void ApplyPragmas(std::chrono::milliseconds busy_timeout);

  std::string path_;
  sqlite3*    db_ = nullptr;
  std::mutex  tx_mutex_;
};

} // namespace reaper::db::sqlite
