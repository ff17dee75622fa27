#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace reaper::db::sqlite {

// BEGIN IMMEDIATE takes the write lock up front so a claim's SELECT and
// UPDATE see no other writer in between.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == TxPhase::kCommitted;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
  TxPhase                      phase_ = TxPhase::kOpen;
};

} // namespace reaper::db::sqlite
