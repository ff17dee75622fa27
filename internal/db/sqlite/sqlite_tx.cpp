#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace reaper::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (phase_ != TxPhase::kOpen) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    REAPER_LOG_WARN("catalog rollback failed",
                    {observability::StringField("backend", "sqlite"), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  phase_ = TxPhase::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (phase_ != TxPhase::kOpen) return;
  phase_ = TxPhase::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace reaper::db::sqlite
