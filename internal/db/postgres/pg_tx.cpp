#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace reaper::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgConnectionPool> pool)
    : conn_(pool->Acquire()),
      work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (phase_ != TxPhase::kOpen) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    REAPER_LOG_WARN("catalog rollback failed",
                    {observability::StringField("backend", "postgres"), observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  work_->commit();
  phase_ = TxPhase::kCommitted;
}

void PgTransaction::Rollback() {
  if (phase_ != TxPhase::kOpen) return;
  phase_ = TxPhase::kRolledBack;
  work_->abort();
}

} // namespace reaper::db::postgres
