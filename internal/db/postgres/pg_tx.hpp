#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace reaper::db::postgres {

// Holds a pooled connection for as long as the pqxx::work lives; the
// connection goes back to the pool when the transaction is destroyed.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgConnectionPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == TxPhase::kCommitted;
  }

 private:
  // declared before work_ so the work is destroyed first
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  TxPhase                           phase_ = TxPhase::kOpen;
};

} // namespace reaper::db::postgres
