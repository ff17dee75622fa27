#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace reaper::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReplica(Transaction&, const model::ReplicaRecord&) override;
  std::optional<model::ReplicaRecord> GetReplica(Transaction&, const model::ReplicaKey&) override;
  std::vector<model::ReplicaRecord> ListReplicas(Transaction&, const std::string& rse_id) override;
  Result UpdateReplica(Transaction&, const model::ReplicaRecord&) override;

  std::vector<model::ReplicaRecord> ClaimReplicas(Transaction&, const std::string& rse_id, std::size_t limit,
                                                  uint64_t now_ms, uint64_t lease_expired_before_ms) override;
  Result RefreshReplicas(Transaction&, const std::string& rse_id, const std::vector<model::ReplicaKey>& keys,
                         uint64_t now_ms) override;
  Result DeleteReplicas(Transaction&, const std::vector<model::ReplicaKey>& keys,
                        std::vector<model::ReplicaKey>& skipped) override;

  uint64_t DatabaseTimeMs(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
