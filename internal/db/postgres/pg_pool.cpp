#include "pg_pool.hpp"

namespace reaper::db::postgres {
namespace {

void PrepareReplicaStatements(pqxx::connection& conn) {
  conn.prepare("insert_replica",
               "INSERT INTO replicas(scope,name,rse_id,state,bytes,path,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("get_replica",
               "SELECT scope,name,rse_id,state,bytes,path,updated_at_ms "
               "FROM replicas WHERE scope=$1 AND name=$2 AND rse_id=$3");

  conn.prepare("list_replicas",
               "SELECT scope,name,rse_id,state,bytes,path,updated_at_ms "
               "FROM replicas WHERE rse_id=$1 ORDER BY scope,name");

  conn.prepare("update_replica",
               "UPDATE replicas SET state=$4,bytes=$5,path=$6,updated_at_ms=$7 "
               "WHERE scope=$1 AND name=$2 AND rse_id=$3");

  // SKIP LOCKED lets concurrent reapers claim disjoint rows without waiting
  conn.prepare("claim_replicas",
               "WITH candidates AS ("
               " SELECT scope,name FROM replicas"
               " WHERE rse_id=$1 AND (state=$2 OR (state=$3 AND updated_at_ms<$4))"
               " ORDER BY scope,name LIMIT $5 FOR UPDATE SKIP LOCKED) "
               "UPDATE replicas r SET state=$3, updated_at_ms=$6 "
               "FROM candidates c WHERE r.rse_id=$1 AND r.scope=c.scope AND r.name=c.name "
               "RETURNING r.scope,r.name,r.rse_id,r.state,r.bytes,r.path,r.updated_at_ms");

  conn.prepare("refresh_replica",
               "UPDATE replicas SET updated_at_ms=$4 "
               "WHERE scope=$1 AND name=$2 AND rse_id=$3 AND state=$5");

  conn.prepare("select_now_ms", "SELECT (extract(epoch FROM clock_timestamp()) * 1000)::bigint");

  conn.prepare("delete_replica",
               "DELETE FROM replicas WHERE scope=$1 AND name=$2 AND rse_id=$3 AND state=$4");
}

} // namespace

PgConnectionPool::PgConnectionPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      capacity_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgConnectionPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || opened_ < capacity_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return HandOut(std::move(conn));
  }

  ++opened_;
  lock.unlock();
  try {
    return HandOut(Open());
  } catch (const std::exception&) {
    lock.lock();
    --opened_;
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgConnectionPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  PrepareReplicaStatements(*conn);
  return conn;
}

std::shared_ptr<pqxx::connection> PgConnectionPool::HandOut(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgConnectionPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* c) {
    if (auto owner = pool.lock()) {
      owner->GiveBack(c);
    } else {
      delete c;
    }
  });
}

void PgConnectionPool::GiveBack(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  // a connection that broke mid-transaction is closed; free its slot instead
  const bool reusable = owned->is_open();
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.push_back(std::move(owned));
    } else {
      --opened_;
    }
  }
  returned_.notify_one();
}

} // namespace reaper::db::postgres
