#pragma once

namespace reaper::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres prepares its own $n variants in PgConnectionPool.
*/

static constexpr const char* INSERT_REPLICA =
    "INSERT INTO replicas(scope,name,rse_id,state,bytes,path,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_REPLICA =
    "SELECT scope,name,rse_id,state,bytes,path,updated_at_ms"
    " FROM replicas WHERE scope=? AND name=? AND rse_id=?;";

static constexpr const char* SELECT_REPLICAS_BY_RSE =
    "SELECT scope,name,rse_id,state,bytes,path,updated_at_ms"
    " FROM replicas WHERE rse_id=? ORDER BY scope,name;";

static constexpr const char* UPDATE_REPLICA =
    "UPDATE replicas SET state=?,bytes=?,path=?,updated_at_ms=?"
    " WHERE scope=? AND name=? AND rse_id=?;";

// lease

static constexpr const char* SELECT_CLAIMABLE =
    "SELECT scope,name,rse_id,state,bytes,path,updated_at_ms"
    " FROM replicas WHERE rse_id=?"
    " AND (state=? OR (state=? AND updated_at_ms<?))"
    " ORDER BY scope,name LIMIT ?;";

// guard repeats the eligibility test so a row claimed in between is skipped
static constexpr const char* CLAIM_REPLICA =
    "UPDATE replicas SET state=?,updated_at_ms=?"
    " WHERE scope=? AND name=? AND rse_id=?"
    " AND (state=? OR (state=? AND updated_at_ms<?));";

static constexpr const char* REFRESH_REPLICA =
    "UPDATE replicas SET updated_at_ms=?"
    " WHERE scope=? AND name=? AND rse_id=? AND state=?;";

static constexpr const char* DELETE_REPLICA =
    "DELETE FROM replicas"
    " WHERE scope=? AND name=? AND rse_id=? AND state=?;";

// julianday 2440587.5 is the unix epoch
static constexpr const char* SELECT_NOW_MS =
    "SELECT CAST((julianday('now') - 2440587.5) * 86400000.0 AS INTEGER);";

}
