#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace reaper::db::sqlite {

using reaper::db::ErrorCode;
using reaper::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::DatabaseError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindKey(sqlite3_stmt* st, int first_idx, const model::ReplicaKey& key) {
  BindText(st, first_idx, key.scope);
  BindText(st, first_idx + 1, key.name);
  BindText(st, first_idx + 2, key.rse_id);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::ReplicaRecord ReadRow(sqlite3_stmt* st) {
  model::ReplicaRecord r;
  r.key.scope      = ColText(st, 0);
  r.key.name       = ColText(st, 1);
  r.key.rse_id     = ColText(st, 2);
  r.state          = static_cast<model::ReplicaState>(sqlite3_column_int(st, 3));
  r.bytes          = ColU64(st, 4);
  r.path           = ColText(st, 5);
  r.updated_at_ms  = ColU64(st, 6);
  return r;
}

constexpr int kBeingDeleted = static_cast<int>(model::ReplicaState::kBeingDeleted);
constexpr int kAvailable    = static_cast<int>(model::ReplicaState::kAvailable);

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Replica rows
// ------------------------------------------------------------------

Result SqliteRepository::InsertReplica(Transaction& t, const model::ReplicaRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_REPLICA, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement guard(st);

    BindKey(st, 1, r.key);
    BindI32(st, 4, static_cast<int>(r.state));
    BindU64(st, 5, r.bytes);
    BindText(st, 6, r.path);
    BindU64(st, 7, r.updated_at_ms);

    int rc = sqlite3_step(st);
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.key.ToString());
    return Translate(db, rc);
}

std::optional<model::ReplicaRecord>
SqliteRepository::GetReplica(Transaction& t, const model::ReplicaKey& key) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_REPLICA);

    BindKey(st.get(), 1, key);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw util::DatabaseError(Translate(db, rc).message);

    return ReadRow(st.get());
}

std::vector<model::ReplicaRecord>
SqliteRepository::ListReplicas(Transaction& t, const std::string& rse_id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_REPLICAS_BY_RSE);

    BindText(st.get(), 1, rse_id);

    std::vector<model::ReplicaRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadRow(st.get()));
    }
    if (rc != SQLITE_DONE) throw util::DatabaseError(Translate(db, rc).message);
    return out;
}

Result SqliteRepository::UpdateReplica(Transaction& t, const model::ReplicaRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_REPLICA, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement guard(st);

    BindI32(st, 1, static_cast<int>(r.state));
    BindU64(st, 2, r.bytes);
    BindText(st, 3, r.path);
    BindU64(st, 4, r.updated_at_ms);
    BindKey(st, 5, r.key);

    auto result = Translate(db, sqlite3_step(st));
    if (result && result.rows_affected == 0)
        return Result::Err(ErrorCode::NotFound, r.key.ToString());
    return result;
}

// ------------------------------------------------------------------
// Lease operations
// ------------------------------------------------------------------

std::vector<model::ReplicaRecord>
SqliteRepository::ClaimReplicas(Transaction& t, const std::string& rse_id, std::size_t limit,
                                uint64_t now_ms, uint64_t lease_expired_before_ms) {
    std::vector<model::ReplicaRecord> claimed;
    if (limit == 0) return claimed;

    auto* db = TX(t).Handle();

    std::vector<model::ReplicaRecord> candidates;
    {
        auto select = PrepareOrThrow(db, sql::SELECT_CLAIMABLE);
        BindText(select.get(), 1, rse_id);
        BindI32(select.get(), 2, kAvailable);
        BindI32(select.get(), 3, kBeingDeleted);
        BindU64(select.get(), 4, lease_expired_before_ms);
        BindU64(select.get(), 5, limit);

        int rc;
        while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
            candidates.push_back(ReadRow(select.get()));
        }
        if (rc != SQLITE_DONE) throw util::DatabaseError(Translate(db, rc).message);
    }

    auto update = PrepareOrThrow(db, sql::CLAIM_REPLICA);
    for (auto& candidate : candidates) {
        sqlite3_reset(update.get());
        sqlite3_clear_bindings(update.get());

        BindI32(update.get(), 1, kBeingDeleted);
        BindU64(update.get(), 2, now_ms);
        BindKey(update.get(), 3, candidate.key);
        BindI32(update.get(), 6, kAvailable);
        BindI32(update.get(), 7, kBeingDeleted);
        BindU64(update.get(), 8, lease_expired_before_ms);

        auto result = Translate(db, sqlite3_step(update.get()));
        if (!result) throw util::DatabaseError(result.message);
        if (result.rows_affected == 0) continue;

        candidate.state         = model::ReplicaState::kBeingDeleted;
        candidate.updated_at_ms = now_ms;
        claimed.push_back(std::move(candidate));
    }
    return claimed;
}

Result SqliteRepository::RefreshReplicas(Transaction& t, const std::string& rse_id,
                                         const std::vector<model::ReplicaKey>& keys, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::REFRESH_REPLICA, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement guard(st);

    uint64_t touched = 0;
    for (const auto& key : keys) {
        if (key.rse_id != rse_id) continue;

        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
        BindU64(st, 1, now_ms);
        BindKey(st, 2, key);
        BindI32(st, 5, kBeingDeleted);

        auto result = Translate(db, sqlite3_step(st));
        if (!result) return result;
        touched += result.rows_affected;
    }
    return Result::Ok(touched);
}

Result SqliteRepository::DeleteReplicas(Transaction& t, const std::vector<model::ReplicaKey>& keys,
                                        std::vector<model::ReplicaKey>& skipped) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_REPLICA, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement guard(st);

    uint64_t removed = 0;
    for (const auto& key : keys) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
        BindKey(st, 1, key);
        BindI32(st, 4, kBeingDeleted);

        auto result = Translate(db, sqlite3_step(st));
        if (!result) return result;
        if (result.rows_affected == 0) skipped.push_back(key);
        removed += result.rows_affected;
    }
    return Result::Ok(removed);
}

uint64_t SqliteRepository::DatabaseTimeMs(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_NOW_MS);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) throw util::DatabaseError(Translate(db, rc).message);
    return ColU64(st.get(), 0);
}

} // namespace reaper::db::sqlite
