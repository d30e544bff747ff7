#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

#include "internal/model/stage_payload.hpp"

namespace docflow::db::sqlite {

using docflow::db::ErrorCode;
using docflow::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static constexpr const char* kExecutionColumns =
    "execution_id,container,object_key,status,current_stage_index,payload_json,attempt,"
    "created_at_ms,updated_at_ms,last_error,version";

static model::ExecutionRecord ReadExecution(sqlite3_stmt* st) {
    model::ExecutionRecord r;
    r.execution_id        = ColText(st, 0);
    r.container           = ColText(st, 1);
    r.key                 = ColText(st, 2);
    r.status              = static_cast<docflow::v1::ExecutionStatus>(ColI32(st, 3));
    r.current_stage_index = static_cast<uint32_t>(ColI32(st, 4));
    r.payload             = docflow::model::FromJson(ColText(st, 5));
    r.attempt             = static_cast<uint32_t>(ColI32(st, 6));
    r.created_at_ms       = ColU64(st, 7);
    r.updated_at_ms       = ColU64(st, 8);
    r.last_error          = ColText(st, 9);
    r.version             = ColU64(st, 10);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    static const std::vector<std::string> kBootstrapSql = {
        "CREATE TABLE IF NOT EXISTS execution (execution_id TEXT PRIMARY KEY, container TEXT NOT NULL, object_key TEXT NOT NULL, status INTEGER NOT NULL, current_stage_index INTEGER NOT NULL, payload_json TEXT NOT NULL, attempt INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, last_error TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, UNIQUE(container, object_key));",
        "CREATE TABLE IF NOT EXISTS execution_audit (execution_id TEXT NOT NULL REFERENCES execution(execution_id), sequence INTEGER NOT NULL, kind TEXT NOT NULL, from_stage_index INTEGER NOT NULL, previous_status INTEGER NOT NULL, previous_stage_index INTEGER NOT NULL, previous_error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, PRIMARY KEY (execution_id, sequence));",
        "CREATE INDEX IF NOT EXISTS execution_status_idx ON execution(status);"};

    for (const auto& sql : kBootstrapSql) {
        db.Exec(sql);
    }

    db.Exec(std::string("SELECT ") + kExecutionColumns + " FROM execution LIMIT 1;");
    db.Exec("SELECT execution_id,sequence,kind,from_stage_index,previous_status,previous_stage_index,previous_error,created_at_ms FROM execution_audit LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
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
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO execution(") + kExecutionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.execution_id);
    BindText(st, 2, r.container);
    BindText(st, 3, r.key);
    BindI32(st, 4, static_cast<int>(r.status));
    BindI32(st, 5, static_cast<int>(r.current_stage_index));
    BindText(st, 6, docflow::model::ToJson(r.payload));
    BindI32(st, 7, static_cast<int>(r.attempt));
    BindU64(st, 8, r.created_at_ms);
    BindU64(st, 9, r.updated_at_ms);
    BindText(st, 10, r.last_error);
    BindU64(st, 11, r.version);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result.code == ErrorCode::ConstraintViolation) {
        // primary key or (container, key) uniqueness
        return Result::Err(ErrorCode::AlreadyExists, result.message);
    }
    return result;
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kExecutionColumns + " FROM execution WHERE execution_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadExecution(st);
    sqlite3_finalize(st);
    return r;
}

std::optional<model::ExecutionRecord>
SqliteRepository::FindExecutionByDocument(Transaction& t, const std::string& container, const std::string& key) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kExecutionColumns + " FROM execution WHERE container=? AND object_key=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, container);
    BindText(st, 2, key);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadExecution(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::ExecutionRecord> SqliteRepository::ListExecutions(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kExecutionColumns + " FROM execution ORDER BY created_at_ms, execution_id;";

    std::vector<model::ExecutionRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadExecution(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE execution SET status=?,current_stage_index=?,payload_json=?,attempt=?,updated_at_ms=?,last_error=?,version=version+1 "
        "WHERE execution_id=? AND version=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindI32(st, 2, static_cast<int>(r.current_stage_index));
    BindText(st, 3, docflow::model::ToJson(r.payload));
    BindI32(st, 4, static_cast<int>(r.attempt));
    BindU64(st, 5, r.updated_at_ms);
    BindText(st, 6, r.last_error);
    BindText(st, 7, r.execution_id);
    BindU64(st, 8, r.version);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) return result;

    if (sqlite3_changes(db) == 0) {
        if (!GetExecution(t, r.execution_id)) {
            return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id);
        }
        return Result::Err(ErrorCode::Conflict, "stale version " + std::to_string(r.version));
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAuditEvent(Transaction& t, model::AuditEventRecord& event) {
    auto* db = TX(t).Handle();

    if (!GetExecution(t, event.execution_id)) {
        return Result::Err(ErrorCode::NotFound, "execution " + event.execution_id);
    }

    sqlite3_stmt* seq = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(sequence),0) FROM execution_audit WHERE execution_id=?;", -1, &seq, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(seq, 1, event.execution_id);
    int rc = sqlite3_step(seq);
    if (rc != SQLITE_ROW) {
        auto err = Translate(db, rc);
        sqlite3_finalize(seq);
        return err ? Result::Err(ErrorCode::InternalError, "audit sequence lookup returned no row") : err;
    }
    const uint64_t next = ColU64(seq, 0) + 1;
    sqlite3_finalize(seq);

    const char* sql =
        "INSERT INTO execution_audit(execution_id,sequence,kind,from_stage_index,previous_status,previous_stage_index,previous_error,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, event.execution_id);
    BindU64(st, 2, next);
    BindText(st, 3, event.kind);
    BindI32(st, 4, static_cast<int>(event.from_stage_index));
    BindI32(st, 5, static_cast<int>(event.previous_status));
    BindI32(st, 6, static_cast<int>(event.previous_stage_index));
    BindText(st, 7, event.previous_error);
    BindU64(st, 8, event.created_at_ms);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) event.sequence = next;
    return result;
}

std::vector<model::AuditEventRecord> SqliteRepository::ListAuditEvents(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT execution_id,sequence,kind,from_stage_index,previous_status,previous_stage_index,previous_error,created_at_ms "
        "FROM execution_audit WHERE execution_id=? ORDER BY sequence;";

    std::vector<model::AuditEventRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::AuditEventRecord e;
        e.execution_id         = ColText(st, 0);
        e.sequence             = ColU64(st, 1);
        e.kind                 = ColText(st, 2);
        e.from_stage_index     = static_cast<uint32_t>(ColI32(st, 3));
        e.previous_status      = static_cast<docflow::v1::ExecutionStatus>(ColI32(st, 4));
        e.previous_stage_index = static_cast<uint32_t>(ColI32(st, 5));
        e.previous_error       = ColText(st, 6);
        e.created_at_ms        = ColU64(st, 7);
        out.push_back(std::move(e));
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace docflow::db::sqlite
