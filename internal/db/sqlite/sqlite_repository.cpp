#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace analysis::db::sqlite {

using analysis::db::ErrorCode;
using analysis::db::Result;

void BootstrapSchema(SqliteDB& db) {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS broker_tasks ("
        "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
        "channel TEXT NOT NULL, "
        "task_id TEXT NOT NULL, "
        "task_name TEXT NOT NULL, "
        "routing_key TEXT NOT NULL DEFAULT '', "
        "envelope BLOB NOT NULL, "
        "state INTEGER NOT NULL, "
        "visible_at_ms INTEGER NOT NULL, "
        "lease_id TEXT NOT NULL DEFAULT '', "
        "lease_expires_at_ms INTEGER NOT NULL DEFAULT 0, "
        "delivery_count INTEGER NOT NULL DEFAULT 0, "
        "enqueued_at_ms INTEGER NOT NULL, "
        "UNIQUE(channel, task_id));");
    db.Exec("CREATE INDEX IF NOT EXISTS broker_tasks_channel_seq ON broker_tasks(channel, seq);");
    db.Exec(
        "CREATE TABLE IF NOT EXISTS backend_results ("
        "channel TEXT NOT NULL, "
        "task_id TEXT NOT NULL, "
        "task_name TEXT NOT NULL, "
        "status INTEGER NOT NULL, "
        "terminal INTEGER NOT NULL, "
        "record BLOB NOT NULL, "
        "completed_at_ms INTEGER NOT NULL, "
        "PRIMARY KEY(channel, task_id));");
}

static bool IsDuplicateKey(int rc) {
    return rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE;
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
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

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static constexpr const char* kTaskColumns =
    "seq,channel,task_id,task_name,routing_key,envelope,state,visible_at_ms,lease_id,lease_expires_at_ms,delivery_count,enqueued_at_ms";

static model::TaskRecord ReadTask(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.seq                 = ColU64(st, 0);
    r.channel             = ColText(st, 1);
    r.task_id             = ColText(st, 2);
    r.task_name           = ColText(st, 3);
    r.routing_key         = ColText(st, 4);
    r.envelope            = ColBlob(st, 5);
    r.state               = static_cast<model::TaskState>(ColI32(st, 6));
    r.visible_at_ms       = ColU64(st, 7);
    r.lease_id            = ColText(st, 8);
    r.lease_expires_at_ms = ColU64(st, 9);
    r.delivery_count      = static_cast<uint32_t>(ColI32(st, 10));
    r.enqueued_at_ms      = ColU64(st, 11);
    return r;
}

static model::ResultRow ReadResult(sqlite3_stmt* st) {
    model::ResultRow r;
    r.channel         = ColText(st, 0);
    r.task_id         = ColText(st, 1);
    r.task_name       = ColText(st, 2);
    r.status          = ColI32(st, 3);
    r.terminal        = ColI32(st, 4) != 0;
    r.record          = ColBlob(st, 5);
    r.completed_at_ms = ColU64(st, 6);
    return r;
}

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
        return Result::Ok();

    if (IsBusy(rc))
        return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));

    // connections run with extended result codes; classify on the primary code
    switch (rc & 0xff) {
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
// Broker tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO broker_tasks(channel,task_id,task_name,routing_key,envelope,state,visible_at_ms,"
        "lease_id,lease_expires_at_ms,delivery_count,enqueued_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.channel);
    BindText(st, 2, r.task_id);
    BindText(st, 3, r.task_name);
    BindText(st, 4, r.routing_key);
    BindBlob(st, 5, r.envelope);
    BindI32(st, 6, static_cast<int>(r.state));
    BindU64(st, 7, r.visible_at_ms);
    BindText(st, 8, r.lease_id);
    BindU64(st, 9, r.lease_expires_at_ms);
    BindI32(st, 10, static_cast<int>(r.delivery_count));
    BindU64(st, 11, r.enqueued_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (IsDuplicateKey(rc))
        return Result::Err(ErrorCode::AlreadyExists, r.task_id);
    if (rc == SQLITE_DONE)
        r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Translate(db, rc);
}

std::optional<model::TaskRecord>
SqliteRepository::GetTask(Transaction& t, const std::string& channel, const std::string& task_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM broker_tasks WHERE channel=? AND task_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, channel);
    BindText(st, 2, task_id);

    std::optional<model::TaskRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW)
        out = ReadTask(st);

    sqlite3_finalize(st);
    return out;
}

std::vector<model::TaskRecord>
SqliteRepository::ListTasks(Transaction& t, const std::string& channel) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM broker_tasks WHERE channel=? ORDER BY seq ASC;";

    std::vector<model::TaskRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, channel);
    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadTask(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE broker_tasks SET envelope=?,state=?,visible_at_ms=?,lease_id=?,lease_expires_at_ms=?,delivery_count=? "
        "WHERE channel=? AND task_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, r.envelope);
    BindI32(st, 2, static_cast<int>(r.state));
    BindU64(st, 3, r.visible_at_ms);
    BindText(st, 4, r.lease_id);
    BindU64(st, 5, r.lease_expires_at_ms);
    BindI32(st, 6, static_cast<int>(r.delivery_count));
    BindText(st, 7, r.channel);
    BindText(st, 8, r.task_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.task_id);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& channel, const std::string& task_id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM broker_tasks WHERE channel=? AND task_id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, channel);
    BindText(st, 2, task_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, task_id);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Backend results
// ------------------------------------------------------------------

Result SqliteRepository::InsertResult(Transaction& t, const model::ResultRow& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO backend_results(channel,task_id,task_name,status,terminal,record,completed_at_ms) VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.channel);
    BindText(st, 2, r.task_id);
    BindText(st, 3, r.task_name);
    BindI32(st, 4, r.status);
    BindI32(st, 5, r.terminal ? 1 : 0);
    BindBlob(st, 6, r.record);
    BindU64(st, 7, r.completed_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (IsDuplicateKey(rc))
        return Result::Err(ErrorCode::AlreadyExists, r.task_id);
    return Translate(db, rc);
}

Result SqliteRepository::UpdateResult(Transaction& t, const model::ResultRow& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE backend_results SET task_name=?,status=?,terminal=?,record=?,completed_at_ms=? WHERE channel=? AND task_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.task_name);
    BindI32(st, 2, r.status);
    BindI32(st, 3, r.terminal ? 1 : 0);
    BindBlob(st, 4, r.record);
    BindU64(st, 5, r.completed_at_ms);
    BindText(st, 6, r.channel);
    BindText(st, 7, r.task_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.task_id);
    return Translate(db, rc);
}

std::optional<model::ResultRow>
SqliteRepository::GetResult(Transaction& t, const std::string& channel, const std::string& task_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT channel,task_id,task_name,status,terminal,record,completed_at_ms FROM backend_results WHERE channel=? AND task_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, channel);
    BindText(st, 2, task_id);

    std::optional<model::ResultRow> out;
    if (sqlite3_step(st) == SQLITE_ROW)
        out = ReadResult(st);

    sqlite3_finalize(st);
    return out;
}

uint64_t SqliteRepository::CountResults(Transaction& t, const std::string& channel) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT COUNT(*) FROM backend_results WHERE channel=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindText(st, 1, channel);
    uint64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW)
        count = ColU64(st, 0);

    sqlite3_finalize(st);
    return count;
}

} // namespace analysis::db::sqlite
