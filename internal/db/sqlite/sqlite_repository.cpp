#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace stockcount::db::sqlite {

using stockcount::db::ErrorCode;
using stockcount::db::Result;

namespace {

// Tracks the applied version in PRAGMA user_version.
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
    explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

    int SchemaVersion() override {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db_.Handle(), "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
            sqlite3_finalize(st);
            throw util::StorageError(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
        }
        const int version = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
        sqlite3_finalize(st);
        return version;
    }

    void Apply(const sql::Migration& migration) override {
        std::scoped_lock lock(db_.WriterMutex());
        db_.Exec("BEGIN IMMEDIATE;");
        try {
            for (const auto& statement : migration.statements) {
                db_.Exec(statement);
            }
            db_.Exec("PRAGMA user_version = " + std::to_string(migration.version) + ";");
            db_.Exec("COMMIT;");
        } catch (const std::exception&) {
            db_.Exec("ROLLBACK;");
            throw;
        }
    }

private:
    SqliteDB& db_;
};

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(st_);
            st_ = nullptr;
            throw util::StorageError("sqlite prepare: " + msg);
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

private:
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
    return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

model::PendingUpdateRecord ReadPending(sqlite3_stmt* st) {
    model::PendingUpdateRecord r;
    r.id = ColText(st, 0);
    r.sequence = ColU64(st, 1);
    r.area_item_id = ColText(st, 2);
    r.session_id = ColText(st, 3);
    r.payload = ColBlob(st, 4);
    r.created_at_ms = ColU64(st, 5);
    r.attempts = ColU32(st, 6);
    return r;
}

model::PausedSessionRecord ReadPaused(sqlite3_stmt* st) {
    model::PausedSessionRecord r;
    r.area_id = ColText(st, 0);
    r.session_id = ColText(st, 1);
    r.snapshot = ColBlob(st, 2);
    r.paused_at_ms = ColU64(st, 3);
    r.return_location_id = ColText(st, 4);
    return r;
}

model::SessionArchiveRecord ReadArchive(sqlite3_stmt* st) {
    model::SessionArchiveRecord r;
    r.session_id = ColText(st, 0);
    r.area_id = ColText(st, 1);
    r.status = ColText(st, 2);
    r.started_at_ms = ColU64(st, 3);
    r.finished_at_ms = ColU64(st, 4);
    r.items_checked = ColU32(st, 5);
    r.items_skipped = ColU32(st, 6);
    r.items_total = ColU32(st, 7);
    r.critical_count = ColU32(st, 8);
    r.low_count = ColU32(st, 9);
    r.healthy_count = ColU32(st, 10);
    return r;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
    SqliteMigrationExecutor executor(db);
    sql::RunMigrations(executor, sql::SchemaMigrations());
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

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
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
// Pending updates
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingUpdate(Transaction& t, const model::PendingUpdateRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO pending_updates(id,sequence,area_item_id,session_id,payload,created_at_ms,attempts) "
        "VALUES(?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.id);
    BindU64(st.get(), 2, r.sequence);
    BindText(st.get(), 3, r.area_item_id);
    BindText(st.get(), 4, r.session_id);
    BindBlob(st.get(), 5, r.payload);
    BindU64(st.get(), 6, r.created_at_ms);
    BindU64(st.get(), 7, r.attempts);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdatePendingUpdate(Transaction& t, const model::PendingUpdateRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE pending_updates SET payload=?, attempts=?, created_at_ms=? WHERE id=?;");
    BindBlob(st.get(), 1, r.payload);
    BindU64(st.get(), 2, r.attempts);
    BindU64(st.get(), 3, r.created_at_ms);
    BindText(st.get(), 4, r.id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeletePendingUpdate(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM pending_updates WHERE id=?;");
    BindText(st.get(), 1, id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::vector<model::PendingUpdateRecord> SqliteRepository::ListPendingUpdates(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT id,sequence,area_item_id,session_id,payload,created_at_ms,attempts "
        "FROM pending_updates ORDER BY sequence ASC;");

    std::vector<model::PendingUpdateRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadPending(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Paused sessions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPausedSession(Transaction& t, const model::PausedSessionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO paused_sessions(area_id,session_id,snapshot,paused_at_ms,return_location_id) VALUES(?,?,?,?,?) "
        "ON CONFLICT(area_id) DO UPDATE SET session_id=excluded.session_id, snapshot=excluded.snapshot, "
        "paused_at_ms=excluded.paused_at_ms, return_location_id=excluded.return_location_id;");

    BindText(st.get(), 1, r.area_id);
    BindText(st.get(), 2, r.session_id);
    BindBlob(st.get(), 3, r.snapshot);
    BindU64(st.get(), 4, r.paused_at_ms);
    BindText(st.get(), 5, r.return_location_id);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PausedSessionRecord>
SqliteRepository::GetPausedSession(Transaction& t, const std::string& area_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT area_id,session_id,snapshot,paused_at_ms,return_location_id FROM paused_sessions WHERE area_id=?;");
    BindText(st.get(), 1, area_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadPaused(st.get());
}

std::vector<model::PausedSessionRecord> SqliteRepository::ListPausedSessions(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT area_id,session_id,snapshot,paused_at_ms,return_location_id FROM paused_sessions ORDER BY area_id;");

    std::vector<model::PausedSessionRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadPaused(st.get()));
    }
    return out;
}

Result SqliteRepository::DeletePausedSession(Transaction& t, const std::string& area_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM paused_sessions WHERE area_id=?;");
    BindText(st.get(), 1, area_id);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Offline item cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAreaCache(Transaction& t, const model::AreaCacheRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO area_item_cache(area_id,snapshot,fetched_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(area_id) DO UPDATE SET snapshot=excluded.snapshot, fetched_at_ms=excluded.fetched_at_ms;");

    BindText(st.get(), 1, r.area_id);
    BindBlob(st.get(), 2, r.snapshot);
    BindU64(st.get(), 3, r.fetched_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AreaCacheRecord> SqliteRepository::GetAreaCache(Transaction& t, const std::string& area_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT area_id,snapshot,fetched_at_ms FROM area_item_cache WHERE area_id=?;");
    BindText(st.get(), 1, area_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::AreaCacheRecord r;
    r.area_id = ColText(st.get(), 0);
    r.snapshot = ColBlob(st.get(), 1);
    r.fetched_at_ms = ColU64(st.get(), 2);
    return r;
}

// ------------------------------------------------------------------
// Alerts and history
// ------------------------------------------------------------------

Result SqliteRepository::InsertSessionAlert(Transaction& t, const model::SessionAlertRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO session_alerts(session_id,critical_count,title,body,alerted_at_ms) VALUES(?,?,?,?,?);");

    BindText(st.get(), 1, r.session_id);
    BindU64(st.get(), 2, r.critical_count);
    BindText(st.get(), 3, r.title);
    BindText(st.get(), 4, r.body);
    BindU64(st.get(), 5, r.alerted_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SessionAlertRecord>
SqliteRepository::GetSessionAlert(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT session_id,critical_count,title,body,alerted_at_ms FROM session_alerts WHERE session_id=?;");
    BindText(st.get(), 1, session_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::SessionAlertRecord r;
    r.session_id = ColText(st.get(), 0);
    r.critical_count = ColU32(st.get(), 1);
    r.title = ColText(st.get(), 2);
    r.body = ColText(st.get(), 3);
    r.alerted_at_ms = ColU64(st.get(), 4);
    return r;
}

Result SqliteRepository::InsertSessionArchive(Transaction& t, const model::SessionArchiveRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO session_archive(session_id,area_id,status,started_at_ms,finished_at_ms,items_checked,"
        "items_skipped,items_total,critical_count,low_count,healthy_count) VALUES(?,?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.session_id);
    BindText(st.get(), 2, r.area_id);
    BindText(st.get(), 3, r.status);
    BindU64(st.get(), 4, r.started_at_ms);
    BindU64(st.get(), 5, r.finished_at_ms);
    BindU64(st.get(), 6, r.items_checked);
    BindU64(st.get(), 7, r.items_skipped);
    BindU64(st.get(), 8, r.items_total);
    BindU64(st.get(), 9, r.critical_count);
    BindU64(st.get(), 10, r.low_count);
    BindU64(st.get(), 11, r.healthy_count);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SessionArchiveRecord>
SqliteRepository::ListSessionArchive(Transaction& t, const std::string& area_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT session_id,area_id,status,started_at_ms,finished_at_ms,items_checked,items_skipped,items_total,"
        "critical_count,low_count,healthy_count FROM session_archive WHERE area_id=? "
        "ORDER BY finished_at_ms DESC, rowid ASC;");
    BindText(st.get(), 1, area_id);

    std::vector<model::SessionArchiveRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadArchive(st.get()));
    }
    return out;
}

} // namespace stockcount::db::sqlite
