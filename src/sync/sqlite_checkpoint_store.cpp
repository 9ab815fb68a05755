#include "sync/sqlite_checkpoint_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <format>

namespace dbsync {

namespace {

constexpr const char* kSchemaSQL = R"SQL(
    CREATE TABLE IF NOT EXISTS sync_checkpoints (
        table_name     TEXT PRIMARY KEY,
        watermark      TEXT,
        last_row_id    TEXT,
        mode           TEXT NOT NULL,
        rows_processed INTEGER NOT NULL DEFAULT 0,
        rows_failed    INTEGER NOT NULL DEFAULT 0,
        status         TEXT NOT NULL,
        last_error     TEXT,
        updated_at     INTEGER NOT NULL
    );
)SQL";

constexpr const char* kUpsertSQL =
    "INSERT OR REPLACE INTO sync_checkpoints "
    "(table_name, watermark, last_row_id, mode, rows_processed, rows_failed, status, last_error, updated_at) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)";

constexpr const char* kSelectColumns =
    "SELECT table_name, watermark, last_row_id, mode, rows_processed, rows_failed, "
    "status, last_error, updated_at FROM sync_checkpoints";

// Result column indices for kSelectColumns
constexpr int COL_TABLE = 0;
constexpr int COL_WATERMARK = 1;
constexpr int COL_LAST_ROW_ID = 2;
constexpr int COL_MODE = 3;
constexpr int COL_ROWS_PROCESSED = 4;
constexpr int COL_ROWS_FAILED = 5;
constexpr int COL_STATUS = 6;
constexpr int COL_LAST_ERROR = 7;
constexpr int COL_UPDATED_AT = 8;

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    throw CheckpointError(std::format("{}: {}", what, db ? sqlite3_errmsg(db) : "no database handle"));
}

void exec(sqlite3* db, const char* sql, const std::string& what) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw CheckpointError(std::format("{}: {}", what, msg));
    }
}

StmtPtr prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        fail(db, "prepare checkpoint statement");
    }
    return StmtPtr(raw);
}

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    const int rc = value
        ? sqlite3_bind_text(stmt, index, value->c_str(), static_cast<int>(value->size()), SQLITE_TRANSIENT)
        : sqlite3_bind_null(stmt, index);
    if (rc != SQLITE_OK) fail(db, "bind checkpoint value");
}

std::optional<std::string> column_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return std::string(text ? text : "");
}

Checkpoint read_row(sqlite3_stmt* stmt) {
    Checkpoint cp(column_text(stmt, COL_TABLE).value_or(""));
    cp.watermark = column_text(stmt, COL_WATERMARK);
    cp.last_row_id = column_text(stmt, COL_LAST_ROW_ID);
    cp.mode = sync_mode_from_string(column_text(stmt, COL_MODE).value_or("")).value_or(SyncMode::FULL);
    cp.rows_processed = sqlite3_column_int64(stmt, COL_ROWS_PROCESSED);
    cp.rows_failed = sqlite3_column_int64(stmt, COL_ROWS_FAILED);
    cp.status = checkpoint_status_from_string(column_text(stmt, COL_STATUS).value_or(""))
        .value_or(CheckpointStatus::IDLE);
    cp.last_error = column_text(stmt, COL_LAST_ERROR);
    cp.updated_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(sqlite3_column_int64(stmt, COL_UPDATED_AT)));
    return cp;
}

} // namespace

void SqliteCheckpointStore::SqliteCloser::operator()(sqlite3* db) const {
    sqlite3_close(db);
}

SqliteCheckpointStore::SqliteCheckpointStore(std::string path, std::chrono::milliseconds busy_timeout)
    : path_(std::move(path)), busy_timeout_(busy_timeout) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw CheckpointError(std::format("cannot create {}: {}", parent.string(), ec.message()));
        }
    }

    auto db = open();
    exec(db.get(), "PRAGMA journal_mode=WAL", "enable WAL");
    exec(db.get(), kSchemaSQL, "create checkpoint schema");
    utils::log::info(std::format("Checkpoint store ready at {}", path_));
}

SqliteCheckpointStore::DbHandle SqliteCheckpointStore::open() const {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path_.c_str(), &raw,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        fail(raw, std::format("open checkpoint store {}", path_));
    }
    sqlite3_busy_timeout(db.get(), static_cast<int>(busy_timeout_.count()));
    exec(db.get(), "PRAGMA synchronous=FULL", "set synchronous mode");
    return db;
}

std::optional<Checkpoint> SqliteCheckpointStore::get(const std::string& table) {
    auto db = open();
    auto stmt = prepare(db.get(), std::string(kSelectColumns) + " WHERE table_name = ?1");
    bind_text(db.get(), stmt.get(), 1, table);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_row(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    fail(db.get(), std::format("read checkpoint for {}", table));
}

void SqliteCheckpointStore::set(const Checkpoint& cp) {
    auto db = open();
    auto stmt = prepare(db.get(), kUpsertSQL);
    const auto updated = cp.updated_at.time_since_epoch().count() == 0 ? utils::now() : cp.updated_at;

    bind_text(db.get(), stmt.get(), 1, cp.table);
    bind_text(db.get(), stmt.get(), 2, cp.watermark);
    bind_text(db.get(), stmt.get(), 3, cp.last_row_id);
    bind_text(db.get(), stmt.get(), 4, std::string(sync_mode_to_string(cp.mode)));
    if (sqlite3_bind_int64(stmt.get(), 5, cp.rows_processed) != SQLITE_OK ||
        sqlite3_bind_int64(stmt.get(), 6, cp.rows_failed) != SQLITE_OK) {
        fail(db.get(), "bind checkpoint counters");
    }
    bind_text(db.get(), stmt.get(), 7, std::string(checkpoint_status_to_string(cp.status)));
    bind_text(db.get(), stmt.get(), 8, cp.last_error);
    if (sqlite3_bind_int64(stmt.get(), 9, utils::to_epoch_ms(updated)) != SQLITE_OK) {
        fail(db.get(), "bind checkpoint time");
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail(db.get(), std::format("write checkpoint for {}", cp.table));
    }
}

std::vector<Checkpoint> SqliteCheckpointStore::get_all() {
    auto db = open();
    auto stmt = prepare(db.get(), std::string(kSelectColumns) + " ORDER BY table_name");

    std::vector<Checkpoint> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) fail(db.get(), "list checkpoints");
    return out;
}

void SqliteCheckpointStore::clear(const std::optional<std::string>& table) {
    auto db = open();
    if (!table) {
        exec(db.get(), "DELETE FROM sync_checkpoints", "clear checkpoints");
        utils::log::info("Cleared all checkpoints");
        return;
    }
    auto stmt = prepare(db.get(), "DELETE FROM sync_checkpoints WHERE table_name = ?1");
    bind_text(db.get(), stmt.get(), 1, *table);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail(db.get(), std::format("clear checkpoint for {}", *table));
    }
    utils::log::info(std::format("Cleared checkpoint for {}", *table));
}

} // namespace dbsync
