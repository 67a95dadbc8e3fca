#include "nectar/db/batch_db.hpp"
#include <sqlite3.h>
#include <cstdlib>
#include <cstring>
#include <string>

#include "nectar/core/hex.hpp"
#include "nectar/core/log.hpp"

namespace nectar::db {

using namespace nectar::core;
using nectar::postage::Batch;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS batches (
            id BLOB PRIMARY KEY,
            value BLOB NOT NULL,
            owner BLOB NOT NULL,
            depth INTEGER NOT NULL,
            bucket_depth INTEGER NOT NULL,
            last_updated INTEGER NOT NULL,
            immutable INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS accountants (
            batch_id BLOB PRIMARY KEY,
            snapshot BLOB NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL";

    [[nodiscard]] Status db_error(int rc, StatusCode code = StatusCode::Io) noexcept {
        return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
    }

    [[nodiscard]] bool column_bytes(sqlite3_stmt* stmt, int col, u8* out, std::size_t len) noexcept {
        const void* blob = sqlite3_column_blob(stmt, col);
        if (blob == nullptr || static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)) != len) {
            return false;
        }
        std::memcpy(out, blob, len);
        return true;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Status SqliteBatchStore::open(const DbConfig& cfg, std::unique_ptr<SqliteBatchStore>* out) {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3* db = nullptr;
    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &db);
    if (rc != SQLITE_OK) {
        log_error("db", "open %s: %s", path, db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return db_error(rc);
    }

    // WAL by default; in-memory databases ignore it.
    char* err_msg = nullptr;
    const char* journal_mode = std::getenv("NECTAR_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    rc = sqlite3_exec(db, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_warn("db", "journal_mode=%s: %s", journal_mode, err_msg ? err_msg : "failed");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        log_warn("db", "synchronous=NORMAL: %s", sqlite3_errmsg(db));
    }

    rc = sqlite3_exec(db, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_error("db", "schema: %s", err_msg ? err_msg : "failed");
        sqlite3_free(err_msg);
        sqlite3_close(db);
        return db_error(rc);
    }

    out->reset(new SqliteBatchStore(db));
    return ok_status();
}

SqliteBatchStore::~SqliteBatchStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Batch records
// ============================================================================

Status SqliteBatchStore::get(const BatchId& id, Batch* out) {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT value, owner, depth, bucket_depth, last_updated, immutable "
                      "FROM batches WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_blob(stmt, 1, id.b.data(), static_cast<int>(id.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE ? make_status(StatusDomain::Db, StatusCode::NotFound) : db_error(rc);
    }

    Batch batch;
    batch.id = id;
    u8 value_be[32];
    const bool shape_ok = column_bytes(stmt, 0, value_be, sizeof(value_be))
        && column_bytes(stmt, 1, batch.owner.b.data(), batch.owner.b.size());
    const sqlite3_int64 depth = sqlite3_column_int64(stmt, 2);
    const sqlite3_int64 bucket_depth = sqlite3_column_int64(stmt, 3);
    batch.last_updated = static_cast<BlockNumber>(sqlite3_column_int64(stmt, 4));
    batch.immutable = sqlite3_column_int(stmt, 5) != 0;
    sqlite3_finalize(stmt);

    if (!shape_ok || depth < 0 || depth > 255 || bucket_depth < 0 || bucket_depth > 255) {
        log_error("db", "batch %s: malformed row", to_hex(id).c_str());
        return make_status(StatusDomain::Db, StatusCode::Corrupt);
    }
    batch.value = u256_from_be_bytes(value_be);
    batch.depth = static_cast<u8>(depth);
    batch.bucket_depth = static_cast<u8>(bucket_depth);

    *out = batch;
    return ok_status();
}

Status SqliteBatchStore::put(const Batch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "INSERT OR REPLACE INTO batches "
                      "(id, value, owner, depth, bucket_depth, last_updated, immutable) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    u8 value_be[32];
    u256_to_be_bytes(batch.value, value_be);

    sqlite3_bind_blob(stmt, 1, batch.id.b.data(), static_cast<int>(batch.id.b.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, value_be, static_cast<int>(sizeof(value_be)), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, batch.owner.b.data(), static_cast<int>(batch.owner.b.size()), SQLITE_STATIC);
    sqlite3_bind_int(stmt, 4, batch.depth);
    sqlite3_bind_int(stmt, 5, batch.bucket_depth);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(batch.last_updated));
    sqlite3_bind_int(stmt, 7, batch.immutable ? 1 : 0);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }
    return ok_status();
}

Status SqliteBatchStore::remove(const BatchId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM batches WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_blob(stmt, 1, id.b.data(), static_cast<int>(id.b.size()), SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }
    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status SqliteBatchStore::count(u64* out) {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM batches", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    return rc == SQLITE_ROW ? ok_status() : db_error(rc);
}

// ============================================================================
// Accountant snapshots
// ============================================================================

Status SqliteBatchStore::save_snapshot(const BatchId& id, const std::vector<u8>& snapshot, Timestamp updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "INSERT OR REPLACE INTO accountants (batch_id, snapshot, updated_at) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_blob(stmt, 1, id.b.data(), static_cast<int>(id.b.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, snapshot.data(), static_cast<int>(snapshot.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(updated_at));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }
    log_debug("db", "saved snapshot for %s (%zu bytes)", to_hex(id).c_str(), snapshot.size());
    return ok_status();
}

Status SqliteBatchStore::load_snapshot(const BatchId& id, std::vector<u8>* out) {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT snapshot FROM accountants WHERE batch_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_blob(stmt, 1, id.b.data(), static_cast<int>(id.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE ? make_status(StatusDomain::Db, StatusCode::NotFound) : db_error(rc);
    }

    const u8* blob = static_cast<const u8*>(sqlite3_column_blob(stmt, 0));
    const int len = sqlite3_column_bytes(stmt, 0);
    if (blob && len > 0) {
        out->assign(blob, blob + len);
    } else {
        out->clear();
    }
    sqlite3_finalize(stmt);
    return ok_status();
}

} // namespace nectar::db
