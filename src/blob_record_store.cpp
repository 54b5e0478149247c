#include "blobstream/blob_record_store.hpp"
#include "blobstream/core/log.hpp"

#include <chrono>
#include <sqlite3.h>
#include <thread>

namespace blobstream {

namespace {

constexpr const char* RECORD_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS blobs (
    id TEXT PRIMARY KEY,
    display_name TEXT NOT NULL,
    title TEXT NOT NULL,
    length INTEGER NOT NULL,
    content_type TEXT NOT NULL,
    chunk_size INTEGER NOT NULL,
    content_version TEXT NOT NULL,
    created_at INTEGER NOT NULL
) WITHOUT ROWID;

CREATE TABLE IF NOT EXISTS blob_chunks (
    blob_id TEXT NOT NULL,
    seq INTEGER NOT NULL,
    storage_key TEXT NOT NULL,
    size INTEGER NOT NULL,
    PRIMARY KEY (blob_id, seq)
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_blobs_created ON blobs(created_at, id);
)";

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_string(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

// Resets the statement and clears its bindings when the scope ends
class StmtGuard {
public:
    explicit StmtGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StmtGuard() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;

private:
    sqlite3_stmt* stmt_;
};

StatusResult status_error(BlobError error, std::string message) {
    StatusResult r;
    r.error = error;
    r.error_message = std::move(message);
    return r;
}

RecordResult record_error(BlobError error, std::string message) {
    RecordResult r;
    r.error = error;
    r.error_message = std::move(message);
    return r;
}

}  // namespace

BlobRecordStore::BlobRecordStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

BlobRecordStore::~BlobRecordStore() {
    if (stmt_insert_blob_) sqlite3_finalize(stmt_insert_blob_);
    if (stmt_insert_chunk_) sqlite3_finalize(stmt_insert_chunk_);
    if (stmt_get_blob_) sqlite3_finalize(stmt_get_blob_);
    if (stmt_get_chunks_) sqlite3_finalize(stmt_get_chunks_);
    if (stmt_list_) sqlite3_finalize(stmt_list_);
    if (stmt_update_title_) sqlite3_finalize(stmt_update_title_);
    if (stmt_update_content_) sqlite3_finalize(stmt_update_content_);
    if (stmt_delete_blob_) sqlite3_finalize(stmt_delete_blob_);
    if (stmt_delete_chunks_) sqlite3_finalize(stmt_delete_chunks_);
    if (stmt_count_) sqlite3_finalize(stmt_count_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::string BlobRecordStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

std::string BlobRecordStore::open() {
    std::lock_guard lock(db_mutex_);
    if (db_) return "";

    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            return "Cannot create " + db_path_.parent_path().string() + ": " + ec.message();
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = "Cannot open record database " + db_path_.string() + ": " + last_error();
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, RECORD_SCHEMA)) {
        return "Cannot create record schema: " + last_error();
    }

    struct {
        sqlite3_stmt** stmt;
        const char* sql;
    } statements[] = {
        {&stmt_insert_blob_,
         "INSERT INTO blobs (id, display_name, title, length, content_type, chunk_size, "
         "content_version, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)"},
        {&stmt_insert_chunk_,
         "INSERT INTO blob_chunks (blob_id, seq, storage_key, size) VALUES (?1, ?2, ?3, ?4)"},
        {&stmt_get_blob_,
         "SELECT id, display_name, title, length, content_type, chunk_size, content_version, "
         "created_at FROM blobs WHERE id = ?1"},
        {&stmt_get_chunks_,
         "SELECT seq, storage_key, size FROM blob_chunks WHERE blob_id = ?1 ORDER BY seq ASC"},
        {&stmt_list_,
         "SELECT id, display_name, title, length, content_type, chunk_size, content_version, "
         "created_at FROM blobs ORDER BY created_at ASC, id ASC"},
        {&stmt_update_title_,
         "UPDATE blobs SET title = ?2 WHERE id = ?1"},
        {&stmt_update_content_,
         "UPDATE blobs SET display_name = ?2, title = ?3, length = ?4, content_type = ?5, "
         "chunk_size = ?6, content_version = ?7 WHERE id = ?1"},
        {&stmt_delete_blob_,
         "DELETE FROM blobs WHERE id = ?1"},
        {&stmt_delete_chunks_,
         "DELETE FROM blob_chunks WHERE blob_id = ?1"},
        {&stmt_count_,
         "SELECT COUNT(*) FROM blobs"},
    };

    for (auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            return "Cannot prepare statement: " + last_error();
        }
    }

    log_debug("Record store open at %s", db_path_.c_str());
    return "";
}

bool BlobRecordStore::insert_chunks_locked(const std::string& id, const BlobRecord& record) {
    for (const auto& chunk : record.chunks) {
        StmtGuard guard(stmt_insert_chunk_);
        bind_string(stmt_insert_chunk_, 1, id);
        sqlite3_bind_int64(stmt_insert_chunk_, 2, chunk.sequence);
        bind_string(stmt_insert_chunk_, 3, chunk.storage_key);
        sqlite3_bind_int64(stmt_insert_chunk_, 4, static_cast<int64_t>(chunk.size));
        if (sql_step_retry(stmt_insert_chunk_) != SQLITE_DONE) {
            return false;
        }
    }
    return true;
}

RecordResult BlobRecordStore::load_locked(const std::string& id, bool with_chunks) {
    RecordResult result;
    {
        StmtGuard guard(stmt_get_blob_);
        bind_string(stmt_get_blob_, 1, id);
        int rc = sql_step_retry(stmt_get_blob_);
        if (rc == SQLITE_DONE) {
            return record_error(BlobError::NotFound, "Video not found");
        }
        if (rc != SQLITE_ROW) {
            return record_error(BlobError::StorageUnavailable, "Record lookup failed: " + last_error());
        }

        auto& r = result.record;
        r.id = column_string(stmt_get_blob_, 0);
        r.display_name = column_string(stmt_get_blob_, 1);
        r.title = column_string(stmt_get_blob_, 2);
        r.length = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_blob_, 3));
        r.content_type = column_string(stmt_get_blob_, 4);
        r.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_blob_, 5));
        r.content_version = column_string(stmt_get_blob_, 6);
        r.created_at = from_epoch_ms(sqlite3_column_int64(stmt_get_blob_, 7));
    }

    if (with_chunks) {
        StmtGuard guard(stmt_get_chunks_);
        bind_string(stmt_get_chunks_, 1, id);
        int rc;
        while ((rc = sql_step_retry(stmt_get_chunks_)) == SQLITE_ROW) {
            ChunkRef c;
            c.sequence = static_cast<uint32_t>(sqlite3_column_int64(stmt_get_chunks_, 0));
            c.storage_key = column_string(stmt_get_chunks_, 1);
            c.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_chunks_, 2));
            result.record.chunks.push_back(std::move(c));
        }
        if (rc != SQLITE_DONE) {
            return record_error(BlobError::StorageUnavailable, "Chunk lookup failed: " + last_error());
        }
    }

    result.success = true;
    return result;
}

StatusResult BlobRecordStore::create(const BlobRecord& record) {
    if (!is_valid_blob_id(record.id)) {
        return status_error(BlobError::Validation, "Invalid blob id: " + record.id);
    }

    std::lock_guard lock(db_mutex_);
    if (!db_) return status_error(BlobError::StorageUnavailable, "Record store not open");

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        return status_error(BlobError::StorageUnavailable, "Cannot begin transaction: " + last_error());
    }

    int rc;
    {
        StmtGuard guard(stmt_insert_blob_);
        bind_string(stmt_insert_blob_, 1, record.id);
        bind_string(stmt_insert_blob_, 2, record.display_name);
        bind_string(stmt_insert_blob_, 3, record.title);
        sqlite3_bind_int64(stmt_insert_blob_, 4, static_cast<int64_t>(record.length));
        bind_string(stmt_insert_blob_, 5, record.content_type);
        sqlite3_bind_int64(stmt_insert_blob_, 6, static_cast<int64_t>(record.chunk_size));
        bind_string(stmt_insert_blob_, 7, record.content_version);
        sqlite3_bind_int64(stmt_insert_blob_, 8, to_epoch_ms(record.created_at));
        rc = sql_step_retry(stmt_insert_blob_);
    }

    if (rc != SQLITE_DONE || !insert_chunks_locked(record.id, record)) {
        std::string err = last_error();
        sql_exec(db_, "ROLLBACK");
        if (rc == SQLITE_CONSTRAINT) {
            return status_error(BlobError::Validation, "Blob id already exists: " + record.id);
        }
        return status_error(BlobError::StorageUnavailable, "Cannot insert record: " + err);
    }

    if (!sql_exec(db_, "COMMIT")) {
        std::string err = last_error();
        sql_exec(db_, "ROLLBACK");
        return status_error(BlobError::StorageUnavailable, "Cannot commit record: " + err);
    }

    StatusResult ok;
    ok.success = true;
    return ok;
}

RecordResult BlobRecordStore::get(const std::string& id) {
    if (!is_valid_blob_id(id)) {
        return record_error(BlobError::NotFound, "Video not found");
    }
    std::lock_guard lock(db_mutex_);
    if (!db_) return record_error(BlobError::StorageUnavailable, "Record store not open");
    return load_locked(id, true);
}

RecordListResult BlobRecordStore::list() {
    RecordListResult result;
    std::lock_guard lock(db_mutex_);
    if (!db_) {
        result.error = BlobError::StorageUnavailable;
        result.error_message = "Record store not open";
        return result;
    }

    StmtGuard guard(stmt_list_);
    int rc;
    while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
        BlobRecord r;
        r.id = column_string(stmt_list_, 0);
        r.display_name = column_string(stmt_list_, 1);
        r.title = column_string(stmt_list_, 2);
        r.length = static_cast<uint64_t>(sqlite3_column_int64(stmt_list_, 3));
        r.content_type = column_string(stmt_list_, 4);
        r.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt_list_, 5));
        r.content_version = column_string(stmt_list_, 6);
        r.created_at = from_epoch_ms(sqlite3_column_int64(stmt_list_, 7));
        result.records.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        result.records.clear();
        result.error = BlobError::StorageUnavailable;
        result.error_message = "Record listing failed: " + last_error();
        return result;
    }

    result.success = true;
    return result;
}

StatusResult BlobRecordStore::update_title(const std::string& id, const std::string& title) {
    if (!is_valid_blob_id(id)) {
        return status_error(BlobError::NotFound, "Video not found");
    }
    std::lock_guard lock(db_mutex_);
    if (!db_) return status_error(BlobError::StorageUnavailable, "Record store not open");

    StmtGuard guard(stmt_update_title_);
    bind_string(stmt_update_title_, 1, id);
    bind_string(stmt_update_title_, 2, title);
    if (sql_step_retry(stmt_update_title_) != SQLITE_DONE) {
        return status_error(BlobError::StorageUnavailable, "Cannot update title: " + last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return status_error(BlobError::NotFound, "Video not found");
    }

    StatusResult ok;
    ok.success = true;
    return ok;
}

RecordResult BlobRecordStore::replace_content(const std::string& id, const BlobRecord& updated) {
    if (!is_valid_blob_id(id)) {
        return record_error(BlobError::NotFound, "Video not found");
    }
    std::lock_guard lock(db_mutex_);
    if (!db_) return record_error(BlobError::StorageUnavailable, "Record store not open");

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        return record_error(BlobError::StorageUnavailable, "Cannot begin transaction: " + last_error());
    }

    auto previous = load_locked(id, true);
    if (!previous.success) {
        sql_exec(db_, "ROLLBACK");
        return previous;
    }

    bool ok;
    {
        StmtGuard guard(stmt_update_content_);
        bind_string(stmt_update_content_, 1, id);
        bind_string(stmt_update_content_, 2, updated.display_name);
        bind_string(stmt_update_content_, 3, updated.title);
        sqlite3_bind_int64(stmt_update_content_, 4, static_cast<int64_t>(updated.length));
        bind_string(stmt_update_content_, 5, updated.content_type);
        sqlite3_bind_int64(stmt_update_content_, 6, static_cast<int64_t>(updated.chunk_size));
        bind_string(stmt_update_content_, 7, updated.content_version);
        ok = sql_step_retry(stmt_update_content_) == SQLITE_DONE;
    }
    if (ok) {
        StmtGuard guard(stmt_delete_chunks_);
        bind_string(stmt_delete_chunks_, 1, id);
        ok = sql_step_retry(stmt_delete_chunks_) == SQLITE_DONE;
    }
    ok = ok && insert_chunks_locked(id, updated);

    if (!ok || !sql_exec(db_, "COMMIT")) {
        std::string err = last_error();
        sql_exec(db_, "ROLLBACK");
        return record_error(BlobError::StorageUnavailable, "Cannot swap content: " + err);
    }

    return previous;
}

RecordResult BlobRecordStore::remove(const std::string& id) {
    if (!is_valid_blob_id(id)) {
        return record_error(BlobError::NotFound, "Video not found");
    }
    std::lock_guard lock(db_mutex_);
    if (!db_) return record_error(BlobError::StorageUnavailable, "Record store not open");

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        return record_error(BlobError::StorageUnavailable, "Cannot begin transaction: " + last_error());
    }

    auto removed = load_locked(id, true);
    if (!removed.success) {
        sql_exec(db_, "ROLLBACK");
        return removed;
    }

    bool ok;
    {
        StmtGuard guard(stmt_delete_chunks_);
        bind_string(stmt_delete_chunks_, 1, id);
        ok = sql_step_retry(stmt_delete_chunks_) == SQLITE_DONE;
    }
    if (ok) {
        StmtGuard guard(stmt_delete_blob_);
        bind_string(stmt_delete_blob_, 1, id);
        ok = sql_step_retry(stmt_delete_blob_) == SQLITE_DONE;
    }

    if (!ok || !sql_exec(db_, "COMMIT")) {
        std::string err = last_error();
        sql_exec(db_, "ROLLBACK");
        return record_error(BlobError::StorageUnavailable, "Cannot delete record: " + err);
    }

    return removed;
}

int64_t BlobRecordStore::count() {
    std::lock_guard lock(db_mutex_);
    if (!db_) return -1;
    StmtGuard guard(stmt_count_);
    if (sql_step_retry(stmt_count_) != SQLITE_ROW) return -1;
    return sqlite3_column_int64(stmt_count_, 0);
}

}  // namespace blobstream
