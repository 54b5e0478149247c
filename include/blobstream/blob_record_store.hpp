#pragma once

#include "blobstream/blob_types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace blobstream {

/// SQLite-backed map from blob id to its record and ordered chunk references.
///
/// A record and its chunk list are always written and removed in one
/// transaction, so readers never observe a record with a partial chunk list.
class BlobRecordStore {
public:
    explicit BlobRecordStore(std::filesystem::path db_path);
    ~BlobRecordStore();

    BlobRecordStore(const BlobRecordStore&) = delete;
    BlobRecordStore& operator=(const BlobRecordStore&) = delete;

    /// Open (creating if needed) the database. Returns an error message, empty on success.
    std::string open();

    /// Insert a new record with its chunk list.
    StatusResult create(const BlobRecord& record);

    /// Load a record including its chunks. NotFound for unknown or malformed ids.
    RecordResult get(const std::string& id);

    /// All records (without chunk lists), oldest first.
    RecordListResult list();

    StatusResult update_title(const std::string& id, const std::string& title);

    /// Swap the content of `id` to `updated` (length, display name, content type,
    /// chunk size, version, chunk list and title) in one transaction.
    /// On success the result holds the record as it was before the swap.
    RecordResult replace_content(const std::string& id, const BlobRecord& updated);

    /// Delete the record and its chunk references. Returns the removed record.
    RecordResult remove(const std::string& id);

    /// Number of committed records, or -1 if the database is unreadable.
    int64_t count();

    const std::filesystem::path& path() const { return db_path_; }

private:
    RecordResult load_locked(const std::string& id, bool with_chunks);
    bool insert_chunks_locked(const std::string& id, const BlobRecord& record);
    std::string last_error() const;

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;

    sqlite3_stmt* stmt_insert_blob_ = nullptr;
    sqlite3_stmt* stmt_insert_chunk_ = nullptr;
    sqlite3_stmt* stmt_get_blob_ = nullptr;
    sqlite3_stmt* stmt_get_chunks_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_update_title_ = nullptr;
    sqlite3_stmt* stmt_update_content_ = nullptr;
    sqlite3_stmt* stmt_delete_blob_ = nullptr;
    sqlite3_stmt* stmt_delete_chunks_ = nullptr;
    sqlite3_stmt* stmt_count_ = nullptr;
};

}  // namespace blobstream
