#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace blobstream {

/// Failure categories surfaced by every blob operation.
/// The HTTP layer maps them to 400 / 404 / 500.
enum class BlobError {
    None,
    Validation,          // missing or malformed input
    NotFound,            // id does not name a live record
    StorageUnavailable   // record or chunk store unreachable / I/O failure
};

const char* blob_error_name(BlobError error);

/// Reference to one persisted chunk. Sequence order is byte order.
struct ChunkRef {
    uint32_t sequence = 0;
    std::string storage_key;
    uint64_t size = 0;
};

/// Metadata for one committed blob plus its ordered chunk references.
struct BlobRecord {
    std::string id;
    std::string display_name;     // original filename, immutable
    std::string title;            // mutable label
    uint64_t length = 0;
    std::string content_type;
    uint64_t chunk_size = 0;
    std::string content_version;  // token embedded in chunk keys
    std::chrono::system_clock::time_point created_at;
    std::vector<ChunkRef> chunks;  // empty when loaded by list()
};

struct RecordResult {
    bool success = false;
    BlobRecord record;
    BlobError error = BlobError::None;
    std::string error_message;
};

struct RecordListResult {
    bool success = false;
    std::vector<BlobRecord> records;
    BlobError error = BlobError::None;
    std::string error_message;
};

struct StatusResult {
    bool success = false;
    BlobError error = BlobError::None;
    std::string error_message;
};

/// New random blob id: 24 lowercase hex characters.
/// Throws std::runtime_error if the system RNG fails.
std::string generate_blob_id();

/// New random content version token: 16 lowercase hex characters.
std::string generate_content_version();

/// True if `id` has the shape generate_blob_id() produces.
bool is_valid_blob_id(const std::string& id);

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Sum of chunk sizes; equals BlobRecord::length for a committed record.
uint64_t total_chunk_bytes(const std::vector<ChunkRef>& chunks);

}  // namespace blobstream
