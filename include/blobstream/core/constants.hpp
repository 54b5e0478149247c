#pragma once

#include <cstddef>
#include <cstdint>

namespace blobstream::constants {

// Server defaults
constexpr uint16_t DEFAULT_SERVER_PORT = 5000;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_DATA_DIR = "/var/lib/blobstream";
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 30;
constexpr size_t DEFAULT_STORAGE_THREADS = 4;
constexpr size_t DEFAULT_MAX_UPLOAD_BYTES = 2ULL * 1024 * 1024 * 1024;  // 2GB
constexpr const char* DEFAULT_CORS_ORIGIN = "*";
constexpr size_t MAX_BUFFERED_BODY_BYTES = 1024 * 1024;     // non-upload requests
constexpr size_t UPLOAD_READ_BUFFER_BYTES = 64 * 1024;      // upload body piece size
constexpr size_t MAX_TITLE_BYTES = 64 * 1024;

// Blob layout
constexpr uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;        // 1MB
constexpr uint64_t DEFAULT_SERVE_WINDOW = 1000000;          // bytes per range response
constexpr const char* DEFAULT_CONTENT_TYPE = "video/mp4";

// Chunk store
constexpr const char* DEFAULT_CHUNK_BACKEND = "lmdb";
constexpr uint64_t DEFAULT_LMDB_MAPSIZE_GB = 64;
constexpr const char* CHUNK_KEY_PREFIX = "chunks/";
constexpr int CHUNK_SEQUENCE_DIGITS = 8;

// Identifiers
constexpr size_t BLOB_ID_BYTES = 12;          // 24 hex chars
constexpr size_t CONTENT_VERSION_BYTES = 8;   // 16 hex chars

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECS = 15;
constexpr size_t DEFAULT_STATS_INTERVAL_SECS = 60;

} // namespace blobstream::constants
