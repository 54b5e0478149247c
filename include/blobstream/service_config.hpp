#pragma once

#include "blobstream/core/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blobstream {

/// Configuration for the chunk store engine.
struct BackendConfig {
    std::string type;  // "lmdb", "local"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the blobstream daemon.
struct ServiceConfig {
    // HTTP listener
    std::string listen_address = constants::DEFAULT_LISTEN_ADDRESS;
    uint16_t port = constants::DEFAULT_SERVER_PORT;
    bool allow_ephemeral_port = false;  // port 0 binds any free port (tests)
    size_t storage_threads = constants::DEFAULT_STORAGE_THREADS;
    size_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    uint64_t max_upload_bytes = constants::DEFAULT_MAX_UPLOAD_BYTES;
    std::string public_url;  // Base for videoUrl; empty = derive from Host header
    std::string cors_origin = constants::DEFAULT_CORS_ORIGIN;  // empty disables CORS headers

    // Storage
    std::filesystem::path data_dir;
    BackendConfig chunk_store;           // Default: lmdb at <data_dir>/chunks
    std::filesystem::path record_db_path;  // Default: <data_dir>/records.db
    bool collect_orphans_on_start = true;

    // Blob layout
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    uint64_t serve_window = constants::DEFAULT_SERVE_WINDOW;
    std::string content_type = constants::DEFAULT_CONTENT_TYPE;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;
    size_t stats_interval_secs = constants::DEFAULT_STATS_INTERVAL_SECS;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECS;

    /// Parse configuration from the environment (PORT, BLOBSTREAM_DATA_DIR)
    /// and then command line arguments, which take precedence.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (chunk store, record database) based on data_dir.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace blobstream
