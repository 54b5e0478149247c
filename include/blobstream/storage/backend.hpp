#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace blobstream {

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

// Result of a put operation
struct PutResult {
    bool success = false;
    std::string error_message;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    bool not_found = false;  // key absent, as opposed to an I/O failure
    std::vector<uint8_t> data;
    ObjectMetadata metadata;  // size is the full object size, not the range
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
};

// Result of a list operation
struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string error_message;
};

// Options for put operations
struct PutOptions {
    bool if_not_exists = false;  // Only write if key doesn't exist
};

// Options for get operations.
// range_end is exclusive; both default to the whole object.
struct GetOptions {
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;
};

// Options for list operations.
// Keys are returned in ascending byte order.
struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 0;  // 0 = unlimited
};

// Abstract interface for the chunk storage engine.
// Every put is atomic per key: readers see either the old value or the new one.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Check if a key exists
    virtual bool exists(const std::string& key) const = 0;

    // Get object metadata without reading content
    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    // Read object content (optionally a byte range of it)
    virtual GetResult get(const std::string& key,
                          const GetOptions& options = {}) const = 0;

    // Write object content
    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Delete an object. Returns false if it did not exist or could not be removed.
    virtual bool remove(const std::string& key) = 0;

    // Delete multiple objects, returns the keys that failed
    virtual std::vector<std::string> remove_batch(
        const std::vector<std::string>& keys) {
        std::vector<std::string> failed;
        for (const auto& key : keys) {
            if (!remove(key)) {
                failed.push_back(key);
            }
        }
        return failed;
    }

    // List objects with prefix
    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Statistics
    virtual uint64_t total_objects() const = 0;
    virtual uint64_t total_bytes() const = 0;

    // Health check
    virtual bool is_healthy() const = 0;
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Create a backend from a configuration map.
    // type: "lmdb" (params: path, mapsize_gb) or "local" (params: path).
    // Throws std::runtime_error for an unknown type, a missing path, or an
    // engine that cannot be opened.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    // Create a local filesystem backend
    static std::unique_ptr<StorageBackend> create_local(
        const std::filesystem::path& root_path);

    // Create an LMDB backend in the given environment directory
    static std::unique_ptr<StorageBackend> create_lmdb(
        const std::filesystem::path& env_path,
        uint64_t mapsize_bytes);
};

} // namespace blobstream
