#include "blobstream/storage/backend.hpp"
#include "blobstream/core/constants.hpp"
#include "blobstream/core/log.hpp"

#include <lmdb.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <vector>

namespace blobstream {

namespace {

constexpr size_t NUM_SHARDS = 64;

// Slice [start, end) of an object of `size` bytes according to options.
// Returns false if the range start lies beyond the object.
bool resolve_range(const GetOptions& options, uint64_t size,
                   uint64_t& start, uint64_t& end) {
    start = options.range_start.value_or(0);
    end = std::min(options.range_end.value_or(size), size);
    if (start > size || (start == size && size > 0)) {
        return false;
    }
    if (end < start) end = start;
    return true;
}

}  // namespace

// ============================================================================
// LocalStorageBackend - File system implementation
// ============================================================================

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::filesystem::path& root)
        : root_(std::filesystem::absolute(root)) {
        std::filesystem::create_directories(root_);

        shards_.resize(NUM_SHARDS);
        for (size_t i = 0; i < NUM_SHARDS; ++i) {
            shards_[i] = std::make_unique<Shard>();
        }

        // Initialize counters by scanning (one-time cost at startup)
        reload_counters();
    }

    std::string type_name() const override { return "local"; }

    bool exists(const std::string& key) const override {
        auto& shard = get_shard(key);
        std::shared_lock lock(shard.mutex);
        std::error_code ec;
        return std::filesystem::exists(key_to_path(key), ec);
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto& shard = get_shard(key);
        std::shared_lock lock(shard.mutex);
        auto path = key_to_path(key);

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = size;
        auto ftime = std::filesystem::last_write_time(path, ec);
        if (!ec) {
            meta.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }
        return meta;
    }

    GetResult get(const std::string& key,
                  const GetOptions& options) const override {
        GetResult result;
        auto& shard = get_shard(key);
        std::shared_lock lock(shard.mutex);

        auto path = key_to_path(key);
        std::ifstream file(path, std::ios::binary | std::ios::ate);

        if (!file) {
            result.not_found = !std::filesystem::exists(path);
            result.error_message = "Object not found: " + key;
            return result;
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            result.error_message = "Cannot determine file size: " + key;
            return result;
        }
        uint64_t file_size = static_cast<uint64_t>(tellg_val);
        uint64_t start = 0;
        uint64_t end = 0;
        if (!resolve_range(options, file_size, start, end)) {
            result.error_message = "Range start beyond file size: " + key;
            return result;
        }

        uint64_t length = end - start;
        file.seekg(static_cast<std::streamoff>(start));
        result.data.resize(length);
        file.read(reinterpret_cast<char*>(result.data.data()),
                  static_cast<std::streamsize>(length));

        if (!file) {
            result.data.clear();
            result.error_message = "Failed to read file: " + key;
            return result;
        }

        result.success = true;
        result.metadata.size = file_size;
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;

        auto& shard = get_shard(key);
        std::unique_lock lock(shard.mutex);

        auto path = key_to_path(key);

        std::error_code ec;
        bool existed = std::filesystem::exists(path, ec);
        uint64_t old_size = 0;
        if (existed) {
            if (options.if_not_exists) {
                result.error_message = "Object already exists";
                return result;
            }
            old_size = std::filesystem::file_size(path, ec);
        }

        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            result.error_message = "Failed to create directory: " + ec.message();
            return result;
        }

        // Write to temp file then rename (atomic)
        auto temp_path = path.string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error_message = "Failed to create file";
                return result;
            }

            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                file.close();
                std::filesystem::remove(temp_path, ec);
                result.error_message = "Failed to write data";
                return result;
            }
        }

        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        if (existed) {
            total_bytes_.fetch_sub(old_size, std::memory_order_relaxed);
        } else {
            object_count_.fetch_add(1, std::memory_order_relaxed);
        }
        total_bytes_.fetch_add(data.size(), std::memory_order_relaxed);

        result.success = true;
        return result;
    }

    bool remove(const std::string& key) override {
        auto& shard = get_shard(key);
        std::unique_lock lock(shard.mutex);
        auto path = key_to_path(key);

        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) size = 0;

        bool removed = std::filesystem::remove(path, ec);
        if (removed) {
            object_count_.fetch_sub(1, std::memory_order_relaxed);
            total_bytes_.fetch_sub(size, std::memory_order_relaxed);

            // Drop now-empty parent directories up to the root
            auto dir = path.parent_path();
            while (dir != root_ && std::filesystem::is_empty(dir, ec) && !ec) {
                if (!std::filesystem::remove(dir, ec)) break;
                dir = dir.parent_path();
            }
        }
        return removed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        // Walk the deepest directory fully named by the prefix
        auto search_path = root_;
        auto slash = options.prefix.rfind('/');
        if (slash != std::string::npos) {
            search_path = root_ / options.prefix.substr(0, slash);
        }

        std::error_code ec;
        if (!std::filesystem::exists(search_path, ec)) {
            result.success = true;
            return result;
        }

        try {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(search_path)) {
                if (!entry.is_regular_file()) continue;

                auto key = std::filesystem::relative(entry.path(), root_).generic_string();
                if (key.find(".tmp.") != std::string::npos) continue;
                if (!key.starts_with(options.prefix)) continue;

                ListEntry le;
                le.key = std::move(key);
                le.size = entry.file_size();
                result.entries.push_back(std::move(le));
            }
        } catch (const std::exception& e) {
            result.error_message = e.what();
            return result;
        }

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });
        if (options.max_keys > 0 && result.entries.size() > options.max_keys) {
            result.entries.resize(options.max_keys);
            result.truncated = true;
        }

        result.success = true;
        return result;
    }

    uint64_t total_objects() const override {
        return object_count_.load(std::memory_order_relaxed);
    }

    uint64_t total_bytes() const override {
        return total_bytes_.load(std::memory_order_relaxed);
    }

    bool is_healthy() const override {
        std::error_code ec;
        return std::filesystem::is_directory(root_, ec);
    }

private:
    std::filesystem::path root_;

    struct Shard {
        mutable std::shared_mutex mutex;
    };
    mutable std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> object_count_{0};
    std::atomic<uint64_t> total_bytes_{0};

    Shard& get_shard(const std::string& key) const {
        size_t hash = std::hash<std::string>{}(key);
        return *shards_[hash % NUM_SHARDS];
    }

    std::filesystem::path key_to_path(const std::string& key) const {
        // Reject keys with ".." components or absolute paths
        if (key.empty() || key[0] == '/' || key.find("..") != std::string::npos) {
            throw std::invalid_argument("Invalid storage key: path traversal attempt detected");
        }
        return root_ / key;
    }

    void reload_counters() {
        uint64_t count = 0;
        uint64_t bytes = 0;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                ++count;
                bytes += it->file_size(ec);
            }
        }
        object_count_.store(count, std::memory_order_relaxed);
        total_bytes_.store(bytes, std::memory_order_relaxed);
    }
};

// ============================================================================
// LmdbStorageBackend - key-ordered store, one write transaction per put
// ============================================================================

class LmdbStorageBackend : public StorageBackend {
public:
    LmdbStorageBackend(const std::filesystem::path& env_path, uint64_t mapsize_bytes)
        : env_path_(env_path) {
        std::error_code ec;
        std::filesystem::create_directories(env_path_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create LMDB directory " + env_path_.string() +
                                     ": " + ec.message());
        }

        int rc = mdb_env_create(&env_);
        if (rc) {
            throw std::runtime_error(std::string("mdb_env_create: ") + mdb_strerror(rc));
        }

        rc = mdb_env_set_mapsize(env_, mapsize_bytes);
        if (rc) {
            mdb_env_close(env_);
            throw std::runtime_error(std::string("mdb_env_set_mapsize: ") + mdb_strerror(rc));
        }

        // MDB_NOTLS: read transactions are opened from storage worker threads
        rc = mdb_env_open(env_, env_path_.c_str(), MDB_NOTLS, 0664);
        if (rc) {
            mdb_env_close(env_);
            throw std::runtime_error("Cannot open chunk store at " + env_path_.string() +
                                     ": " + mdb_strerror(rc));
        }

        MDB_txn* txn = nullptr;
        rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc == 0) {
            rc = mdb_dbi_open(txn, nullptr, MDB_CREATE, &dbi_);
            if (rc == 0) {
                rc = mdb_txn_commit(txn);
            } else {
                mdb_txn_abort(txn);
            }
        }
        if (rc) {
            mdb_env_close(env_);
            throw std::runtime_error(std::string("mdb_dbi_open: ") + mdb_strerror(rc));
        }

        reload_counters();
    }

    ~LmdbStorageBackend() override {
        if (env_) {
            mdb_env_sync(env_, 1);
            mdb_env_close(env_);
        }
    }

    LmdbStorageBackend(const LmdbStorageBackend&) = delete;
    LmdbStorageBackend& operator=(const LmdbStorageBackend&) = delete;

    std::string type_name() const override { return "lmdb"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        ReadTxn txn(env_);
        if (!txn.ok()) return std::nullopt;

        MDB_val k = {key.size(), const_cast<char*>(key.data())};
        MDB_val v;
        if (mdb_get(txn.get(), dbi_, &k, &v) != 0) {
            return std::nullopt;
        }
        ObjectMetadata meta;
        meta.size = v.mv_size;
        return meta;
    }

    GetResult get(const std::string& key,
                  const GetOptions& options) const override {
        GetResult result;
        ReadTxn txn(env_);
        if (!txn.ok()) {
            result.error_message = std::string("mdb_txn_begin: ") + mdb_strerror(txn.rc());
            return result;
        }

        MDB_val k = {key.size(), const_cast<char*>(key.data())};
        MDB_val v;
        int rc = mdb_get(txn.get(), dbi_, &k, &v);
        if (rc == MDB_NOTFOUND) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }
        if (rc) {
            result.error_message = std::string("mdb_get: ") + mdb_strerror(rc);
            return result;
        }

        uint64_t start = 0;
        uint64_t end = 0;
        if (!resolve_range(options, v.mv_size, start, end)) {
            result.error_message = "Range start beyond object size: " + key;
            return result;
        }

        // Copy only the requested slice out of the memory map
        auto* bytes = static_cast<const uint8_t*>(v.mv_data);
        result.data.assign(bytes + start, bytes + end);
        result.metadata.size = v.mv_size;
        result.success = true;
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc) {
            result.error_message = std::string("mdb_txn_begin: ") + mdb_strerror(rc);
            return result;
        }

        MDB_val k = {key.size(), const_cast<char*>(key.data())};
        MDB_val old;
        uint64_t old_size = 0;
        bool existed = mdb_get(txn, dbi_, &k, &old) == 0;
        if (existed) {
            if (options.if_not_exists) {
                mdb_txn_abort(txn);
                result.error_message = "Object already exists";
                return result;
            }
            old_size = old.mv_size;
        }

        MDB_val v = {data.size(), const_cast<uint8_t*>(data.data())};
        rc = mdb_put(txn, dbi_, &k, &v, 0);
        if (rc) {
            mdb_txn_abort(txn);
            result.error_message = std::string("mdb_put: ") + mdb_strerror(rc);
            return result;
        }

        rc = mdb_txn_commit(txn);
        if (rc) {
            result.error_message = std::string("mdb_txn_commit: ") + mdb_strerror(rc);
            return result;
        }

        if (existed) {
            total_bytes_.fetch_sub(old_size, std::memory_order_relaxed);
        } else {
            object_count_.fetch_add(1, std::memory_order_relaxed);
        }
        total_bytes_.fetch_add(data.size(), std::memory_order_relaxed);

        result.success = true;
        return result;
    }

    bool remove(const std::string& key) override {
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc) {
            log_error("mdb_txn_begin: %s", mdb_strerror(rc));
            return false;
        }

        MDB_val k = {key.size(), const_cast<char*>(key.data())};
        MDB_val v;
        rc = mdb_get(txn, dbi_, &k, &v);
        if (rc) {
            mdb_txn_abort(txn);
            return false;
        }
        uint64_t size = v.mv_size;

        rc = mdb_del(txn, dbi_, &k, nullptr);
        if (rc) {
            mdb_txn_abort(txn);
            log_error("mdb_del %s: %s", key.c_str(), mdb_strerror(rc));
            return false;
        }
        rc = mdb_txn_commit(txn);
        if (rc) {
            log_error("mdb_txn_commit: %s", mdb_strerror(rc));
            return false;
        }

        object_count_.fetch_sub(1, std::memory_order_relaxed);
        total_bytes_.fetch_sub(size, std::memory_order_relaxed);
        return true;
    }

    // All keys removed in one write transaction
    std::vector<std::string> remove_batch(
        const std::vector<std::string>& keys) override {
        std::vector<std::string> failed;
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc) {
            log_error("mdb_txn_begin: %s", mdb_strerror(rc));
            return keys;
        }

        uint64_t removed_count = 0;
        uint64_t removed_bytes = 0;
        for (const auto& key : keys) {
            MDB_val k = {key.size(), const_cast<char*>(key.data())};
            MDB_val v;
            if (mdb_get(txn, dbi_, &k, &v) != 0) {
                failed.push_back(key);
                continue;
            }
            uint64_t size = v.mv_size;
            if (mdb_del(txn, dbi_, &k, nullptr) != 0) {
                failed.push_back(key);
                continue;
            }
            ++removed_count;
            removed_bytes += size;
        }

        rc = mdb_txn_commit(txn);
        if (rc) {
            log_error("mdb_txn_commit: %s", mdb_strerror(rc));
            return keys;
        }

        object_count_.fetch_sub(removed_count, std::memory_order_relaxed);
        total_bytes_.fetch_sub(removed_bytes, std::memory_order_relaxed);
        return failed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;
        ReadTxn txn(env_);
        if (!txn.ok()) {
            result.error_message = std::string("mdb_txn_begin: ") + mdb_strerror(txn.rc());
            return result;
        }

        MDB_cursor* cursor = nullptr;
        int rc = mdb_cursor_open(txn.get(), dbi_, &cursor);
        if (rc) {
            result.error_message = std::string("mdb_cursor_open: ") + mdb_strerror(rc);
            return result;
        }

        MDB_val k, v;
        if (options.prefix.empty()) {
            rc = mdb_cursor_get(cursor, &k, &v, MDB_FIRST);
        } else {
            k = {options.prefix.size(), const_cast<char*>(options.prefix.data())};
            rc = mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
        }
        while (rc == 0) {
            std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
            if (key.compare(0, options.prefix.size(), options.prefix) != 0) break;

            if (options.max_keys > 0 && result.entries.size() >= options.max_keys) {
                result.truncated = true;
                break;
            }
            result.entries.push_back({std::move(key), v.mv_size});
            rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
        }
        mdb_cursor_close(cursor);

        if (rc != 0 && rc != MDB_NOTFOUND) {
            result.entries.clear();
            result.error_message = std::string("mdb_cursor_get: ") + mdb_strerror(rc);
            return result;
        }

        result.success = true;
        return result;
    }

    uint64_t total_objects() const override {
        return object_count_.load(std::memory_order_relaxed);
    }

    uint64_t total_bytes() const override {
        return total_bytes_.load(std::memory_order_relaxed);
    }

    bool is_healthy() const override {
        MDB_envinfo info;
        return env_ != nullptr && mdb_env_info(env_, &info) == 0;
    }

private:
    // Read-only transaction aborted on scope exit
    class ReadTxn {
    public:
        explicit ReadTxn(MDB_env* env) {
            rc_ = mdb_txn_begin(env, nullptr, MDB_RDONLY, &txn_);
        }
        ~ReadTxn() {
            if (txn_) mdb_txn_abort(txn_);
        }
        ReadTxn(const ReadTxn&) = delete;
        ReadTxn& operator=(const ReadTxn&) = delete;

        bool ok() const { return rc_ == 0; }
        int rc() const { return rc_; }
        MDB_txn* get() const { return txn_; }

    private:
        MDB_txn* txn_ = nullptr;
        int rc_ = 0;
    };

    void reload_counters() {
        ReadTxn txn(env_);
        if (!txn.ok()) return;

        MDB_cursor* cursor = nullptr;
        if (mdb_cursor_open(txn.get(), dbi_, &cursor) != 0) return;

        uint64_t count = 0;
        uint64_t bytes = 0;
        MDB_val k, v;
        int rc = mdb_cursor_get(cursor, &k, &v, MDB_FIRST);
        while (rc == 0) {
            ++count;
            bytes += v.mv_size;
            rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
        }
        mdb_cursor_close(cursor);

        object_count_.store(count, std::memory_order_relaxed);
        total_bytes_.store(bytes, std::memory_order_relaxed);
    }

    std::filesystem::path env_path_;
    MDB_env* env_ = nullptr;
    MDB_dbi dbi_ = 0;

    std::atomic<uint64_t> object_count_{0};
    std::atomic<uint64_t> total_bytes_{0};
};

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    auto it = config.find("path");
    if (it == config.end() || it->second.empty()) {
        throw std::runtime_error("Chunk store '" + type + "' requires 'path' config");
    }
    std::filesystem::path path = it->second;

    if (type == "local") {
        return create_local(path);
    }

    if (type == "lmdb") {
        uint64_t mapsize_gb = constants::DEFAULT_LMDB_MAPSIZE_GB;
        if ((it = config.find("mapsize_gb")) != config.end()) {
            try {
                mapsize_gb = std::stoull(it->second);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid mapsize_gb: " + it->second);
            }
        }
        return create_lmdb(path, mapsize_gb * 1024ULL * 1024 * 1024);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(
    const std::filesystem::path& root_path) {
    return std::make_unique<LocalStorageBackend>(root_path);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_lmdb(
    const std::filesystem::path& env_path,
    uint64_t mapsize_bytes) {
    return std::make_unique<LmdbStorageBackend>(env_path, mapsize_bytes);
}

} // namespace blobstream
