#pragma once

#include "blobstream/service_config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace blobstream {

class BlobOrchestrator;
class BlobRecordStore;
class ChunkCodec;
class DownloadStreamer;
class MetricsExporter;
class RangeResolver;
class StorageBackend;
class UploadPipeline;

namespace http {
class HttpServer;
class RequestRouter;
}  // namespace http

/// The blob streaming service.
///
/// Owns the chunk store, the record store, the upload/download/orchestration
/// components wired on top of them, the HTTP server and the metrics exporter.
class BlobService {
public:
    explicit BlobService(const ServiceConfig& config);
    ~BlobService();

    BlobService(const BlobService&) = delete;
    BlobService& operator=(const BlobService&) = delete;

    /// Open the stores, collect orphans, start the HTTP listener.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop accepting requests, join workers, flush metrics.
    void stop();

    /// Block until stop() is called (for daemon mode).
    void wait();

    /// Bound HTTP port (valid after start()).
    uint16_t port() const;

    struct Stats {
        int64_t blobs = 0;
        uint64_t chunk_objects = 0;
        uint64_t chunk_bytes = 0;
        uint64_t orphans_collected = 0;
    };
    Stats get_stats();

    // Components, valid after start()
    BlobRecordStore& records() { return *records_; }
    StorageBackend& chunk_store() { return *chunk_store_; }
    UploadPipeline& uploads() { return *uploads_; }
    DownloadStreamer& downloads() { return *downloads_; }
    BlobOrchestrator& orchestrator() { return *orchestrator_; }
    MetricsExporter* metrics() { return metrics_.get(); }  // null when disabled

private:
    void stats_reporter_loop();

    static std::unique_ptr<StorageBackend> build_backend(const BackendConfig& cfg);

    ServiceConfig config_;

    std::unique_ptr<MetricsExporter> metrics_;
    std::unique_ptr<StorageBackend> chunk_store_;
    std::unique_ptr<BlobRecordStore> records_;
    std::unique_ptr<ChunkCodec> codec_;
    std::unique_ptr<RangeResolver> resolver_;
    std::unique_ptr<UploadPipeline> uploads_;
    std::unique_ptr<DownloadStreamer> downloads_;
    std::unique_ptr<BlobOrchestrator> orchestrator_;
    std::unique_ptr<http::RequestRouter> router_;
    std::unique_ptr<http::HttpServer> server_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> orphans_collected_{0};

    std::thread stats_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace blobstream
