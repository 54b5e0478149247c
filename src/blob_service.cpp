#include "blobstream/blob_service.hpp"
#include "blobstream/blob_orchestrator.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/download_streamer.hpp"
#include "blobstream/http/http_server.hpp"
#include "blobstream/http/request_router.hpp"
#include "blobstream/metrics.hpp"
#include "blobstream/range_resolver.hpp"
#include "blobstream/storage/backend.hpp"
#include "blobstream/upload_pipeline.hpp"

#include <chrono>
#include <unistd.h>

namespace blobstream {

namespace {

std::string host_name() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
    return buf;
}

}  // namespace

std::unique_ptr<StorageBackend> BlobService::build_backend(const BackendConfig& cfg) {
    return StorageBackendFactory::create(cfg.type, cfg.params);
}

BlobService::BlobService(const ServiceConfig& config) : config_(config) {}

BlobService::~BlobService() {
    stop();
}

std::string BlobService::start() {
    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) return "Failed to create data_dir: " + ec.message();

    set_log_verbose(config_.verbose);

    if (!config_.metrics_file.empty()) {
        metrics_ = std::make_unique<MetricsExporter>(
            config_.metrics_file, std::chrono::seconds(config_.metrics_interval_secs),
            std::map<std::string, std::string>{{"instance", host_name()}});
    }

    try {
        chunk_store_ = build_backend(config_.chunk_store);
    } catch (const std::exception& e) {
        return std::string("Failed to open chunk store: ") + e.what();
    }

    records_ = std::make_unique<BlobRecordStore>(config_.record_db_path);
    err = records_->open();
    if (!err.empty()) return err;

    codec_ = std::make_unique<ChunkCodec>(*chunk_store_);
    resolver_ = std::make_unique<RangeResolver>(config_.serve_window);
    uploads_ = std::make_unique<UploadPipeline>(*records_, *codec_, config_.chunk_size,
                                                config_.content_type, metrics_.get());
    downloads_ = std::make_unique<DownloadStreamer>(*records_, *codec_, *resolver_,
                                                    config_.content_type, metrics_.get());
    orchestrator_ = std::make_unique<BlobOrchestrator>(*records_, *codec_, *uploads_,
                                                       metrics_.get());

    log_info("Stores open: %lld blobs, %llu chunk objects (%s)",
             static_cast<long long>(records_->count()),
             static_cast<unsigned long long>(chunk_store_->total_objects()),
             chunk_store_->type_name().c_str());

    // Nothing is in flight yet, so every unreferenced chunk is garbage.
    if (config_.collect_orphans_on_start) {
        auto report = orchestrator_->collect_orphans();
        orphans_collected_ += report.removed;
        if (!report.success) {
            log_error("Orphan collection incomplete: %s", report.error_message.c_str());
        }
    }

    http::RouterSettings router_settings;
    router_settings.public_url = config_.public_url;
    router_settings.cors_origin = config_.cors_origin;
    router_ = std::make_unique<http::RequestRouter>(*uploads_, *downloads_, *orchestrator_,
                                                    *records_, router_settings);

    http::ServerSettings server_settings;
    server_settings.address = config_.listen_address;
    server_settings.port = config_.port;
    server_settings.max_body_bytes = config_.max_upload_bytes;
    server_settings.request_timeout = std::chrono::seconds(config_.request_timeout_secs);
    server_settings.storage_threads = config_.storage_threads;
    server_ = std::make_unique<http::HttpServer>(*router_, *downloads_, server_settings);

    err = server_->start();
    if (!err.empty()) return err;

    running_ = true;

    if (metrics_) {
        metrics_->set_record_store(records_.get());
        metrics_->set_chunk_store(chunk_store_.get());
        metrics_->start();
    }

    if (config_.stats_interval_secs > 0) {
        stats_thread_ = std::thread(&BlobService::stats_reporter_loop, this);
    }

    return {};
}

void BlobService::stop() {
    if (!running_.exchange(false)) return;

    log_info("Shutting down...");

    if (server_) server_->stop();
    if (stats_thread_.joinable()) stats_thread_.join();
    if (metrics_) {
        metrics_->stop();
        metrics_->set_record_store(nullptr);
        metrics_->set_chunk_store(nullptr);
    }

    {
        std::lock_guard lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    log_info("Service stopped");
}

void BlobService::wait() {
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return !running_.load(); });
}

uint16_t BlobService::port() const {
    return server_ ? server_->port() : 0;
}

BlobService::Stats BlobService::get_stats() {
    Stats s;
    if (records_) s.blobs = records_->count();
    if (chunk_store_) {
        s.chunk_objects = chunk_store_->total_objects();
        s.chunk_bytes = chunk_store_->total_bytes();
    }
    s.orphans_collected = orphans_collected_.load();
    return s;
}

void BlobService::stats_reporter_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        for (size_t i = 0; i < config_.stats_interval_secs && running_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running_.load()) break;

        auto s = get_stats();
        double chunk_gb = static_cast<double>(s.chunk_bytes) / (1024.0 * 1024 * 1024);
        log_info("[stats] blobs: %lld | chunks: %llu objects, %.2f GB | orphans collected: %llu",
                 static_cast<long long>(s.blobs),
                 static_cast<unsigned long long>(s.chunk_objects), chunk_gb,
                 static_cast<unsigned long long>(s.orphans_collected));
    }
}

}  // namespace blobstream
