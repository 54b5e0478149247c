#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobstream {

class BlobRecordStore;
class StorageBackend;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports blobstream metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically refreshes the gauges from the
/// record and chunk stores and serializes the registry with temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Sources for gauge snapshots (not owned, may be null).
    void set_record_store(BlobRecordStore* store) { store_ = store; }
    void set_chunk_store(const StorageBackend* backend) { backend_ = backend; }

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& chunk_reads_total() { return *chunk_reads_total_; }
    prometheus::Counter& deletes_success() { return *deletes_success_; }
    prometheus::Counter& deletes_failure() { return *deletes_failure_; }
    prometheus::Counter& replacements_content() { return *replacements_content_; }
    prometheus::Counter& replacements_metadata() { return *replacements_metadata_; }
    prometheus::Counter& orphans_collected() { return *orphans_collected_; }

    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& range_duration() { return *range_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    BlobRecordStore* store_ = nullptr;
    const StorageBackend* backend_ = nullptr;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* chunk_reads_total_;
    prometheus::Counter* deletes_success_;
    prometheus::Counter* deletes_failure_;
    prometheus::Counter* replacements_content_;
    prometheus::Counter* replacements_metadata_;
    prometheus::Counter* orphans_collected_;

    // --- Gauges ---
    prometheus::Gauge* blobs_;
    prometheus::Gauge* chunk_objects_;
    prometheus::Gauge* chunk_bytes_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* range_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace blobstream
