#include "blobstream/metrics.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/storage/backend.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobstream {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("blobstream_uploads_total")
        .Help("Total uploads attempted")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("blobstream_upload_bytes_total")
        .Help("Total bytes committed by uploads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("blobstream_downloads_total")
        .Help("Total range downloads")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("blobstream_download_bytes_total")
        .Help("Total bytes streamed to clients")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    chunk_reads_total_ = &prometheus::BuildCounter()
        .Name("blobstream_chunk_reads_total")
        .Help("Chunk objects fetched for range responses")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& deletes_family = prometheus::BuildCounter()
        .Name("blobstream_deletes_total")
        .Help("Total blob deletions")
        .Labels(labels)
        .Register(*registry_);
    deletes_success_ = &deletes_family.Add({{"result", "success"}});
    deletes_failure_ = &deletes_family.Add({{"result", "failure"}});

    auto& replacements_family = prometheus::BuildCounter()
        .Name("blobstream_replacements_total")
        .Help("Total blob updates")
        .Labels(labels)
        .Register(*registry_);
    replacements_content_ = &replacements_family.Add({{"kind", "content"}});
    replacements_metadata_ = &replacements_family.Add({{"kind", "metadata"}});

    orphans_collected_ = &prometheus::BuildCounter()
        .Name("blobstream_orphans_collected_total")
        .Help("Total unreferenced chunks removed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    blobs_ = &gauge_reg("blobstream_blobs", "Committed blob records");
    chunk_objects_ = &gauge_reg("blobstream_chunk_objects", "Objects in the chunk store");
    chunk_bytes_ = &gauge_reg("blobstream_chunk_bytes", "Bytes in the chunk store");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("blobstream_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    range_duration_ = &prometheus::BuildHistogram()
        .Name("blobstream_range_duration_seconds")
        .Help("Time to stream one range response in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (store_) {
        auto n = store_->count();
        if (n >= 0) blobs_->Set(static_cast<double>(n));
    }
    if (backend_) {
        chunk_objects_->Set(static_cast<double>(backend_->total_objects()));
        chunk_bytes_->Set(static_cast<double>(backend_->total_bytes()));
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("Cannot rename metrics file to %s: %s",
                  prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace blobstream
