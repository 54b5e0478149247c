#include "blobstream/download_streamer.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/metrics.hpp"

#include <stdexcept>
#include <vector>

namespace blobstream {

namespace {

DownloadPlan plan_error(BlobError error, std::string message) {
    DownloadPlan p;
    p.error = error;
    p.error_message = std::move(message);
    return p;
}

}  // namespace

DownloadStreamer::DownloadStreamer(BlobRecordStore& store, const ChunkCodec& codec,
                                   const RangeResolver& resolver, std::string content_type,
                                   MetricsExporter* metrics)
    : store_(store)
    , codec_(codec)
    , resolver_(resolver)
    , content_type_(std::move(content_type))
    , metrics_(metrics) {}

DownloadPlan DownloadStreamer::open(const std::string& id,
                                    const std::optional<std::string>& range_header) const {
    if (!range_header) {
        return plan_error(BlobError::Validation, "Requires Range header");
    }

    auto found = store_.get(id);
    if (!found.success) {
        return plan_error(found.error, found.error_message);
    }
    const auto& record = found.record;

    auto resolved = resolver_.resolve(*range_header, record.length);
    if (!resolved.success) {
        return plan_error(resolved.error, resolved.error_message);
    }

    DownloadPlan plan;
    try {
        plan.body = codec_.read(record.chunks, record.chunk_size,
                                resolved.range.start, resolved.range.end);
    } catch (const std::invalid_argument& e) {
        log_error("Record %s is inconsistent with its chunks: %s", id.c_str(), e.what());
        return plan_error(BlobError::StorageUnavailable, e.what());
    }

    plan.success = true;
    plan.opened_at = std::chrono::steady_clock::now();
    plan.blob_id = id;
    plan.range = resolved.range;
    plan.content_type = content_type_;
    log_debug("Range %s for %s (%llu bytes)", plan.range.content_range().c_str(), id.c_str(),
              static_cast<unsigned long long>(plan.range.content_length));
    return plan;
}

SliceStatus DownloadStreamer::next_slice(DownloadPlan& plan, std::vector<uint8_t>& slice) const {
    slice.clear();
    if (!plan.body) return SliceStatus::Failed;
    if (plan.body->next(slice)) {
        if (metrics_) metrics_->chunk_reads_total().Increment();
        return SliceStatus::Data;
    }
    if (plan.body->failed()) {
        log_error("Stream of %s aborted: %s", plan.blob_id.c_str(),
                  plan.body->error_message().c_str());
        return SliceStatus::Failed;
    }
    return SliceStatus::End;
}

void DownloadStreamer::finish(DownloadPlan& plan, bool success) const {
    if (!plan.body) return;
    uint64_t sent = plan.body->bytes_emitted();
    size_t chunks = plan.body->chunks_read();
    plan.body.reset();

    if (!success) {
        log_debug("Stream of %s stopped after %llu bytes (%zu chunks)", plan.blob_id.c_str(),
                  static_cast<unsigned long long>(sent), chunks);
    }
    if (!metrics_) return;
    auto elapsed = std::chrono::steady_clock::now() - plan.opened_at;
    metrics_->range_duration().Observe(std::chrono::duration<double>(elapsed).count());
    if (success) {
        metrics_->downloads_success().Increment();
    } else {
        metrics_->downloads_failure().Increment();
    }
    metrics_->download_bytes_total().Increment(static_cast<double>(sent));
}

StreamResult DownloadStreamer::stream(DownloadPlan& plan, const Sink& sink) const {
    StreamResult result;
    if (!plan.success || !plan.body) {
        result.error_message = "no stream to send";
        return result;
    }

    std::vector<uint8_t> slice;
    while (true) {
        auto status = next_slice(plan, slice);
        if (status == SliceStatus::End) break;
        if (status == SliceStatus::Failed) {
            result.error_message = plan.body->error_message();
            finish(plan, false);
            return result;
        }
        if (!sink(std::span<const uint8_t>(slice))) {
            result.cancelled = true;
            finish(plan, false);
            return result;
        }
        result.bytes_sent += slice.size();
    }

    finish(plan, true);
    result.success = true;
    return result;
}

}  // namespace blobstream
