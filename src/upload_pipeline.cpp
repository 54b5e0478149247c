#include "blobstream/upload_pipeline.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/metrics.hpp"

#include <stdexcept>

namespace blobstream {

namespace {

UploadResult upload_error(BlobError error, std::string message) {
    UploadResult r;
    r.error = error;
    r.error_message = std::move(message);
    return r;
}

}  // namespace

UploadPipeline::UploadPipeline(BlobRecordStore& store, ChunkCodec& codec, uint64_t chunk_size,
                               std::string default_content_type, MetricsExporter* metrics)
    : store_(store)
    , codec_(codec)
    , chunk_size_(chunk_size)
    , default_content_type_(std::move(default_content_type))
    , metrics_(metrics) {}

std::unique_ptr<PendingUpload> UploadPipeline::begin(const std::string& id, std::string& error) {
    std::string blob_id = id;
    std::string version;
    try {
        if (blob_id.empty()) blob_id = generate_blob_id();
        version = generate_content_version();
    } catch (const std::runtime_error& e) {
        if (metrics_) metrics_->uploads_failure().Increment();
        error = e.what();
        return nullptr;
    }

    auto pending = std::make_unique<PendingUpload>();
    if (metrics_) pending->timer.emplace(metrics_->upload_duration());
    pending->writer = codec_.open_writer(blob_id, version, chunk_size_);
    return pending;
}

UploadResult UploadPipeline::fail(PendingUpload& pending, BlobError error, std::string message) {
    pending.writer->discard();
    if (metrics_) metrics_->uploads_failure().Increment();
    return upload_error(error, std::move(message));
}

void UploadPipeline::abandon(PendingUpload& pending, const std::string& reason) {
    auto& writer = *pending.writer;
    log_info("Upload %s abandoned after %llu bytes: %s", writer.blob_id().c_str(),
             static_cast<unsigned long long>(writer.bytes_written()), reason.c_str());
    fail(pending, BlobError::Validation, reason);
}

UploadResult UploadPipeline::commit(PendingUpload& pending, const UploadRequest& request) {
    auto& writer = *pending.writer;
    if (request.title.empty()) {
        return fail(pending, BlobError::Validation, "Title and video file are required!");
    }
    if (!writer.close()) {
        log_error("Upload %s failed after %zu chunks: %s",
                  writer.blob_id().c_str(), writer.chunks().size(), writer.error_message().c_str());
        return fail(pending, BlobError::StorageUnavailable, writer.error_message());
    }

    BlobRecord record;
    record.id = writer.blob_id();
    record.content_version = writer.content_version();
    record.display_name = request.filename;
    record.title = request.title;
    record.length = writer.bytes_written();
    record.content_type = request.content_type.empty() ? default_content_type_ : request.content_type;
    record.chunk_size = chunk_size_;
    record.created_at = std::chrono::system_clock::now();
    record.chunks = writer.chunks();

    auto created = store_.create(record);
    if (!created.success) {
        log_error("Upload %s: cannot commit record: %s",
                  record.id.c_str(), created.error_message.c_str());
        return fail(pending, created.error, created.error_message);
    }
    writer.commit();

    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(record.length));
    }
    log_info("Uploaded %s (%llu bytes, %zu chunks) \"%s\"",
             record.id.c_str(), static_cast<unsigned long long>(record.length),
             record.chunks.size(), record.title.c_str());

    UploadResult result;
    result.success = true;
    result.blob_id = record.id;
    result.length = record.length;
    return result;
}

UploadResult UploadPipeline::commit_replacement(PendingUpload& pending,
                                                const UploadRequest& request,
                                                BlobRecord* previous) {
    auto& writer = *pending.writer;
    const auto& id = writer.blob_id();
    if (!writer.close()) {
        log_error("Replacement upload for %s failed: %s", id.c_str(), writer.error_message().c_str());
        return fail(pending, BlobError::StorageUnavailable, writer.error_message());
    }

    BlobRecord updated;
    updated.id = id;
    updated.content_version = writer.content_version();
    updated.display_name = request.filename;
    updated.title = request.title;
    updated.length = writer.bytes_written();
    updated.content_type = request.content_type.empty() ? default_content_type_ : request.content_type;
    updated.chunk_size = chunk_size_;
    updated.chunks = writer.chunks();

    auto swapped = store_.replace_content(id, updated);
    if (!swapped.success) {
        log_error("Replacement of %s not committed: %s", id.c_str(), swapped.error_message.c_str());
        return fail(pending, swapped.error, swapped.error_message);
    }
    writer.commit();

    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(updated.length));
    }
    if (previous) *previous = std::move(swapped.record);

    UploadResult result;
    result.success = true;
    result.blob_id = id;
    result.length = updated.length;
    return result;
}

UploadResult UploadPipeline::upload(const UploadRequest& request) {
    if (request.title.empty() || request.source == nullptr) {
        return upload_error(BlobError::Validation, "Title and video file are required!");
    }

    std::string error;
    auto pending = begin({}, error);
    if (!pending) return upload_error(BlobError::StorageUnavailable, error);

    auto written = codec_.write(*request.source, *pending->writer);
    if (!written.success) {
        log_error("Upload %s failed after %zu chunks: %s", pending->writer->blob_id().c_str(),
                  pending->writer->chunks().size(), written.error_message.c_str());
        return fail(*pending, written.error, written.error_message);
    }
    return commit(*pending, request);
}

UploadResult UploadPipeline::reupload(const std::string& id, const UploadRequest& request,
                                      BlobRecord* previous) {
    if (request.source == nullptr) {
        return upload_error(BlobError::Validation, "Title and video file are required!");
    }

    std::string error;
    auto pending = begin(id, error);
    if (!pending) return upload_error(BlobError::StorageUnavailable, error);

    auto written = codec_.write(*request.source, *pending->writer);
    if (!written.success) {
        log_error("Replacement upload for %s failed: %s", id.c_str(), written.error_message.c_str());
        return fail(*pending, written.error, written.error_message);
    }
    return commit_replacement(*pending, request, previous);
}

}  // namespace blobstream
