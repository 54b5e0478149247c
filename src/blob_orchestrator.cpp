#include "blobstream/blob_orchestrator.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/constants.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/metrics.hpp"
#include "blobstream/storage/backend.hpp"
#include "blobstream/upload_pipeline.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace blobstream {

namespace {

constexpr size_t ORPHAN_BATCH_SIZE = 1000;

UpdateResult update_error(BlobError error, std::string message) {
    UpdateResult r;
    r.error = error;
    r.error_message = std::move(message);
    return r;
}

}  // namespace

BlobOrchestrator::BlobOrchestrator(BlobRecordStore& store, ChunkCodec& codec,
                                   UploadPipeline& pipeline, MetricsExporter* metrics)
    : store_(store)
    , codec_(codec)
    , pipeline_(pipeline)
    , metrics_(metrics) {}

void BlobOrchestrator::remove_chunks_of(const BlobRecord& record, const char* reason) {
    auto failed = codec_.remove_chunks(record.chunks);
    if (!failed.empty()) {
        log_error("%s %s: %zu of %zu chunks of version %s left orphaned",
                  reason, record.id.c_str(), failed.size(), record.chunks.size(),
                  record.content_version.c_str());
    }
}

UpdateResult BlobOrchestrator::update(const std::string& id, const UpdateRequest& request) {
    std::optional<std::string> title;
    if (request.title && !request.title->empty()) {
        title = request.title;
    }

    auto existing = store_.get(id);
    if (!existing.success) {
        if (request.content) {
            pipeline_.abandon(*request.content, "target " + id + " is gone");
        }
        return update_error(existing.error, existing.error_message);
    }

    UpdateResult result;
    result.blob_id = id;

    if (request.source || request.content) {
        UploadRequest upload;
        upload.source = request.source;
        upload.title = title.value_or(existing.record.title);
        upload.filename = request.filename;
        upload.content_type = request.content_type;

        BlobRecord previous;
        auto uploaded = request.content
            ? pipeline_.commit_replacement(*request.content, upload, &previous)
            : pipeline_.reupload(id, upload, &previous);
        if (!uploaded.success) {
            return update_error(uploaded.error, uploaded.error_message);
        }
        remove_chunks_of(previous, "Replaced");

        if (metrics_) metrics_->replacements_content().Increment();
        log_info("Replaced content of %s (%llu bytes)", id.c_str(),
                 static_cast<unsigned long long>(uploaded.length));
        result.content_replaced = true;
        result.success = true;
        return result;
    }

    if (title) {
        auto updated = store_.update_title(id, *title);
        if (!updated.success) {
            return update_error(updated.error, updated.error_message);
        }
        if (metrics_) metrics_->replacements_metadata().Increment();
        log_info("Retitled %s to \"%s\"", id.c_str(), title->c_str());
    }

    result.success = true;
    return result;
}

StatusResult BlobOrchestrator::remove(const std::string& id) {
    auto removed = store_.remove(id);
    if (!removed.success) {
        if (metrics_ && removed.error != BlobError::NotFound) {
            metrics_->deletes_failure().Increment();
        }
        StatusResult r;
        r.error = removed.error;
        r.error_message = removed.error_message;
        return r;
    }

    remove_chunks_of(removed.record, "Deleted");
    if (metrics_) metrics_->deletes_success().Increment();
    log_info("Deleted %s (%zu chunks)", id.c_str(), removed.record.chunks.size());

    StatusResult ok;
    ok.success = true;
    return ok;
}

OrphanReport BlobOrchestrator::collect_orphans() {
    OrphanReport report;

    auto records = store_.list();
    if (!records.success) {
        report.error_message = records.error_message;
        return report;
    }
    std::unordered_map<std::string, std::string> live_versions;
    for (const auto& r : records.records) {
        live_versions.emplace(r.id, r.content_version);
    }

    ListOptions opts;
    opts.prefix = constants::CHUNK_KEY_PREFIX;
    auto listing = codec_.backend().list(opts);
    if (!listing.success) {
        report.error_message = "Cannot list chunk store: " + listing.error_message;
        return report;
    }

    std::vector<std::string> orphans;
    for (const auto& entry : listing.entries) {
        ++report.scanned;
        std::string blob_id, version;
        if (!ChunkCodec::parse_chunk_key(entry.key, blob_id, version)) {
            continue;
        }
        auto it = live_versions.find(blob_id);
        if (it == live_versions.end() || it->second != version) {
            orphans.push_back(entry.key);
        }
    }

    for (size_t i = 0; i < orphans.size(); i += ORPHAN_BATCH_SIZE) {
        size_t end = std::min(orphans.size(), i + ORPHAN_BATCH_SIZE);
        std::vector<std::string> batch(orphans.begin() + i, orphans.begin() + end);
        auto failed = codec_.backend().remove_batch(batch);
        report.failed += failed.size();
        report.removed += batch.size() - failed.size();
    }

    if (metrics_ && report.removed > 0) {
        metrics_->orphans_collected().Increment(static_cast<double>(report.removed));
    }
    if (!orphans.empty()) {
        log_info("Orphan collection: removed %zu of %zu unreferenced chunks (%zu scanned)",
                 report.removed, orphans.size(), report.scanned);
    }
    report.success = report.failed == 0;
    if (!report.success) {
        report.error_message = std::to_string(report.failed) + " orphaned chunks could not be removed";
    }
    return report;
}

}  // namespace blobstream
