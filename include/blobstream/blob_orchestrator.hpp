#pragma once

#include "blobstream/blob_types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace blobstream {

class BlobRecordStore;
class ByteSource;
class ChunkCodec;
class MetricsExporter;
class UploadPipeline;
struct PendingUpload;

struct UpdateRequest {
    std::optional<std::string> title;  // empty string counts as absent
    ByteSource* source = nullptr;      // new content, not owned
    PendingUpload* content = nullptr;  // new content already written for this id, not owned
    std::string filename;
    std::string content_type;
};

struct UpdateResult {
    bool success = false;
    bool content_replaced = false;
    std::string blob_id;
    BlobError error = BlobError::None;
    std::string error_message;
};

struct OrphanReport {
    bool success = false;
    size_t scanned = 0;
    size_t removed = 0;
    size_t failed = 0;
    std::string error_message;
};

/// Sequences the destructive operations (replace, delete) across the record
/// store and the chunk store.
///
/// Replace writes the new content under a fresh version, swaps the record in
/// one transaction, then removes the previous chunks. Delete removes the
/// record first and the chunks afterwards. Either way a chunk that fails to
/// delete is left as an orphan for collect_orphans(), never a dangling record.
class BlobOrchestrator {
public:
    BlobOrchestrator(BlobRecordStore& store, ChunkCodec& codec, UploadPipeline& pipeline,
                     MetricsExporter* metrics = nullptr);

    /// Title update and/or content replace. A supplied title always wins;
    /// otherwise a replacement keeps the current title. With neither, succeeds
    /// without changes once the id is known.
    UpdateResult update(const std::string& id, const UpdateRequest& request);

    StatusResult remove(const std::string& id);

    /// Remove chunk objects not owned by the current version of any record.
    /// Must not run while uploads are in flight.
    OrphanReport collect_orphans();

private:
    void remove_chunks_of(const BlobRecord& record, const char* reason);

    BlobRecordStore& store_;
    ChunkCodec& codec_;
    UploadPipeline& pipeline_;
    MetricsExporter* metrics_;
};

}  // namespace blobstream
