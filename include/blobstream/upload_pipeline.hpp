#pragma once

#include "blobstream/blob_types.hpp"

#include "blobstream/chunk_codec.hpp"
#include "blobstream/metrics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace blobstream {

class BlobRecordStore;
class MetricsExporter;

struct UploadRequest {
    ByteSource* source = nullptr;  // not owned; unused by commit()
    std::string title;
    std::string filename;          // stored as the display name
    std::string content_type;      // empty = service default
};

/// Content of one upload that is still arriving. Bytes are pushed in with
/// write() as they come off the wire. Destroying it uncommitted removes every
/// chunk written so far.
struct PendingUpload {
    std::unique_ptr<ChunkWriter> writer;
    std::optional<ScopedTimer> timer;

    bool write(std::span<const uint8_t> data) { return writer->write(data); }
    uint64_t bytes_written() const { return writer->bytes_written(); }
};

struct UploadResult {
    bool success = false;
    std::string blob_id;
    uint64_t length = 0;
    BlobError error = BlobError::None;
    std::string error_message;
};

/// Persists an incoming byte stream as chunks and commits the record last.
///
/// A record becomes visible only after every chunk is stored. Any failure
/// before the commit discards the chunks written so far.
class UploadPipeline {
public:
    UploadPipeline(BlobRecordStore& store, ChunkCodec& codec, uint64_t chunk_size,
                   std::string default_content_type, MetricsExporter* metrics = nullptr);

    /// Open a writer for new content of `id`; an empty id allocates a fresh
    /// blob id. Returns null with `error` set when no id can be generated.
    std::unique_ptr<PendingUpload> begin(const std::string& id, std::string& error);

    /// Close `pending` and commit it as a new blob. Requires a non-empty title.
    UploadResult commit(PendingUpload& pending, const UploadRequest& request);

    /// Close `pending` and swap the existing record `pending` was opened for to
    /// it. `request.title` becomes the title. On success `previous` (if
    /// non-null) receives the replaced record, whose chunks the caller owns.
    UploadResult commit_replacement(PendingUpload& pending, const UploadRequest& request,
                                    BlobRecord* previous);

    /// Remove the chunks of an upload that will never be committed.
    void abandon(PendingUpload& pending, const std::string& reason);

    /// Create a new blob from `request.source`. Requires a non-empty title and a source.
    UploadResult upload(const UploadRequest& request);

    /// Write new content for an existing blob under a fresh content version and
    /// swap the record to it. The blob id is kept and `request.title` becomes the
    /// title. On success `previous` (if non-null) receives the replaced record,
    /// whose chunks the caller owns and must remove.
    UploadResult reupload(const std::string& id, const UploadRequest& request,
                          BlobRecord* previous);

    uint64_t chunk_size() const { return chunk_size_; }

private:
    UploadResult fail(PendingUpload& pending, BlobError error, std::string message);

    BlobRecordStore& store_;
    ChunkCodec& codec_;
    uint64_t chunk_size_;
    std::string default_content_type_;
    MetricsExporter* metrics_;
};

}  // namespace blobstream
