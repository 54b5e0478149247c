#pragma once

#include "blobstream/blob_types.hpp"
#include "blobstream/range_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobstream {

class BlobRecordStore;
class ChunkCodec;
class MetricsExporter;
class RangeReader;

/// Everything needed to answer one range request: the served range and a
/// reader positioned at its first byte.
struct DownloadPlan {
    bool success = false;
    BlobError error = BlobError::None;
    std::string error_message;
    std::string blob_id;
    ResolvedRange range;
    std::string content_type;
    std::unique_ptr<RangeReader> body;
    std::chrono::steady_clock::time_point opened_at;
};

enum class SliceStatus { Data, End, Failed };

struct StreamResult {
    bool success = false;
    bool cancelled = false;  // sink refused more data
    uint64_t bytes_sent = 0;
    std::string error_message;
};

/// Resolves range requests against committed records and emits the sliced bytes.
class DownloadStreamer {
public:
    /// Returns false to stop the stream (client gone).
    using Sink = std::function<bool(std::span<const uint8_t>)>;

    DownloadStreamer(BlobRecordStore& store, const ChunkCodec& codec,
                     const RangeResolver& resolver, std::string content_type,
                     MetricsExporter* metrics = nullptr);

    /// Missing header: Validation before any lookup. Unknown id: NotFound.
    /// Bad or unsatisfiable range: Validation.
    DownloadPlan open(const std::string& id,
                      const std::optional<std::string>& range_header) const;

    /// Fetch the next slice of `plan` into `slice` (one chunk read, blocking).
    /// End means the range is complete; Failed means a chunk could not be read.
    SliceStatus next_slice(DownloadPlan& plan, std::vector<uint8_t>& slice) const;

    /// Drop the plan's reader and account the stream. `success` is false for
    /// read failures and for receivers that went away.
    void finish(DownloadPlan& plan, bool success) const;

    /// Pump the whole plan into `sink` with next_slice()/finish().
    StreamResult stream(DownloadPlan& plan, const Sink& sink) const;

private:
    BlobRecordStore& store_;
    const ChunkCodec& codec_;
    const RangeResolver& resolver_;
    std::string content_type_;
    MetricsExporter* metrics_;
};

}  // namespace blobstream
