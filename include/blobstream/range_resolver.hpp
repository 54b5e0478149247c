#pragma once

#include "blobstream/blob_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace blobstream {

/// Inclusive byte range to serve, clamped to the window and the blob length.
struct ResolvedRange {
    uint64_t start = 0;
    uint64_t end = 0;             // inclusive
    uint64_t content_length = 0;  // end - start + 1
    uint64_t total_length = 0;

    /// "bytes <start>-<end>/<total>"
    std::string content_range() const;
};

struct RangeResult {
    bool success = false;
    ResolvedRange range;
    BlobError error = BlobError::None;
    std::string error_message;
};

/// Parses a Range header against a blob length.
///
/// Only the start offset is honoured: a requested end is ignored and the
/// served end is always min(start + window - 1, length - 1). A bare number
/// without the "bytes=" unit is accepted.
class RangeResolver {
public:
    explicit RangeResolver(uint64_t window) : window_(window) {}

    RangeResult resolve(std::string_view header, uint64_t length) const;

    uint64_t window() const { return window_; }

private:
    uint64_t window_;
};

}  // namespace blobstream
