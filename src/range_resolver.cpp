#include "blobstream/range_resolver.hpp"

#include <algorithm>
#include <limits>

namespace blobstream {

namespace {

RangeResult range_error(std::string message) {
    RangeResult r;
    r.error = BlobError::Validation;
    r.error_message = std::move(message);
    return r;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // namespace

std::string ResolvedRange::content_range() const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" +
           std::to_string(total_length);
}

RangeResult RangeResolver::resolve(std::string_view header, uint64_t length) const {
    auto spec = trim(header);
    if (spec.starts_with("bytes=")) {
        spec.remove_prefix(6);
        spec = trim(spec);
    }

    // Leading digits are the start offset; anything after them (a requested
    // end, further ranges) does not influence the served window.
    uint64_t start = 0;
    size_t digits = 0;
    while (digits < spec.size() && spec[digits] >= '0' && spec[digits] <= '9') {
        uint64_t d = static_cast<uint64_t>(spec[digits] - '0');
        if (start > (std::numeric_limits<uint64_t>::max() - d) / 10) {
            return range_error("Invalid Range header");
        }
        start = start * 10 + d;
        ++digits;
    }
    if (digits == 0) {
        return range_error("Invalid Range header");
    }
    if (digits < spec.size() && spec[digits] != '-' && spec[digits] != ',') {
        return range_error("Invalid Range header");
    }

    if (start >= length) {
        return range_error("Range Not Satisfiable");
    }

    RangeResult result;
    result.success = true;
    auto& r = result.range;
    r.start = start;
    r.end = std::min(start + (window_ - 1), length - 1);
    if (window_ - 1 > std::numeric_limits<uint64_t>::max() - start) {
        r.end = length - 1;
    }
    r.content_length = r.end - r.start + 1;
    r.total_length = length;
    return result;
}

}  // namespace blobstream
