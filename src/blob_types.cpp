#include "blobstream/blob_types.hpp"
#include "blobstream/core/constants.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace blobstream {

namespace {

std::string random_hex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
    }

    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(num_bytes * 2);
    for (unsigned char b : bytes) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0f]);
    }
    return hex;
}

}  // namespace

const char* blob_error_name(BlobError error) {
    switch (error) {
        case BlobError::None: return "none";
        case BlobError::Validation: return "validation";
        case BlobError::NotFound: return "not_found";
        case BlobError::StorageUnavailable: return "storage_unavailable";
    }
    return "unknown";
}

std::string generate_blob_id() {
    return random_hex(constants::BLOB_ID_BYTES);
}

std::string generate_content_version() {
    return random_hex(constants::CONTENT_VERSION_BYTES);
}

bool is_valid_blob_id(const std::string& id) {
    if (id.size() != constants::BLOB_ID_BYTES * 2) return false;
    for (char c : id) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count();
    time_t secs = static_cast<time_t>(ms_total / 1000);
    int ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    struct tm tm_val;
    gmtime_r(&secs, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);

    char out[40];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, ms);
    return out;
}

uint64_t total_chunk_bytes(const std::vector<ChunkRef>& chunks) {
    uint64_t total = 0;
    for (const auto& c : chunks) total += c.size;
    return total;
}

}  // namespace blobstream
