#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/constants.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/storage/backend.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace blobstream {

namespace {
constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
}  // namespace

// --- Byte sources ---

size_t MemoryByteSource::read(uint8_t* buf, size_t max) {
    size_t n = std::min(max, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

size_t StreamByteSource::read(uint8_t* buf, size_t max) {
    if (!in_.good()) return 0;
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(max));
    return static_cast<size_t>(in_.gcount());
}

std::string StreamByteSource::error_message() const {
    return in_.bad() ? "input stream read error" : std::string();
}

// --- ChunkWriter ---

ChunkWriter::ChunkWriter(StorageBackend& backend, std::string blob_id,
                         std::string content_version, uint64_t chunk_size)
    : backend_(backend)
    , blob_id_(std::move(blob_id))
    , content_version_(std::move(content_version))
    , chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    buffer_.reserve(static_cast<size_t>(chunk_size_));
}

ChunkWriter::~ChunkWriter() {
    if (state_ != State::Committed && state_ != State::Discarded) {
        discard();
    }
}

bool ChunkWriter::write(std::span<const uint8_t> data) {
    if (state_ != State::Open) {
        if (state_ != State::Failed) {
            state_ = State::Failed;
            error_message_ = "write after close";
        }
        return false;
    }

    while (!data.empty()) {
        size_t room = static_cast<size_t>(chunk_size_) - buffer_.size();
        size_t n = std::min(room, data.size());
        buffer_.insert(buffer_.end(), data.begin(), data.begin() + n);
        data = data.subspan(n);
        bytes_written_ += n;

        if (buffer_.size() == chunk_size_ && !flush_chunk()) {
            return false;
        }
    }
    return true;
}

bool ChunkWriter::close() {
    if (state_ != State::Open) {
        return state_ == State::Closed;
    }
    if (!buffer_.empty() && !flush_chunk()) {
        return false;
    }
    state_ = State::Closed;
    return true;
}

void ChunkWriter::commit() {
    state_ = State::Committed;
}

void ChunkWriter::discard() {
    if (state_ == State::Committed || state_ == State::Discarded) return;
    state_ = State::Discarded;
    buffer_.clear();
    if (chunks_.empty()) return;

    std::vector<std::string> keys;
    keys.reserve(chunks_.size());
    for (const auto& c : chunks_) keys.push_back(c.storage_key);

    auto failed = backend_.remove_batch(keys);
    if (!failed.empty()) {
        log_error("Discarding %s/%s: %zu of %zu chunks left orphaned",
                  blob_id_.c_str(), content_version_.c_str(), failed.size(), keys.size());
    } else {
        log_debug("Discarded %zu chunks of %s/%s",
                  keys.size(), blob_id_.c_str(), content_version_.c_str());
    }
    chunks_.clear();
}

bool ChunkWriter::flush_chunk() {
    ChunkRef ref;
    ref.sequence = static_cast<uint32_t>(chunks_.size());
    ref.storage_key = ChunkCodec::chunk_key(blob_id_, content_version_, ref.sequence);
    ref.size = buffer_.size();

    PutOptions opts;
    opts.if_not_exists = true;
    PutResult put;
    try {
        put = backend_.put(ref.storage_key, std::span<const uint8_t>(buffer_), opts);
    } catch (const std::exception& e) {
        put.success = false;
        put.error_message = e.what();
    }

    if (!put.success) {
        state_ = State::Failed;
        error_message_ = "chunk " + std::to_string(ref.sequence) + " write failed: " +
                         put.error_message;
        return false;
    }

    chunks_.push_back(std::move(ref));
    buffer_.clear();
    return true;
}

// --- RangeReader ---

RangeReader::RangeReader(const StorageBackend& backend, std::vector<ChunkRef> chunks,
                         uint64_t chunk_size, uint64_t start, uint64_t end_inclusive)
    : backend_(backend)
    , chunks_(std::move(chunks))
    , chunk_size_(chunk_size)
    , start_(start)
    , end_(end_inclusive)
    , first_chunk_(start / chunk_size)
    , last_chunk_(end_inclusive / chunk_size)
    , current_(first_chunk_) {}

bool RangeReader::next(std::vector<uint8_t>& out) {
    out.clear();
    if (done()) return false;

    const auto& chunk = chunks_[current_];
    uint64_t slice_start = (current_ == first_chunk_) ? start_ % chunk_size_ : 0;
    uint64_t slice_end = (current_ == last_chunk_) ? end_ % chunk_size_ + 1 : chunk.size;

    GetOptions opts;
    opts.range_start = slice_start;
    opts.range_end = slice_end;
    auto result = backend_.get(chunk.storage_key, opts);
    if (!result.success) {
        failed_ = true;
        error_message_ = result.not_found
            ? "chunk " + std::to_string(chunk.sequence) + " is gone: " + chunk.storage_key
            : "chunk " + std::to_string(chunk.sequence) + " read failed: " + result.error_message;
        return false;
    }
    if (result.data.size() != slice_end - slice_start) {
        failed_ = true;
        error_message_ = "chunk " + std::to_string(chunk.sequence) + " truncated: expected " +
                         std::to_string(slice_end - slice_start) + " bytes, got " +
                         std::to_string(result.data.size());
        return false;
    }

    out = std::move(result.data);
    bytes_emitted_ += out.size();
    ++chunks_read_;
    ++current_;
    return true;
}

// --- ChunkCodec ---

std::string ChunkCodec::chunk_prefix(const std::string& blob_id,
                                     const std::string& content_version) {
    std::string prefix = constants::CHUNK_KEY_PREFIX + blob_id + "/";
    if (!content_version.empty()) {
        prefix += content_version + "/";
    }
    return prefix;
}

std::string ChunkCodec::chunk_key(const std::string& blob_id,
                                  const std::string& content_version,
                                  uint32_t sequence) {
    char seq[16];
    snprintf(seq, sizeof(seq), "%0*u", constants::CHUNK_SEQUENCE_DIGITS, sequence);
    return chunk_prefix(blob_id, content_version) + seq;
}

bool ChunkCodec::parse_chunk_key(const std::string& key, std::string& blob_id,
                                 std::string& content_version) {
    std::string prefix = constants::CHUNK_KEY_PREFIX;
    if (key.compare(0, prefix.size(), prefix) != 0) return false;

    auto id_end = key.find('/', prefix.size());
    if (id_end == std::string::npos) return false;
    auto version_end = key.find('/', id_end + 1);
    if (version_end == std::string::npos || version_end == id_end + 1) return false;

    blob_id = key.substr(prefix.size(), id_end - prefix.size());
    content_version = key.substr(id_end + 1, version_end - id_end - 1);
    return !blob_id.empty();
}

std::unique_ptr<ChunkWriter> ChunkCodec::open_writer(const std::string& blob_id,
                                                     const std::string& content_version,
                                                     uint64_t chunk_size) {
    return std::make_unique<ChunkWriter>(backend_, blob_id, content_version, chunk_size);
}

ChunkWriteResult ChunkCodec::write(ByteSource& source, ChunkWriter& writer) const {
    ChunkWriteResult result;
    std::vector<uint8_t> buf(READ_BUFFER_SIZE);

    while (true) {
        size_t n = source.read(buf.data(), buf.size());
        if (n == 0) break;
        if (!writer.write(std::span<const uint8_t>(buf.data(), n))) {
            result.error = BlobError::StorageUnavailable;
            result.error_message = writer.error_message();
            return result;
        }
    }

    if (source.failed()) {
        result.error = BlobError::Validation;
        result.error_message = "upload stream aborted: " + source.error_message();
        return result;
    }

    if (!writer.close()) {
        result.error = BlobError::StorageUnavailable;
        result.error_message = writer.error_message();
        return result;
    }

    result.success = true;
    result.total_length = writer.bytes_written();
    result.chunk_count = writer.chunks().size();
    return result;
}

std::unique_ptr<RangeReader> ChunkCodec::read(const std::vector<ChunkRef>& chunks,
                                              uint64_t chunk_size, uint64_t start,
                                              uint64_t end_inclusive) const {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }

    uint64_t length = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].sequence != i) {
            throw std::invalid_argument("chunk sequence is not contiguous at index " +
                                        std::to_string(i));
        }
        if (i + 1 < chunks.size() && chunks[i].size != chunk_size) {
            throw std::invalid_argument("chunk " + std::to_string(i) +
                                        " is shorter than the chunk size");
        }
        length += chunks[i].size;
    }

    if (start > end_inclusive || end_inclusive >= length) {
        throw std::invalid_argument("range " + std::to_string(start) + "-" +
                                    std::to_string(end_inclusive) +
                                    " outside blob of " + std::to_string(length) + " bytes");
    }

    return std::make_unique<RangeReader>(backend_, chunks, chunk_size, start, end_inclusive);
}

std::vector<std::string> ChunkCodec::remove_chunks(const std::vector<ChunkRef>& chunks) {
    std::vector<std::string> keys;
    keys.reserve(chunks.size());
    for (const auto& c : chunks) keys.push_back(c.storage_key);
    if (keys.empty()) return {};
    return backend_.remove_batch(keys);
}

}  // namespace blobstream
