#pragma once

#include "blobstream/blob_types.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace blobstream {

class StorageBackend;

/// Forward-only input stream consumed by the chunk writer.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to `max` bytes into `buf`. Returns 0 at end of stream or on failure.
    virtual size_t read(uint8_t* buf, size_t max) = 0;

    /// True if the stream ended abnormally (client disconnect, I/O error).
    virtual bool failed() const { return false; }
    virtual std::string error_message() const { return {}; }
};

/// ByteSource over a caller-owned buffer. The buffer must outlive the source.
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::span<const uint8_t> data) : data_(data) {}

    size_t read(uint8_t* buf, size_t max) override;

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

/// ByteSource over a std::istream (files, pipes).
class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in) : in_(in) {}

    size_t read(uint8_t* buf, size_t max) override;
    bool failed() const override { return in_.bad(); }
    std::string error_message() const override;

private:
    std::istream& in_;
};

/// Scoped writer for one content version of a blob.
///
/// Buffers input into chunk_size units and persists each one under
/// chunks/<blob_id>/<version>/<seq> with strictly increasing sequence numbers.
/// The writer must be committed once a record references its chunks; a
/// writer destroyed in any other state removes every chunk it persisted.
class ChunkWriter {
public:
    ChunkWriter(StorageBackend& backend, std::string blob_id,
                std::string content_version, uint64_t chunk_size);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /// Append bytes. Returns false once any chunk write has failed.
    bool write(std::span<const uint8_t> data);

    /// Flush the final partial chunk. No writes are accepted afterwards.
    bool close();

    /// Hand ownership of the persisted chunks to a committed record.
    void commit();

    /// Remove every chunk persisted so far (best effort; failures are logged).
    void discard();

    const std::vector<ChunkRef>& chunks() const { return chunks_; }
    uint64_t bytes_written() const { return bytes_written_; }
    bool failed() const { return state_ == State::Failed; }
    const std::string& error_message() const { return error_message_; }
    const std::string& blob_id() const { return blob_id_; }
    const std::string& content_version() const { return content_version_; }
    uint64_t chunk_size() const { return chunk_size_; }

private:
    enum class State { Open, Closed, Committed, Discarded, Failed };

    bool flush_chunk();

    StorageBackend& backend_;
    std::string blob_id_;
    std::string content_version_;
    uint64_t chunk_size_;

    std::vector<uint8_t> buffer_;
    std::vector<ChunkRef> chunks_;
    uint64_t bytes_written_ = 0;
    State state_ = State::Open;
    std::string error_message_;
};

/// Lazy, forward-only, single-pass reader over an inclusive byte range.
/// Each call to next() fetches at most one chunk slice from the store.
class RangeReader {
public:
    RangeReader(const StorageBackend& backend, std::vector<ChunkRef> chunks,
                uint64_t chunk_size, uint64_t start, uint64_t end_inclusive);

    /// Replace `out` with the next slice. Returns false when the range is
    /// exhausted or a chunk could not be read (check failed()).
    bool next(std::vector<uint8_t>& out);

    bool done() const { return current_ > last_chunk_ || failed_; }
    bool failed() const { return failed_; }
    const std::string& error_message() const { return error_message_; }

    uint64_t start() const { return start_; }
    uint64_t end() const { return end_; }
    uint64_t bytes_emitted() const { return bytes_emitted_; }
    uint64_t remaining() const { return (end_ - start_ + 1) - bytes_emitted_; }
    size_t chunks_read() const { return chunks_read_; }

private:
    const StorageBackend& backend_;
    std::vector<ChunkRef> chunks_;
    uint64_t chunk_size_;
    uint64_t start_;
    uint64_t end_;
    uint64_t first_chunk_;
    uint64_t last_chunk_;
    uint64_t current_;
    uint64_t bytes_emitted_ = 0;
    size_t chunks_read_ = 0;
    bool failed_ = false;
    std::string error_message_;
};

struct ChunkWriteResult {
    bool success = false;
    uint64_t total_length = 0;
    size_t chunk_count = 0;
    BlobError error = BlobError::None;
    std::string error_message;
};

/// Splits byte streams into fixed-size chunks and reassembles byte ranges.
class ChunkCodec {
public:
    explicit ChunkCodec(StorageBackend& backend) : backend_(backend) {}

    /// "chunks/<blob_id>/" or "chunks/<blob_id>/<version>/"
    static std::string chunk_prefix(const std::string& blob_id,
                                    const std::string& content_version = {});

    /// "chunks/<blob_id>/<version>/<seq, 8 digits>"; keys sort in byte order.
    static std::string chunk_key(const std::string& blob_id,
                                 const std::string& content_version,
                                 uint32_t sequence);

    /// Split a chunk key into its blob id and version. False if `key` is not one.
    static bool parse_chunk_key(const std::string& key, std::string& blob_id,
                                std::string& content_version);

    std::unique_ptr<ChunkWriter> open_writer(const std::string& blob_id,
                                             const std::string& content_version,
                                             uint64_t chunk_size);

    /// Drain `source` into `writer` and close it. On failure the writer is
    /// left unclosed for the caller to discard (or to discard on destruction).
    ChunkWriteResult write(ByteSource& source, ChunkWriter& writer) const;

    /// Open a reader for bytes [start, end_inclusive] of the blob made of `chunks`.
    /// Throws std::invalid_argument if the range or chunk layout is inconsistent.
    std::unique_ptr<RangeReader> read(const std::vector<ChunkRef>& chunks,
                                      uint64_t chunk_size, uint64_t start,
                                      uint64_t end_inclusive) const;

    /// Delete chunk objects. Returns the keys that could not be removed.
    std::vector<std::string> remove_chunks(const std::vector<ChunkRef>& chunks);

    StorageBackend& backend() { return backend_; }

private:
    StorageBackend& backend_;
};

}  // namespace blobstream
