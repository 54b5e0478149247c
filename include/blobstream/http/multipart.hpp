#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace blobstream::http {

/// Headers of one multipart/form-data part.
struct MultipartPart {
    std::string name;
    std::string filename;
    bool has_filename = false;
    std::string content_type;
};

/// Incremental multipart/form-data decoder.
///
/// The body is fed in arbitrary pieces as it arrives. Part payloads are
/// handed to the callbacks as soon as they are known not to contain the
/// delimiter, so at most one delimiter's worth of bytes is held back.
class MultipartReader {
public:
    /// Each callback returns false to stop decoding.
    struct Callbacks {
        std::function<bool(const MultipartPart&)> on_part;
        std::function<bool(std::string_view)> on_data;
        std::function<bool()> on_part_end;
    };

    MultipartReader(std::string boundary, Callbacks callbacks);

    /// Extract the boundary parameter of a multipart/form-data Content-Type.
    static std::optional<std::string> boundary_from(std::string_view content_type);

    /// Consume the next piece of the body. Returns false on malformed input or
    /// when a callback stopped decoding; error() says which.
    bool feed(std::string_view data);

    /// End of body. True only if the closing delimiter was seen.
    bool finish();

    bool done() const { return state_ == State::Done; }
    bool stopped() const { return stopped_; }
    const std::string& error() const { return error_; }

private:
    enum class State { Preamble, Delimiter, Headers, Body, Done, Failed };

    bool fail(std::string message);
    bool step(bool& progressed);

    std::string separator_;  // "\r\n--" + boundary
    Callbacks callbacks_;
    State state_ = State::Preamble;
    std::string pending_;
    size_t pos_ = 0;
    bool stopped_ = false;
    std::string error_;
};

}  // namespace blobstream::http
