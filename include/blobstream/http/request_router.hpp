#pragma once

#include "blobstream/http/multipart.hpp"

#include <boost/beast/http.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blobstream {
class BlobOrchestrator;
class BlobRecordStore;
class DownloadStreamer;
class UploadPipeline;
struct DownloadPlan;
struct PendingUpload;
}  // namespace blobstream

namespace blobstream::http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using RequestHeader = beast_http::request_header<>;

/// Outcome of routing one request. Either a complete JSON (or empty) body,
/// or a 206 whose body is pulled from `stream` by the server.
struct RouteResult {
    beast_http::status status = beast_http::status::ok;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
    std::shared_ptr<DownloadPlan> stream;
};

struct RouterSettings {
    std::string public_url;   // empty = "http://" + Host header
    std::string cors_origin;  // empty = no CORS headers
};

/// Consumes the body of a multipart upload (POST /upload) or content
/// replacement (PUT /video/:id) piece by piece as it arrives.
///
/// The video part goes straight into a chunk writer; text fields are kept.
/// Nothing becomes visible before finish(). Every call performs blocking
/// storage I/O.
class UploadStream {
public:
    enum class Kind { Create, Replace };

    UploadStream(Kind kind, std::string blob_id, std::string_view content_type,
                 UploadPipeline& pipeline, BlobOrchestrator& orchestrator);

    /// Rejects the request without looking at its body.
    explicit UploadStream(RouteResult rejection);

    ~UploadStream();

    UploadStream(const UploadStream&) = delete;
    UploadStream& operator=(const UploadStream&) = delete;

    /// Consume the next piece of the body. Returns false once the upload
    /// cannot succeed; the rest of the body need not be read.
    bool write(std::string_view data);

    /// The body is complete (or was cut short by a failed write). Commits
    /// the upload if possible and returns the response.
    RouteResult finish();

    /// The client went away mid-body. Removes every chunk written so far.
    void abort(const std::string& reason);

    bool failed() const { return response_.has_value(); }
    uint64_t content_bytes() const;

private:
    enum class Field { None, Title, Video };

    bool on_part(const MultipartPart& part);
    bool on_data(std::string_view data);
    bool open_content();
    RouteResult storage_failure(const std::string& message) const;
    RouteResult malformed(const std::string& message) const;
    RouteResult commit_new();
    RouteResult commit_replacement();
    void drop_content(const std::string& reason);

    Kind kind_ = Kind::Create;
    std::string blob_id_;
    UploadPipeline* pipeline_ = nullptr;
    BlobOrchestrator* orchestrator_ = nullptr;

    std::optional<MultipartReader> reader_;
    std::unique_ptr<PendingUpload> pending_;
    Field field_ = Field::None;
    bool title_seen_ = false;
    bool video_seen_ = false;
    std::string title_;
    std::string filename_;
    std::string content_type_;
    std::optional<RouteResult> response_;
};

/// Maps the HTTP surface onto the blob operations. Safe to call from any
/// thread; every call performs blocking storage I/O.
///
///   POST   /upload      multipart: title, video (streamed)
///   GET    /videos
///   GET    /video/:id   requires Range
///   PUT    /video/:id   multipart (title?, video?) streamed, or JSON {"title"}
///   DELETE /video/:id
class RequestRouter {
public:
    RequestRouter(UploadPipeline& pipeline, DownloadStreamer& streamer,
                  BlobOrchestrator& orchestrator, BlobRecordStore& store,
                  RouterSettings settings);

    /// Route a request whose body is already complete. Never throws;
    /// unexpected exceptions become 500.
    RouteResult handle(const Request& request) const;

    /// For requests whose body should be streamed into the chunk store,
    /// returns the consumer to feed it to; null for every other request,
    /// which is read whole and passed to handle().
    std::unique_ptr<UploadStream> open_upload(const RequestHeader& header) const;

    /// Complete a streamed upload. Never throws.
    RouteResult finish_upload(UploadStream& upload) const;

private:
    RouteResult dispatch(const Request& request) const;
    std::unique_ptr<UploadStream> route_upload(const RequestHeader& header) const;
    RouteResult list_videos(const Request& request) const;
    RouteResult stream_video(const Request& request, const std::string& id) const;
    RouteResult update_video(const Request& request, const std::string& id) const;
    RouteResult delete_video(const std::string& id) const;
    RouteResult preflight(const Request& request) const;

    std::string video_url(const Request& request, const std::string& id) const;
    void add_cors(RouteResult& result) const;

    UploadPipeline& pipeline_;
    DownloadStreamer& streamer_;
    BlobOrchestrator& orchestrator_;
    BlobRecordStore& store_;
    RouterSettings settings_;
};

}  // namespace blobstream::http
