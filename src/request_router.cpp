#include "blobstream/http/request_router.hpp"
#include "blobstream/blob_orchestrator.hpp"
#include "blobstream/blob_record_store.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/constants.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/download_streamer.hpp"
#include "blobstream/upload_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace blobstream::http {

namespace {

using json = nlohmann::ordered_json;

constexpr std::string_view VIDEO_PATH_PREFIX = "/video/";

RouteResult json_response(beast_http::status status, const json& body) {
    RouteResult r;
    r.status = status;
    r.body = body.dump();
    r.headers.emplace_back("Content-Type", "application/json; charset=utf-8");
    return r;
}

RouteResult error_response(beast_http::status status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

beast_http::status status_for(BlobError error) {
    switch (error) {
        case BlobError::Validation: return beast_http::status::bad_request;
        case BlobError::NotFound: return beast_http::status::not_found;
        case BlobError::StorageUnavailable:
        case BlobError::None: break;
    }
    return beast_http::status::internal_server_error;
}

std::string_view request_path(const RequestHeader& request) {
    std::string_view target(request.target().data(), request.target().size());
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

std::string_view header_value(const RequestHeader& request, beast_http::field field) {
    auto it = request.find(field);
    if (it == request.end()) return {};
    return std::string_view(it->value().data(), it->value().size());
}

std::span<const uint8_t> as_bytes(std::string_view data) {
    return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// The id of a /video/:id path, or empty.
std::string video_id(std::string_view path) {
    if (!path.starts_with(VIDEO_PATH_PREFIX) || path.size() == VIDEO_PATH_PREFIX.size()) return {};
    auto id = path.substr(VIDEO_PATH_PREFIX.size());
    if (id.find('/') != std::string_view::npos) return {};
    return std::string(id);
}

RouteResult update_response(const UpdateResult& result, bool content) {
    if (!result.success) {
        switch (result.error) {
            case BlobError::NotFound:
                return error_response(beast_http::status::not_found, "Video not found");
            case BlobError::Validation:
                return error_response(beast_http::status::bad_request, result.error_message);
            default:
                break;
        }
        return json_response(beast_http::status::internal_server_error,
                             json{{"error", content ? "Failed to upload new video" : "Failed to replace video"},
                                  {"details", result.error_message}});
    }
    if (result.content_replaced) {
        return json_response(beast_http::status::ok,
                             json{{"message", "Video replaced successfully!"}, {"fileId", result.blob_id}});
    }
    return json_response(beast_http::status::ok, json{{"message", "Metadata updated successfully!"}});
}

bool is_json(std::string_view content_type) {
    return content_type.substr(0, content_type.find(';')).find("application/json") !=
           std::string_view::npos;
}

}  // namespace

UploadStream::UploadStream(Kind kind, std::string blob_id, std::string_view content_type,
                           UploadPipeline& pipeline, BlobOrchestrator& orchestrator)
    : kind_(kind)
    , blob_id_(std::move(blob_id))
    , pipeline_(&pipeline)
    , orchestrator_(&orchestrator) {
    auto boundary = MultipartReader::boundary_from(content_type);
    if (!boundary) {
        response_ = malformed("not a multipart/form-data body");
        return;
    }
    MultipartReader::Callbacks callbacks;
    callbacks.on_part = [this](const MultipartPart& part) { return on_part(part); };
    callbacks.on_data = [this](std::string_view data) { return on_data(data); };
    callbacks.on_part_end = [this] {
        field_ = Field::None;
        return true;
    };
    reader_.emplace(std::move(*boundary), std::move(callbacks));
}

UploadStream::UploadStream(RouteResult rejection) : response_(std::move(rejection)) {}

UploadStream::~UploadStream() = default;

bool UploadStream::on_part(const MultipartPart& part) {
    field_ = Field::None;
    if (part.name == "video" && part.has_filename && !video_seen_) {
        video_seen_ = true;
        filename_ = part.filename;
        content_type_ = part.content_type;
        field_ = Field::Video;
        // An empty file input on a replace form means "keep the content".
        if (kind_ == Kind::Create || !filename_.empty()) return open_content();
    } else if (part.name == "title" && !part.has_filename && !title_seen_) {
        title_seen_ = true;
        field_ = Field::Title;
    }
    return true;
}

bool UploadStream::on_data(std::string_view data) {
    switch (field_) {
        case Field::Title:
            if (title_.size() + data.size() > constants::MAX_TITLE_BYTES) {
                response_ = error_response(beast_http::status::bad_request, "Title too long");
                return false;
            }
            title_.append(data);
            return true;
        case Field::Video:
            if (!pending_ && !open_content()) return false;
            if (!pending_->write(as_bytes(data))) {
                response_ = storage_failure(pending_->writer->error_message());
                return false;
            }
            return true;
        case Field::None:
            break;
    }
    return true;
}

bool UploadStream::open_content() {
    std::string error;
    pending_ = pipeline_->begin(blob_id_, error);
    if (!pending_) {
        response_ = storage_failure(error);
        return false;
    }
    return true;
}

RouteResult UploadStream::storage_failure(const std::string& message) const {
    if (kind_ == Kind::Create) {
        return error_response(beast_http::status::internal_server_error, "Failed to upload video");
    }
    return json_response(beast_http::status::internal_server_error,
                         json{{"error", "Failed to upload new video"}, {"details", message}});
}

RouteResult UploadStream::malformed(const std::string& message) const {
    if (kind_ == Kind::Create) {
        log_debug("Upload rejected: %s", message.c_str());
        return error_response(beast_http::status::bad_request, "Title and video file are required!");
    }
    return error_response(beast_http::status::bad_request, "Invalid multipart body: " + message);
}

bool UploadStream::write(std::string_view data) {
    if (response_) return false;
    if (!reader_->feed(data)) {
        if (!response_) response_ = malformed(reader_->error());
        return false;
    }
    return true;
}

RouteResult UploadStream::finish() {
    if (!response_ && !reader_->finish()) {
        response_ = malformed(reader_->error());
    }
    if (response_) {
        drop_content("request rejected");
        return *response_;
    }
    return kind_ == Kind::Create ? commit_new() : commit_replacement();
}

void UploadStream::abort(const std::string& reason) {
    drop_content(reason);
}

uint64_t UploadStream::content_bytes() const {
    return pending_ ? pending_->bytes_written() : 0;
}

void UploadStream::drop_content(const std::string& reason) {
    if (pending_) {
        pipeline_->abandon(*pending_, reason);
        pending_.reset();
    }
}

RouteResult UploadStream::commit_new() {
    if (title_.empty() || !video_seen_) {
        drop_content("title or video missing");
        return error_response(beast_http::status::bad_request, "Title and video file are required!");
    }
    if (!pending_ && !open_content()) return *response_;

    UploadRequest upload;
    upload.title = title_;
    upload.filename = filename_;
    upload.content_type = content_type_;

    auto result = pipeline_->commit(*pending_, upload);
    pending_.reset();
    if (!result.success) {
        if (result.error == BlobError::Validation) {
            return error_response(beast_http::status::bad_request, result.error_message);
        }
        return error_response(beast_http::status::internal_server_error, "Failed to upload video");
    }
    return json_response(beast_http::status::ok,
                         json{{"message", "Video uploaded successfully!"}, {"fileId", result.blob_id}});
}

RouteResult UploadStream::commit_replacement() {
    UpdateRequest update;
    if (title_seen_) update.title = title_;
    if (pending_) {
        update.content = pending_.get();
        update.filename = filename_;
        update.content_type = content_type_;
    }
    auto result = orchestrator_->update(blob_id_, update);
    bool content = pending_ != nullptr;
    pending_.reset();
    return update_response(result, content);
}

RequestRouter::RequestRouter(UploadPipeline& pipeline, DownloadStreamer& streamer,
                             BlobOrchestrator& orchestrator, BlobRecordStore& store,
                             RouterSettings settings)
    : pipeline_(pipeline)
    , streamer_(streamer)
    , orchestrator_(orchestrator)
    , store_(store)
    , settings_(std::move(settings)) {
    while (!settings_.public_url.empty() && settings_.public_url.back() == '/') {
        settings_.public_url.pop_back();
    }
}

RouteResult RequestRouter::handle(const Request& request) const {
    RouteResult result;
    try {
        if (auto upload = route_upload(request)) {
            // A rejected body is reported by finish().
            upload->write(request.body());
            result = upload->finish();
        } else {
            result = dispatch(request);
        }
    } catch (const std::exception& e) {
        log_error("%s %.*s: %s", std::string(request.method_string()).c_str(),
                  static_cast<int>(request.target().size()), request.target().data(), e.what());
        result = error_response(beast_http::status::internal_server_error, "Internal Server Error");
    }
    add_cors(result);
    return result;
}

std::unique_ptr<UploadStream> RequestRouter::open_upload(const RequestHeader& header) const {
    try {
        return route_upload(header);
    } catch (const std::exception& e) {
        log_error("%s %.*s: %s", std::string(header.method_string()).c_str(),
                  static_cast<int>(header.target().size()), header.target().data(), e.what());
        return std::make_unique<UploadStream>(
            error_response(beast_http::status::internal_server_error, "Internal Server Error"));
    }
}

RouteResult RequestRouter::finish_upload(UploadStream& upload) const {
    RouteResult result;
    try {
        result = upload.finish();
    } catch (const std::exception& e) {
        log_error("Upload failed: %s", e.what());
        result = error_response(beast_http::status::internal_server_error, "Internal Server Error");
    }
    add_cors(result);
    return result;
}

std::unique_ptr<UploadStream> RequestRouter::route_upload(const RequestHeader& header) const {
    auto path = request_path(header);
    auto content_type = header_value(header, beast_http::field::content_type);

    if (path == "/upload" && header.method() == beast_http::verb::post) {
        return std::make_unique<UploadStream>(UploadStream::Kind::Create, std::string(),
                                              content_type, pipeline_, orchestrator_);
    }
    if (header.method() != beast_http::verb::put || !MultipartReader::boundary_from(content_type)) {
        return nullptr;
    }
    auto id = video_id(path);
    if (id.empty()) return nullptr;

    // Reject before any content is stored for an id that does not exist.
    auto existing = store_.get(id);
    if (!existing.success) {
        if (existing.error == BlobError::NotFound) {
            return std::make_unique<UploadStream>(
                error_response(beast_http::status::not_found, "Video not found"));
        }
        return std::make_unique<UploadStream>(json_response(
            beast_http::status::internal_server_error,
            json{{"error", "Failed to replace video"}, {"details", existing.error_message}}));
    }
    return std::make_unique<UploadStream>(UploadStream::Kind::Replace, id, content_type,
                                          pipeline_, orchestrator_);
}

RouteResult RequestRouter::dispatch(const Request& request) const {
    auto path = request_path(request);
    auto method = request.method();

    if (method == beast_http::verb::options) {
        return preflight(request);
    }
    if (path == "/videos" && method == beast_http::verb::get) {
        return list_videos(request);
    }
    if (auto id = video_id(path); !id.empty()) {
        switch (method) {
            case beast_http::verb::get: return stream_video(request, id);
            case beast_http::verb::put: return update_video(request, id);
            case beast_http::verb::delete_: return delete_video(id);
            default: break;
        }
    }
    return error_response(beast_http::status::not_found, "Not found");
}

RouteResult RequestRouter::list_videos(const Request& request) const {
    auto listed = store_.list();
    if (!listed.success) {
        return error_response(beast_http::status::internal_server_error, listed.error_message);
    }
    if (listed.records.empty()) {
        return error_response(beast_http::status::not_found, "No videos found");
    }

    json items = json::array();
    for (const auto& r : listed.records) {
        items.push_back(json{
            {"_id", r.id},
            {"filename", r.title},
            {"originalName", r.display_name},
            {"length", r.length},
            {"contentType", r.content_type},
            {"uploadDate", format_iso8601(r.created_at)},
            {"videoUrl", video_url(request, r.id)},
        });
    }
    return json_response(beast_http::status::ok, items);
}

RouteResult RequestRouter::stream_video(const Request& request, const std::string& id) const {
    std::optional<std::string> range;
    auto it = request.find(beast_http::field::range);
    if (it != request.end()) {
        range = std::string(it->value());
    }

    auto plan = std::make_shared<DownloadPlan>(streamer_.open(id, range));
    if (!plan->success) {
        if (plan->error == BlobError::StorageUnavailable) {
            log_error("Range request for %s failed: %s", id.c_str(), plan->error_message.c_str());
            return error_response(beast_http::status::internal_server_error, "Failed to read video");
        }
        return error_response(status_for(plan->error), plan->error_message);
    }

    RouteResult r;
    r.status = beast_http::status::partial_content;
    r.headers.emplace_back("Content-Range", plan->range.content_range());
    r.headers.emplace_back("Accept-Ranges", "bytes");
    r.headers.emplace_back("Content-Type", plan->content_type);
    r.stream = std::move(plan);
    return r;
}

RouteResult RequestRouter::update_video(const Request& request, const std::string& id) const {
    auto content_type = header_value(request, beast_http::field::content_type);

    UpdateRequest update;
    if (is_json(content_type) && !request.body().empty()) {
        auto body = json::parse(request.body(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return error_response(beast_http::status::bad_request, "Invalid JSON body");
        }
        if (body.contains("title") && body["title"].is_string()) {
            update.title = body["title"].get<std::string>();
        }
    }
    return update_response(orchestrator_.update(id, update), false);
}

RouteResult RequestRouter::delete_video(const std::string& id) const {
    auto result = orchestrator_.remove(id);
    if (!result.success) {
        if (result.error == BlobError::NotFound) {
            return error_response(beast_http::status::not_found, "Video not found");
        }
        log_error("Delete of %s failed: %s", id.c_str(), result.error_message.c_str());
        return error_response(beast_http::status::internal_server_error, "Failed to delete video");
    }
    return json_response(beast_http::status::ok, json{{"message", "Video deleted successfully"}});
}

RouteResult RequestRouter::preflight(const Request& request) const {
    RouteResult r;
    r.status = beast_http::status::no_content;
    if (!settings_.cors_origin.empty()) {
        r.headers.emplace_back("Access-Control-Allow-Methods", "GET,HEAD,PUT,PATCH,POST,DELETE");
        auto requested = header_value(request, beast_http::field::access_control_request_headers);
        if (!requested.empty()) {
            r.headers.emplace_back("Access-Control-Allow-Headers", std::string(requested));
        }
    }
    return r;
}

std::string RequestRouter::video_url(const Request& request, const std::string& id) const {
    if (!settings_.public_url.empty()) {
        return settings_.public_url + "/video/" + id;
    }
    auto host = header_value(request, beast_http::field::host);
    return "http://" + std::string(host.empty() ? "localhost" : host) + "/video/" + id;
}

void RequestRouter::add_cors(RouteResult& result) const {
    if (!settings_.cors_origin.empty()) {
        result.headers.emplace_back("Access-Control-Allow-Origin", settings_.cors_origin);
    }
}

}  // namespace blobstream::http
