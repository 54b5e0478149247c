#include "blobstream/http/http_server.hpp"
#include "blobstream/chunk_codec.hpp"
#include "blobstream/core/constants.hpp"
#include "blobstream/core/log.hpp"
#include "blobstream/download_streamer.hpp"
#include "blobstream/http/request_router.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace blobstream::http {

namespace {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Handles one keep-alive connection. All members are touched on the I/O
// thread only; storage work is posted to the pool and posted back.
//
// Every request starts with a header-only parser. Upload bodies are then read
// into a fixed buffer and pushed into the chunk store one piece at a time;
// the next piece is read only after the previous one is stored. Any other
// body is read whole, up to MAX_BUFFERED_BODY_BYTES.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const RequestRouter& router, const DownloadStreamer& streamer,
            asio::thread_pool& pool, const ServerSettings& settings)
        : stream_(std::move(socket))
        , router_(router)
        , streamer_(streamer)
        , pool_(pool)
        , settings_(settings) {}

    void start() {
        do_read_header();
    }

private:
    using HeaderParser = beast_http::request_parser<beast_http::empty_body>;
    using BufferedParser = beast_http::request_parser<beast_http::string_body>;
    using UploadParser = beast_http::request_parser<beast_http::buffer_body>;

    void do_read_header() {
        header_parser_.emplace();
        header_parser_->body_limit(settings_.max_body_bytes);
        stream_.expires_after(settings_.request_timeout);
        beast_http::async_read_header(stream_, buffer_, *header_parser_,
            beast::bind_front_handler(&Session::on_read_header, shared_from_this()));
    }

    void on_read_header(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::end_of_stream) {
            return do_close();
        }
        if (ec == beast_http::error::body_limit) {
            return send_too_large();
        }
        if (ec) {
            log_debug("Read header failed: %s", ec.message().c_str());
            return;
        }

        const auto& header = header_parser_->get();
        keep_alive_ = header.keep_alive();
        version_ = header.version();
        expects_continue_ = beast::iequals(header[beast_http::field::expect], "100-continue");

        // Deciding whether to stream may need a record lookup.
        auto head = std::make_shared<RequestHeader>(header.base());
        asio::post(pool_, [self = shared_from_this(), head] {
            std::shared_ptr<UploadStream> upload = self->router_.open_upload(*head);
            asio::post(self->stream_.get_executor(), [self, upload] {
                self->on_upload_opened(upload);
            });
        });
    }

    void on_upload_opened(std::shared_ptr<UploadStream> upload) {
        if (!upload) {
            return read_buffered_body();
        }
        upload_ = std::move(upload);
        if (upload_->failed()) {
            // Rejected on its headers; the body is never read.
            keep_alive_ = false;
            return finish_upload();
        }
        upload_parser_.emplace(std::move(*header_parser_));
        header_parser_.reset();
        upload_buf_.resize(constants::UPLOAD_READ_BUFFER_BYTES);
        continue_then(&Session::do_read_upload);
    }

    // Answer "Expect: 100-continue" before reading a body.
    void continue_then(void (Session::*next)()) {
        if (!expects_continue_) {
            return (this->*next)();
        }
        expects_continue_ = false;
        auto cont = std::make_shared<beast_http::response<beast_http::empty_body>>(
            beast_http::status::continue_, version_);
        beast_http::async_write(stream_, *cont,
            [self = shared_from_this(), cont, next](beast::error_code ec, std::size_t) {
                if (ec) {
                    log_debug("Write of 100-continue failed: %s", ec.message().c_str());
                    return self->abort_upload(ec.message());
                }
                ((*self).*next)();
            });
    }

    // --- Buffered requests ---

    void read_buffered_body() {
        auto length = header_parser_->content_length();
        if (length && *length > constants::MAX_BUFFERED_BODY_BYTES) {
            return send_too_large();
        }
        body_parser_.emplace(std::move(*header_parser_));
        header_parser_.reset();
        body_parser_->body_limit(constants::MAX_BUFFERED_BODY_BYTES);
        if (body_parser_->is_done()) {
            return on_read({}, 0);
        }
        continue_then(&Session::do_read_body);
    }

    void do_read_body() {
        stream_.expires_after(settings_.request_timeout);
        beast_http::async_read(stream_, buffer_, *body_parser_,
            beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::body_limit) {
            return send_too_large();
        }
        if (ec) {
            log_debug("Read body failed: %s", ec.message().c_str());
            return;
        }

        auto request = std::make_shared<Request>(body_parser_->release());
        body_parser_.reset();
        stream_.expires_never();

        // Record and chunk store calls block; keep them off the I/O thread.
        asio::post(pool_, [self = shared_from_this(), request] {
            auto result = std::make_shared<RouteResult>(self->router_.handle(*request));
            asio::post(self->stream_.get_executor(), [self, result] {
                self->on_routed(std::move(*result));
            });
        });
    }

    // --- Streamed uploads ---

    void do_read_upload() {
        if (upload_parser_->is_done()) {
            return finish_upload();
        }
        auto& body = upload_parser_->get().body();
        body.data = upload_buf_.data();
        body.size = upload_buf_.size();
        stream_.expires_after(settings_.request_timeout);
        beast_http::async_read(stream_, buffer_, *upload_parser_,
            beast::bind_front_handler(&Session::on_upload_read, shared_from_this()));
    }

    void on_upload_read(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::need_buffer) {
            ec = {};
        }
        if (ec == beast_http::error::body_limit) {
            abort_upload("body too large");
            return send_too_large();
        }
        if (ec) {
            log_debug("Upload body read failed: %s", ec.message().c_str());
            return abort_upload(ec.message());
        }

        size_t got = upload_buf_.size() - upload_parser_->get().body().size;
        bool done = upload_parser_->is_done();
        if (got == 0) {
            return do_read_upload();
        }

        // upload_buf_ is not reused until the piece has been stored.
        stream_.expires_never();
        asio::post(pool_, [self = shared_from_this(), got, done] {
            bool ok = self->upload_->write(std::string_view(self->upload_buf_.data(), got));
            asio::post(self->stream_.get_executor(), [self, ok, done] {
                self->on_upload_written(ok, done);
            });
        });
    }

    void on_upload_written(bool ok, bool done) {
        if (!ok && !done) {
            // The rest of the body stays unread.
            keep_alive_ = false;
        }
        if (!ok || done) {
            return finish_upload();
        }
        do_read_upload();
    }

    void finish_upload() {
        stream_.expires_never();
        asio::post(pool_, [self = shared_from_this()] {
            auto result = std::make_shared<RouteResult>(self->router_.finish_upload(*self->upload_));
            asio::post(self->stream_.get_executor(), [self, result] {
                self->upload_.reset();
                self->upload_parser_.reset();
                self->on_routed(std::move(*result));
            });
        });
    }

    // The client went away mid-body: nothing of the upload may remain.
    void abort_upload(const std::string& reason) {
        upload_parser_.reset();
        auto upload = std::move(upload_);
        if (!upload) return;
        asio::post(pool_, [upload, reason] {
            upload->abort(reason);
        });
    }

    // --- Responses ---

    void on_routed(RouteResult result) {
        if (result.stream) {
            return start_stream(std::move(result));
        }

        auto res = std::make_shared<beast_http::response<beast_http::string_body>>(
            result.status, version_);
        res->set(beast_http::field::server, "blobstream");
        for (const auto& [name, value] : result.headers) {
            res->set(name, value);
        }
        res->body() = std::move(result.body);
        res->keep_alive(keep_alive_);
        res->prepare_payload();
        send(res);
    }

    void send_too_large() {
        keep_alive_ = false;
        auto res = std::make_shared<beast_http::response<beast_http::string_body>>(
            beast_http::status::payload_too_large, version_);
        res->set(beast_http::field::server, "blobstream");
        res->set(beast_http::field::content_type, "application/json; charset=utf-8");
        res->body() = nlohmann::json{{"error", "Request body too large"}}.dump();
        res->keep_alive(false);
        res->prepare_payload();
        send(res);
    }

    void send(std::shared_ptr<beast_http::response<beast_http::string_body>> res) {
        stream_.expires_after(settings_.request_timeout);
        beast_http::async_write(stream_, *res,
            [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                if (ec) {
                    log_debug("Write failed: %s", ec.message().c_str());
                    return;
                }
                if (res->need_eof()) {
                    return self->do_close();
                }
                self->do_read_header();
            });
    }

    // --- Range response pump ---

    void start_stream(RouteResult result) {
        plan_ = std::move(result.stream);

        stream_res_.emplace(result.status, version_);
        stream_res_->set(beast_http::field::server, "blobstream");
        for (const auto& [name, value] : result.headers) {
            stream_res_->set(name, value);
        }
        stream_res_->content_length(plan_->range.content_length);
        stream_res_->keep_alive(keep_alive_);
        stream_res_->body().data = nullptr;
        stream_res_->body().size = 0;
        stream_res_->body().more = true;

        serializer_.emplace(*stream_res_);
        stream_.expires_after(settings_.request_timeout);
        beast_http::async_write_header(stream_, *serializer_,
            beast::bind_front_handler(&Session::on_stream_write, shared_from_this()));
    }

    void fetch_next_slice() {
        asio::post(pool_, [self = shared_from_this()] {
            auto status = self->streamer_.next_slice(*self->plan_, self->slice_);
            asio::post(self->stream_.get_executor(), [self, status] {
                self->on_slice(status);
            });
        });
    }

    void on_slice(SliceStatus status) {
        switch (status) {
            case SliceStatus::Failed:
                // Headers are already out; all we can do is drop the connection.
                finish_stream(false);
                return do_close();
            case SliceStatus::End:
                stream_res_->body().data = nullptr;
                stream_res_->body().size = 0;
                stream_res_->body().more = false;
                break;
            case SliceStatus::Data:
                stream_res_->body().data = slice_.data();
                stream_res_->body().size = slice_.size();
                stream_res_->body().more = true;
                break;
        }

        stream_.expires_after(settings_.request_timeout);
        beast_http::async_write(stream_, *serializer_,
            beast::bind_front_handler(&Session::on_stream_write, shared_from_this()));
    }

    void on_stream_write(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            log_debug("Client went away during stream of %s: %s",
                      plan_->blob_id.c_str(), ec.message().c_str());
            finish_stream(false);
            return;
        }
        if (!serializer_->is_done()) {
            return fetch_next_slice();
        }

        finish_stream(true);
        if (!keep_alive_) {
            return do_close();
        }
        do_read_header();
    }

    void finish_stream(bool success) {
        streamer_.finish(*plan_, success);
        serializer_.reset();
        stream_res_.reset();
        plan_.reset();
        slice_.clear();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<HeaderParser> header_parser_;
    std::optional<BufferedParser> body_parser_;
    std::optional<UploadParser> upload_parser_;

    const RequestRouter& router_;
    const DownloadStreamer& streamer_;
    asio::thread_pool& pool_;
    const ServerSettings& settings_;

    bool keep_alive_ = false;
    bool expects_continue_ = false;
    unsigned version_ = 11;

    std::shared_ptr<UploadStream> upload_;
    std::vector<char> upload_buf_;

    std::shared_ptr<DownloadPlan> plan_;
    std::optional<beast_http::response<beast_http::buffer_body>> stream_res_;
    std::optional<beast_http::response_serializer<beast_http::buffer_body>> serializer_;
    std::vector<uint8_t> slice_;
};

}  // namespace

class HttpServer::Impl {
public:
    Impl(const RequestRouter& router, const DownloadStreamer& streamer, ServerSettings settings)
        : router_(router)
        , streamer_(streamer)
        , settings_(std::move(settings))
        , ioc_(1)
        , acceptor_(ioc_)
        , pool_(settings_.storage_threads) {}

    std::string start() {
        beast::error_code ec;
        auto address = asio::ip::make_address(settings_.address, ec);
        if (ec) return "Invalid listen address " + settings_.address + ": " + ec.message();
        tcp::endpoint endpoint{address, settings_.port};

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) return "Acceptor open failed: " + ec.message();
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) return "Set reuse_address failed: " + ec.message();
        acceptor_.bind(endpoint, ec);
        if (ec) {
            return "Bind to " + settings_.address + ":" + std::to_string(settings_.port) +
                   " failed: " + ec.message();
        }
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) return "Listen failed: " + ec.message();

        bound_port_ = acceptor_.local_endpoint(ec).port();
        do_accept();

        running_ = true;
        io_thread_ = std::thread([this] { ioc_.run(); });
        log_info("HTTP server listening on %s:%u", settings_.address.c_str(),
                 static_cast<unsigned>(bound_port_));
        return "";
    }

    void stop() {
        if (!running_.exchange(false)) return;

        ioc_.stop();
        if (io_thread_.joinable()) io_thread_.join();

        beast::error_code ec;
        acceptor_.close(ec);

        pool_.stop();
        pool_.join();
        log_info("HTTP server stopped");
    }

    uint16_t port() const { return bound_port_; }
    bool running() const { return running_; }

private:
    void do_accept() {
        acceptor_.async_accept(asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec == asio::error::operation_aborted) return;
                if (!ec) {
                    std::make_shared<Session>(std::move(socket), router_, streamer_,
                                              pool_, settings_)->start();
                } else {
                    log_error("Accept failed: %s", ec.message().c_str());
                }
                do_accept();
            });
    }

    const RequestRouter& router_;
    const DownloadStreamer& streamer_;
    ServerSettings settings_;

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    asio::thread_pool pool_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
};

HttpServer::HttpServer(const RequestRouter& router, const DownloadStreamer& streamer,
                       ServerSettings settings)
    : impl_(std::make_unique<Impl>(router, streamer, std::move(settings))) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::start() {
    return impl_->start();
}

void HttpServer::stop() {
    impl_->stop();
}

uint16_t HttpServer::port() const {
    return impl_->port();
}

bool HttpServer::running() const {
    return impl_->running();
}

}  // namespace blobstream::http
