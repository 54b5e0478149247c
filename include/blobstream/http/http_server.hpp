#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace blobstream {
class DownloadStreamer;
}

namespace blobstream::http {

class RequestRouter;

struct ServerSettings {
    std::string address = "0.0.0.0";
    uint16_t port = 0;
    uint64_t max_body_bytes = 0;
    std::chrono::seconds request_timeout{30};
    size_t storage_threads = 4;
};

/// HTTP/1.1 server on Boost.Beast.
///
/// One I/O thread owns every socket. Routing and chunk reads run on a storage
/// thread pool and complete back on the I/O thread. Range responses are
/// written one chunk slice at a time; the next slice is read only after the
/// previous write has completed. Upload bodies flow the other way: each piece
/// read off the socket is stored before the next one is read.
class HttpServer {
public:
    HttpServer(const RequestRouter& router, const DownloadStreamer& streamer,
               ServerSettings settings);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the I/O thread. Returns error message, empty on success.
    std::string start();

    /// Close the listener, drop open connections and join all threads.
    void stop();

    /// Bound port (useful when configured with port 0).
    uint16_t port() const;

    bool running() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blobstream::http
