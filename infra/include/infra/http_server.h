#pragma once

#include "core/dispatch_error.h"
#include "core/logger.h"
#include "core/result.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace runq::infra {

struct ServerRequest {
    std::string method;
    std::string path;                           // decoded, without query
    std::map<std::string, std::string> query;   // decoded
    std::map<std::string, std::string> headers; // lowercase names
    std::string body;
};

struct ServerResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/// Minimal blocking HTTP/1.1 server on POSIX sockets.
/// One thread per connection, one request per connection
/// (Connection: close), which is all long polling needs.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    HttpServer(std::string bind_host, std::uint16_t port, Handler handler,
               std::shared_ptr<core::ILogger> logger = nullptr);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start accepting. Port 0 picks a free port.
    core::Result<void, core::DispatchError> start();

    /// Stop accepting, shut down every open client socket and join the
    /// connection threads. Handlers blocked in a long poll must be released
    /// first (Coordinator::shutdown).
    void stop();

    /// Actual port once started.
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] std::string base_url() const;

private:
    /// One accepted socket. Guarded by workers_mutex_; fd is -1 once the
    /// worker has closed it.
    struct Connection {
        int fd = -1;
        bool done = false;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<Connection> connection;
    };

    void accept_loop(int listen_fd);
    void handle_connection(int client_fd);
    void finish_connection(const std::shared_ptr<Connection>& connection);
    void reap_finished_locked();

    std::string bind_host_;
    std::uint16_t port_;
    Handler handler_;
    std::shared_ptr<core::ILogger> logger_;

    int listen_fd_ = -1;
    std::atomic<bool> stop_{false};
    std::thread acceptor_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

/// Percent-decoding ('+' becomes a space).
std::string url_decode(const std::string& text);

/// Percent-encoding of everything but unreserved characters.
std::string url_encode(const std::string& text);

/// Reason phrase for the status codes the API uses.
const char* reason_phrase(int status);

} // namespace runq::infra
