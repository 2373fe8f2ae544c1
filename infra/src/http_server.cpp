#include "infra/http_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace runq::infra {

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxBodyBytes = 1024 * 1024;
// Idle clients are dropped after this long without sending a byte.
constexpr int kRecvTimeoutSeconds = 30;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool send_all(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool send_response(int fd, const ServerResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n";
    if (!response.body.empty()) {
        out << "Content-Type: " << response.content_type << "\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << response.body;
    return send_all(fd, out.str());
}

ServerResponse plain_error(int status, const std::string& kind, const std::string& message) {
    ServerResponse response;
    response.status = status;
    response.body = "{\"error\":\"" + kind + "\",\"message\":\"" + message + "\"}";
    return response;
}

void parse_query(const std::string& raw, std::map<std::string, std::string>& out) {
    std::size_t pos = 0;
    while (pos <= raw.size()) {
        const auto amp = raw.find('&', pos);
        const std::string pair = raw.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                out[url_decode(pair)] = "";
            } else {
                out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Status";
    }
}

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string url_encode(const std::string& text) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

HttpServer::HttpServer(std::string bind_host, std::uint16_t port, Handler handler,
                       std::shared_ptr<core::ILogger> logger)
    : bind_host_(std::move(bind_host)), port_(port), handler_(std::move(handler)),
      logger_(std::move(logger)) {}

HttpServer::~HttpServer() { stop(); }

core::Result<void, core::DispatchError> HttpServer::start() {
    using R = core::Result<void, core::DispatchError>;
    auto fail = [this](const std::string& what) {
        const std::string message = what + " failed: " + std::strerror(errno);
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
        }
        return R::Err(core::DispatchError(core::ErrorCategory::Network, 3001, message,
                                          {{"bind_host", bind_host_},
                                           {"port", std::to_string(port_)}}));
    };

    if (acceptor_.joinable()) {
        return R::Err(core::DispatchError::Conflict("HTTP server already started"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, bind_host_.c_str(), &addr.sin_addr) != 1) {
        return R::Err(core::DispatchError::Validation("Invalid IPv4 bind address: " + bind_host_));
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return fail("socket()");
    }

    int enable = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("bind()");
    }

    socklen_t addr_len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        return fail("getsockname()");
    }
    port_ = ntohs(addr.sin_port);

    if (::listen(listen_fd_, 128) < 0) {
        return fail("listen()");
    }

    stop_.store(false);
    acceptor_ = std::thread([this, fd = listen_fd_] { accept_loop(fd); });
    if (logger_) {
        logger_->info("http", "http_server", "listening", base_url());
    }
    return R::Ok();
}

void HttpServer::stop() {
    if (stop_.exchange(true)) {
        return;
    }
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (acceptor_.joinable()) {
        acceptor_.join();
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        // Wake workers still waiting on a silent client.
        for (const auto& worker : workers_) {
            if (worker.connection->fd >= 0) {
                ::shutdown(worker.connection->fd, SHUT_RDWR);
            }
        }
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    if (logger_) {
        logger_->info("http", "http_server", "stopped", "");
    }
}

std::string HttpServer::base_url() const {
    return "http://" + bind_host_ + ":" + std::to_string(port_);
}

void HttpServer::accept_loop(int listen_fd) {
    while (!stop_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_addr_len = sizeof(client_addr);
        const int client_fd =
            ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
        if (client_fd < 0) {
            if (stop_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = kRecvTimeoutSeconds;
        ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        auto connection = std::make_shared<Connection>();
        connection->fd = client_fd;
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (stop_.load()) {
            ::close(client_fd);
            break;
        }
        reap_finished_locked();
        workers_.push_back(Worker{std::thread([this, client_fd, connection] {
                                      handle_connection(client_fd);
                                      finish_connection(connection);
                                  }),
                                  connection});
    }
}

void HttpServer::finish_connection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ::close(connection->fd);
    connection->fd = -1;
    connection->done = true;
}

void HttpServer::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->connection->done) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::handle_connection(int client_fd) {
    auto reply = [this, client_fd](const ServerResponse& response) {
        if (!send_response(client_fd, response) && logger_) {
            logger_->warn("http", "http_server", "send_failed",
                          "status " + std::to_string(response.status) + ": " +
                              std::strerror(errno));
        }
    };

    std::string raw;
    char buffer[4096];
    std::size_t header_end = std::string::npos;
    while ((header_end = raw.find("\r\n\r\n")) == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
            reply(plain_error(400, "validation_error", "Headers too large"));
            return;
        }
        const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        raw.append(buffer, static_cast<std::size_t>(n));
    }

    ServerRequest request;
    std::istringstream head(raw.substr(0, header_end));
    std::string request_line;
    std::getline(head, request_line);
    std::string target;
    std::string version;
    {
        std::istringstream line_stream(trim(request_line));
        line_stream >> request.method >> target >> version;
    }
    if (request.method.empty() || target.empty()) {
        reply(plain_error(400, "validation_error", "Malformed request line"));
        return;
    }

    std::string header_line;
    while (std::getline(head, header_line)) {
        const auto colon = header_line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        request.headers[lowercase(trim(header_line.substr(0, colon)))] =
            trim(header_line.substr(colon + 1));
    }

    const auto question = target.find('?');
    request.path = url_decode(target.substr(0, question));
    if (question != std::string::npos) {
        parse_query(target.substr(question + 1), request.query);
    }

    std::size_t content_length = 0;
    const auto length_it = request.headers.find("content-length");
    if (length_it != request.headers.end()) {
        const std::string& value = length_it->second;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), content_length);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            reply(plain_error(400, "validation_error", "Invalid Content-Length"));
            return;
        }
        if (content_length > kMaxBodyBytes) {
            reply(plain_error(413, "validation_error", "Body too large"));
            return;
        }
    }

    request.body = raw.substr(header_end + 4);
    while (request.body.size() < content_length) {
        const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        request.body.append(buffer, static_cast<std::size_t>(n));
    }
    request.body.resize(std::min(request.body.size(), content_length));

    if (!handler_) {
        reply(plain_error(503, "internal", "No handler installed"));
        return;
    }
    ServerResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("http", "http_server", "handler_exception",
                           request.method + " " + request.path + ": " + e.what());
        }
        response = plain_error(500, "internal", "Unhandled server error");
    }
    reply(response);
}

} // namespace runq::infra
