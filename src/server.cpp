#include "server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace maxproxy {

namespace {

const char* const kCorsHeaders =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
    "Access-Control-Allow-Headers: Content-Type, Authorization\r\n";

bool send_all(int fd, const std::string& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

// ── Request parsing ──────────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = head.substr(0, rl_end);

    std::istringstream ss(request_line);
    std::string target, version;
    if (!(ss >> req.method >> target >> version)) return false;
    if (version.rfind("HTTP/", 0) != 0) return false;

    auto q = target.find('?');
    req.path = q == std::string::npos ? target : target.substr(0, q);

    if (rl_end == std::string::npos) return true;
    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

// ── ResponseWriter ───────────────────────────────────────────────

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 529: return "Overloaded";
        default:  return "Unknown";
    }
}

ResponseWriter::ResponseWriter(Sink sink) : sink_(std::move(sink)) {}

bool ResponseWriter::send(const std::string& bytes) {
    if (failed_) return false;
    if (!sink_(bytes)) failed_ = true;
    return !failed_;
}

bool ResponseWriter::respond(int status, const std::string& content_type,
                             const std::string& body) {
    if (started_) return false;
    started_ = true;

    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n";
    if (!content_type.empty()) resp += "Content-Type: " + content_type + "\r\n";
    resp += kCorsHeaders;
    resp += "Content-Length: " + std::to_string(body.size()) + "\r\n"
            "Connection: close\r\n\r\n" + body;
    return send(resp);
}

bool ResponseWriter::begin_stream(int status, const std::string& content_type) {
    if (started_) return false;
    started_ = true;

    std::string head =
        "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n"
        "Content-Type: " + content_type + "\r\n"
        "Cache-Control: no-cache\r\n" +
        kCorsHeaders +
        "Transfer-Encoding: chunked\r\n"
        "Connection: close\r\n\r\n";
    return send(head);
}

bool ResponseWriter::write_chunk(const std::string& data) {
    if (data.empty()) return !failed_; // a zero-length chunk would end the body
    char size_line[32];
    std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
    return send(size_line + data + "\r\n");
}

bool ResponseWriter::end_stream() {
    return send("0\r\n\r\n");
}

// ── HttpServer ───────────────────────────────────────────────────

HttpServer::HttpServer(std::string host, uint16_t port, uint32_t max_body, Handler handler)
    : host_(std::move(host))
    , port_(port)
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fd(shutdown_pipe_[0]);
        close_fd(shutdown_pipe_[1]);
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    auto fail = [&](const std::string& msg) {
        error = msg;
        close_fd(server_fd_);
        close_fd(shutdown_pipe_[0]);
        close_fd(shutdown_pipe_[1]);
        return false;
    };

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port_);
    if (::inet_pton(AF_INET, host_.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host_);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail("listen failed");
    }

    socklen_t len = sizeof(sa);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&sa), &len) == 0) {
        port_ = ntohs(sa.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Failed to signal shutdown\n";
    }
    if (thread_.joinable()) thread_.join();

    {
        std::unique_lock<std::mutex> lock(conn_mutex_);
        conn_cv_.wait(lock, [this]() { return active_connections_ == 0; });
    }

    close_fd(server_fd_);
    close_fd(shutdown_pipe_[0]);
    close_fd(shutdown_pipe_[1]);
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            ++active_connections_;
        }
        std::thread([this, cfd]() {
            handle_connection(cfd);
            ::close(cfd);
            std::lock_guard<std::mutex> lock(conn_mutex_);
            --active_connections_;
            conn_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_connection(int fd) {
    ResponseWriter writer([fd](const std::string& bytes) { return send_all(fd, bytes); });

    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            writer.respond(400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    HttpRequest req;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        writer.respond(400, "text/plain", "Malformed request");
        return;
    }

    if (req.method == "POST") {
        size_t content_len = 0;
        std::string cl = req.header("content-length");
        if (!cl.empty()) {
            try {
                content_len = std::stoul(cl);
            } catch (const std::exception&) {
                writer.respond(400, "text/plain", "Invalid Content-Length");
                return;
            }
        }

        if (content_len > max_body_) {
            writer.respond(413, "text/plain", "Payload too large");
            return;
        }

        req.body = buf.substr(hdr_end + 4);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) return;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error on " << req.path << ": " << e.what() << "\n";
        if (!writer.started()) {
            writer.respond(500, "text/plain", "Internal server error");
        }
    }
}

} // namespace maxproxy
