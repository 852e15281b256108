// UpstreamHttpClient for Linux: POSIX sockets, with OpenSSL for https.
// OpenSSL 1.1+ initialises itself, so construction needs no global setup.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace maxproxy {

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("Invalid upstream URL: " + url);

    result.tls = url.compare(0, scheme_end, "https") == 0;

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = url.substr(host_start, path_start == std::string::npos
                                                       ? std::string::npos
                                                       : path_start - host_start);
    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    result.host = host_port.substr(0, colon);
    if (colon != std::string::npos) {
        result.port = host_port.substr(colon + 1);
    } else {
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    explicit Connection(const UpstreamHttpClient& owner) : owner_(owner) {}
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        if (!connect_tcp(url, timeout_secs)) return false;

        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_) return false;
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx_);
            SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

            ssl_ = SSL_new(ctx_);
            if (!ssl_) return false;
            SSL_set_fd(ssl_, fd_);
            SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
            if (SSL_connect(ssl_) != 1) return false;
        }

        // Body I/O uses 1-second slices so the abort flag is polled.
        set_socket_timeout(1);
        deadline_secs_ = timeout_secs;
        return true;
    }

    // Returns >0 on data, 0 on EOF, -1 on error, abort or overall timeout.
    ssize_t read_some(char* buf, size_t len) {
        long idle = 0;
        while (!owner_.abort_requested()) {
            ssize_t n;
            bool would_block = false;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                would_block = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                              (err == SSL_ERROR_SYSCALL &&
                               (errno == EAGAIN || errno == EWOULDBLOCK));
            } else {
                n = ::recv(fd_, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                would_block = errno == EAGAIN || errno == EWOULDBLOCK;
            }
            if (!would_block) return -1;
            if (++idle > deadline_secs_) return -1;
        }
        return -1;
    }

    bool write_all(const std::string& data) {
        const char* buf = data.data();
        size_t len = data.size();
        while (len > 0) {
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_tcp(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
            }
            if (connected) {
                fcntl(fd_, F_SETFL, flags);
            } else {
                ::close(fd_);
                fd_ = -1;
            }
        }
        freeaddrinfo(res);
        return connected;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    const UpstreamHttpClient& owner_;
    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    long     deadline_secs_ = 300;
};

// ── Response reader ────────────────────────────────────────────

// Buffered reader over a Connection: status line, headers, then a body
// delivered in pieces (dechunked when needed).
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Returns the status code, or 0 if the status line is unusable.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line)) return 0;

        // "HTTP/1.1 200 OK": extract the three-digit code
        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos) return 0;
        long status = 0;
        try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
        catch (const std::exception&) { return 0; }

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = lower(line.substr(0, colon));
            std::string value = lower(line.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                try { content_length_ = std::stoul(value); }
                catch (const std::exception&) { content_length_ = 0; }
            }
        }
        return status;
    }

    // Delivers the body to sink; returns false if the sink asked to stop.
    bool read_body(const BodySink& sink) {
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line) && !size_line.empty()) {
                // Chunk size is hex, may have extensions after ';'
                size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk_size == 0) break;
                if (!forward(chunk_size, sink)) return false;
                std::string crlf;
                read_line(crlf);
            }
            return true;
        }
        if (content_length_ > 0) return forward(content_length_, sink);

        // No framing: read until the server closes.
        for (;;) {
            if (buffer_.empty() && !fill()) return true;
            if (!sink(buffer_.data(), buffer_.size())) return false;
            buffer_.clear();
        }
    }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    // CRLF-terminated line with the terminator stripped.
    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = buffer_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    // Forward exactly n bytes (fewer if the server closes early).
    bool forward(size_t n, const BodySink& sink) {
        while (n > 0) {
            if (buffer_.empty() && !fill()) return true;
            size_t take = std::min(n, buffer_.size());
            if (!sink(buffer_.data(), take)) return false;
            buffer_.erase(0, take);
            n -= take;
        }
        return true;
    }

    Connection& conn_;
    std::string buffer_;
    bool chunked_ = false;
    size_t content_length_ = 0;
};

static std::string build_request(const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── UpstreamHttpClient ─────────────────────────────────────────

UpstreamHttpClient::UpstreamHttpClient() = default;
UpstreamHttpClient::~UpstreamHttpClient() = default;

HttpResponse UpstreamHttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<Header>& headers,
                                      long timeout_seconds) {
    HttpResponse response;
    std::string& out = response.body;
    response.status_code = post_stream(
        url, body, headers,
        [&out](const char* data, size_t len) {
            out.append(data, len);
            return true;
        },
        timeout_seconds).status_code;
    return response;
}

HttpResponse UpstreamHttpClient::post_stream(const std::string& url,
                                             const std::string& body,
                                             const std::vector<Header>& headers,
                                             BodySink sink,
                                             long timeout_seconds) {
    ParsedUrl target;
    try {
        target = parse_url(url);
    } catch (const std::runtime_error&) {
        return {};
    }

    Connection conn(*this);
    if (!conn.open(target, timeout_seconds) ||
        !conn.write_all(build_request(target, body, headers))) {
        return {};
    }

    ResponseReader reader(conn);
    HttpResponse response;
    response.status_code = reader.read_head();
    if (response.status_code != 0) reader.read_body(sink);
    return response;
}

} // namespace maxproxy

#endif // __linux__
