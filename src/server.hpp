#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace maxproxy {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string path;                           // query string removed
    std::map<std::string, std::string> headers; // names lowercased
    std::string body;

    // Header value, or "" if absent. Name must be lowercase.
    std::string header(const std::string& name) const;
};

// Parse the request line and headers (everything before the blank line).
// Returns false when the request line is malformed.
bool parse_request_head(const std::string& head, HttpRequest& req);

// Writes one response. Either respond() once, or begin_stream(), any number
// of write_chunk() calls and end_stream(). Every response carries the CORS
// headers. All writes return false once the peer has gone away.
class ResponseWriter {
public:
    using Sink = std::function<bool(const std::string& bytes)>;

    explicit ResponseWriter(Sink sink);

    bool respond(int status, const std::string& content_type, const std::string& body);

    bool begin_stream(int status, const std::string& content_type);
    bool write_chunk(const std::string& data);
    bool end_stream();

    bool started() const { return started_; }
    bool failed() const { return failed_; }

private:
    bool send(const std::string& bytes);

    Sink sink_;
    bool started_ = false;
    bool failed_ = false;
};

const char* status_reason(int status);

// Minimal HTTP/1.1 server. One request per connection, each connection served
// on its own thread so long-running streams do not block other callers.
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // max_body: maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string host, uint16_t port, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Bind and start the accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting and wait for in-flight connections to finish.
    void stop();

    // Bound port (differs from the requested one when 0 was given).
    uint16_t port() const { return port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd);

    std::string host_;
    uint16_t    port_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    size_t active_connections_ = 0;
};

} // namespace maxproxy
