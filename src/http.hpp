#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace maxproxy {

using Header = std::pair<std::string, std::string>;

// status_code stays 0 when no status line was received (DNS, connect,
// TLS or write failure).
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Receives response body bytes as they arrive. Return false to end the
// transfer early.
using BodySink = std::function<bool(const char* data, size_t len)>;

// Outbound HTTP seam; the token endpoint and the Messages API both go
// through it so tests can substitute a scripted client.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    // Like post(), but the body goes to sink instead of the response.
    virtual HttpResponse post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     BodySink sink,
                                     long timeout_seconds = 300) = 0;
};

// Production client. On Linux it is defined in http_socket.cpp (POSIX
// sockets and OpenSSL); elsewhere in http.cpp (libcurl). CMakeLists.txt
// compiles exactly one of them.
class UpstreamHttpClient : public HttpClient {
public:
    UpstreamHttpClient();
    ~UpstreamHttpClient() override;
    UpstreamHttpClient(const UpstreamHttpClient&) = delete;
    UpstreamHttpClient& operator=(const UpstreamHttpClient&) = delete;

    // In-flight transfers give up within about a second of *flag turning true.
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             BodySink sink,
                             long timeout_seconds = 300) override;

    bool abort_requested() const {
        return abort_flag_ && abort_flag_->load(std::memory_order_relaxed);
    }

private:
    const std::atomic<bool>* abort_flag_ = nullptr;
};

} // namespace maxproxy
