// UpstreamHttpClient on top of libcurl, for builds outside Linux.
#include "http.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace maxproxy {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct Transfer {
    const UpstreamHttpClient* client;
    const BodySink* sink;
    bool sink_stopped = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;
    if (transfer->sink_stopped) return 0;
    if (!(*transfer->sink)(ptr, n)) {
        transfer->sink_stopped = true;
        return 0;
    }
    return n;
}

// Polled by curl about once a second; non-zero cancels the transfer.
int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(clientp);
    return transfer->client->abort_requested() ? 1 : 0;
}

HeaderList make_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    return HeaderList(list);
}

} // namespace

UpstreamHttpClient::UpstreamHttpClient() {
    curl_global_init(CURL_GLOBAL_ALL);
}

UpstreamHttpClient::~UpstreamHttpClient() {
    curl_global_cleanup();
}

HttpResponse UpstreamHttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<Header>& headers,
                                      long timeout_seconds) {
    std::string collected;
    HttpResponse response = post_stream(
        url, body, headers,
        [&collected](const char* data, size_t len) {
            collected.append(data, len);
            return true;
        },
        timeout_seconds);
    response.body = std::move(collected);
    return response;
}

HttpResponse UpstreamHttpClient::post_stream(const std::string& url,
                                             const std::string& body,
                                             const std::vector<Header>& headers,
                                             BodySink sink,
                                             long timeout_seconds) {
    EasyHandle easy(curl_easy_init());
    if (!easy) return {};
    HeaderList header_list = make_header_list(headers);
    Transfer transfer{this, &sink};

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_seconds);
    // Handler threads must not receive SIGALRM from the resolver
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);

    CURLcode rc = curl_easy_perform(h);
    HttpResponse response;
    bool got_status = rc == CURLE_OK || (rc == CURLE_WRITE_ERROR && transfer.sink_stopped);
    if (got_status) {
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    }
    return response;
}

} // namespace maxproxy
