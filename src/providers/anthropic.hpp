#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "../credential_store.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace maxproxy {

// Anthropic Messages API over an OAuth bearer token.
class AnthropicProvider : public Provider {
public:
    AnthropicProvider(CredentialStore& credentials, HttpClient& http,
                      const std::string& base_url,
                      long timeout_seconds = 300);

    UpstreamReply send(const UpstreamRequest& request) override;

    UpstreamReply send_stream(const UpstreamRequest& request,
                              const TextDeltaCallback& on_delta) override;

    std::string provider_name() const override { return "anthropic"; }

    static nlohmann::json build_request(const UpstreamRequest& request);

private:
    std::vector<Header> build_headers();
    std::string messages_url() const { return base_url_ + "/messages"; }

    CredentialStore& credentials_;
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr const char* OAUTH_BETA = "oauth-2025-04-20";
    static constexpr size_t MAX_ERROR_BODY = 64 * 1024;
};

} // namespace maxproxy
