#pragma once
#include <string>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>

namespace maxproxy {

struct UpstreamConfig {
    std::string base_url = "https://api.anthropic.com/v1";
    uint32_t default_max_tokens = 8192;
    long timeout_seconds = 300;
};

struct OAuthConfig {
    std::string token_url;             // empty = built-in token endpoint
    std::string client_id;             // empty = built-in client id
    uint32_t refresh_window_seconds = 300;
};

struct CredentialsConfig {
    std::string file = "~/.claude-max-proxy.json";
    std::string access_token;          // out-of-band override
    std::string refresh_token;
};

struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = 3456;
    uint32_t max_body = 10 * 1024 * 1024;

    UpstreamConfig upstream;
    OAuthConfig oauth;
    CredentialsConfig credentials;

    // Caller-facing model alias → upstream model id
    std::map<std::string, std::string> models;
    std::string default_model = "claude-sonnet-4";

    // Load from ~/.maxproxy/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config document on top of the current values
    void apply_json(const nlohmann::json& j);

    // Map a caller-supplied model name to the upstream model id.
    // Unknown names fall back to the default model's mapping.
    std::string resolve_model(const std::string& requested) const;
};

} // namespace maxproxy
