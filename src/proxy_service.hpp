#pragma once
#include "credential_store.hpp"
#include "relay.hpp"
#include "server.hpp"
#include <string>

namespace maxproxy {

constexpr const char* kMaxproxyVersion = "3.3.0";

// Routes OpenAI-compatible endpoints onto the relay.
class ProxyService {
public:
    ProxyService(ChatRelay& relay, CredentialStore& credentials);

    void handle(const HttpRequest& req, ResponseWriter& out);

private:
    void handle_health(ResponseWriter& out);
    void handle_chat(const HttpRequest& req, ResponseWriter& out);
    void stream_chat(const ChatRequest& chat, ResponseWriter& out);

    ChatRelay& relay_;
    CredentialStore& credentials_;
};

} // namespace maxproxy
