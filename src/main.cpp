#include "config.hpp"
#include "credential_store.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "providers/anthropic.hpp"
#include "proxy_service.hpp"
#include "relay.hpp"
#include "server.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: maxproxy [options]\n"
              << "\n"
              << "OpenAI-compatible chat completions backed by a Claude subscription.\n"
              << "\n"
              << "Options:\n"
              << "  --host ADDR          Listen address (default 127.0.0.1)\n"
              << "  --port PORT          Listen port (default 3456)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment:\n"
              << "  HOST, PORT                 Listen address and port\n"
              << "  CLAUDE_ACCESS_TOKEN        Use this OAuth access token\n"
              << "  CLAUDE_REFRESH_TOKEN       Refresh token for the above\n"
              << "  ANTHROPIC_BASE_URL         Upstream API base URL\n"
              << "  MAXPROXY_CREDENTIALS_FILE  Credential file (default ~/.claude-max-proxy.json)\n";
}

static std::vector<std::unique_ptr<maxproxy::CredentialSource>>
make_sources(const maxproxy::Config& config) {
    std::vector<std::unique_ptr<maxproxy::CredentialSource>> sources;
    sources.push_back(std::make_unique<maxproxy::OverrideCredentialSource>(
        config.credentials.access_token, config.credentials.refresh_token, nullptr));
    sources.push_back(std::make_unique<maxproxy::FileCredentialSource>(
        maxproxy::expand_home(config.credentials.file)));
    sources.push_back(std::make_unique<maxproxy::KeychainCredentialSource>());
    return sources;
}

int main(int argc, char* argv[]) try {
    std::string host;
    int port = 0;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                port = -1;
            }
            if (port <= 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = maxproxy::Config::load();
    if (!host.empty()) config.host = host;
    if (port > 0) config.port = static_cast<uint16_t>(port);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    maxproxy::UpstreamHttpClient http_client;
    http_client.set_abort_flag(&g_shutdown);

    maxproxy::CredentialStoreOptions options;
    options.token_url = config.oauth.token_url;
    options.client_id = config.oauth.client_id;
    options.refresh_window_ms = static_cast<uint64_t>(config.oauth.refresh_window_seconds) * 1000;
    maxproxy::CredentialStore credentials(make_sources(config), http_client, options);

    maxproxy::AnthropicProvider provider(credentials, http_client,
                                         config.upstream.base_url,
                                         config.upstream.timeout_seconds);
    maxproxy::ChatRelay relay(provider, config);
    maxproxy::ProxyService service(relay, credentials);

    maxproxy::HttpServer server(config.host, config.port, config.max_body,
        [&service](const maxproxy::HttpRequest& req, maxproxy::ResponseWriter& out) {
            service.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        return 1;
    }

    std::cout << "maxproxy " << maxproxy::kMaxproxyVersion << "\n"
              << "Listening on http://" << config.host << ":" << server.port() << "\n";
    try {
        auto credential = credentials.resolve();
        std::cout << "Credentials: ok";
        if (!credential.subscription_label.empty()) {
            std::cout << " (" << credential.subscription_label << ")";
        }
        std::cout << "\n";
    } catch (const maxproxy::CredentialError& e) {
        std::cout << "Credentials: " << e.what() << "\n";
    }
    std::cout << "Endpoints: POST /v1/chat/completions, GET /v1/models, GET /health\n"
              << std::flush;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down\n";
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
