#include "anthropic.hpp"
#include "sse.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace maxproxy {

namespace {

void read_usage(const json& usage, TokenUsage& out) {
    if (usage.contains("input_tokens") && usage["input_tokens"].is_number_unsigned())
        out.prompt_tokens = usage["input_tokens"].get<uint32_t>();
    if (usage.contains("output_tokens") && usage["output_tokens"].is_number_unsigned())
        out.completion_tokens = usage["output_tokens"].get<uint32_t>();
    out.total_tokens = out.prompt_tokens + out.completion_tokens;
}

[[noreturn]] void throw_upstream(long status, const std::string& body) {
    std::cerr << "[relay] Upstream error (HTTP " << status << "): " << body << "\n";
    throw UpstreamError(status, body);
}

} // namespace

AnthropicProvider::AnthropicProvider(CredentialStore& credentials, HttpClient& http,
                                     const std::string& base_url,
                                     long timeout_seconds)
    : credentials_(credentials), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url),
      timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json AnthropicProvider::build_request(const UpstreamRequest& request) {
    json body;
    body["model"] = request.model;
    body["max_tokens"] = request.max_tokens;
    body["system"] = request.system;
    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }

    json msgs = json::array();
    for (const auto& turn : request.turns) {
        msgs.push_back({{"role", role_to_string(turn.role)}, {"content", turn.content}});
    }
    body["messages"] = msgs;
    return body;
}

std::vector<Header> AnthropicProvider::build_headers() {
    Credential credential = credentials_.resolve();
    return {
        {"Authorization", "Bearer " + credential.access_token},
        {"anthropic-version", API_VERSION},
        {"anthropic-beta", OAUTH_BETA},
        {"Content-Type", "application/json"}
    };
}

UpstreamReply AnthropicProvider::send(const UpstreamRequest& request) {
    auto headers = build_headers();
    std::string body = build_request(request).dump();

    auto response = http_.post(messages_url(), body, headers, timeout_seconds_);
    if (response.status_code == 0) {
        throw std::runtime_error("Could not reach upstream at " + base_url_);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw_upstream(response.status_code, response.body);
    }

    auto resp = json::parse(response.body);

    UpstreamReply reply;
    reply.model = resp.value("model", request.model);
    reply.stop_reason = resp.value("stop_reason", "");

    // Text blocks are joined; other block types carry nothing we relay.
    if (resp.contains("content") && resp["content"].is_array()) {
        bool first = true;
        for (const auto& block : resp["content"]) {
            if (block.value("type", "") != "text") continue;
            if (!first) reply.text += "\n";
            reply.text += block.value("text", "");
            first = false;
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        read_usage(resp["usage"], reply.usage);
    }
    return reply;
}

UpstreamReply AnthropicProvider::send_stream(const UpstreamRequest& request,
                                             const TextDeltaCallback& on_delta) {
    auto headers = build_headers();
    json req = build_request(request);
    req["stream"] = true;
    std::string body = req.dump();

    UpstreamReply reply;
    reply.model = request.model;

    SSEParser parser;
    std::string raw_head; // kept for error bodies
    bool stream_error = false;
    bool stopped = false;
    std::string error_body;

    auto on_event = [&](const SSEEvent& sse) -> bool {
        if (sse.event == "error") {
            stream_error = true;
            error_body = sse.data;
            return false;
        }
        if (sse.data.empty()) return true;

        json payload;
        try {
            payload = json::parse(sse.data);
        } catch (const json::exception&) {
            return true; // keep-alive or partial garbage
        }

        if (sse.event == "message_start" && payload.contains("message")) {
            const auto& msg = payload["message"];
            reply.model = msg.value("model", request.model);
            if (msg.contains("usage") && msg["usage"].is_object()) {
                read_usage(msg["usage"], reply.usage);
            }
        } else if (sse.event == "content_block_delta" && payload.contains("delta")) {
            const auto& delta = payload["delta"];
            if (delta.value("type", "") != "text_delta") return true;
            std::string text = delta.value("text", "");
            if (text.empty()) return true;
            reply.text += text;
            if (on_delta && !on_delta(text)) {
                reply.cancelled = true;
                return false;
            }
        } else if (sse.event == "message_delta") {
            if (payload.contains("delta") && payload["delta"].is_object()) {
                reply.stop_reason = payload["delta"].value("stop_reason", reply.stop_reason);
            }
            if (payload.contains("usage") && payload["usage"].is_object()) {
                const auto& usage = payload["usage"];
                reply.usage.completion_tokens = usage.value("output_tokens", reply.usage.completion_tokens);
                reply.usage.total_tokens = reply.usage.prompt_tokens + reply.usage.completion_tokens;
            }
        } else if (sse.event == "message_stop") {
            stopped = true;
            return false;
        }
        return true;
    };

    auto http_response = http_.post_stream(
        messages_url(), body, headers,
        [&](const char* data, size_t len) -> bool {
            if (raw_head.size() < MAX_ERROR_BODY) {
                raw_head.append(data, std::min(len, MAX_ERROR_BODY - raw_head.size()));
            }
            return parser.feed(std::string(data, len), on_event);
        },
        timeout_seconds_);

    if (http_response.status_code == 0) {
        throw std::runtime_error("Could not reach upstream at " + base_url_);
    }
    if (http_response.status_code < 200 || http_response.status_code >= 300) {
        throw_upstream(http_response.status_code, raw_head);
    }
    if (stream_error) {
        // Mid-stream failures have no HTTP status of their own
        throw_upstream(502, error_body);
    }
    if (!reply.cancelled && !stopped) {
        parser.finish(on_event);
        if (stream_error) throw_upstream(502, error_body);
        if (!reply.cancelled && !stopped) {
            // Reset, read timeout or EOF: the text so far is truncated
            throw_upstream(502, "Upstream stream ended before message_stop");
        }
    }

    return reply;
}

} // namespace maxproxy
