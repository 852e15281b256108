#include "proxy_service.hpp"
#include "errors.hpp"
#include "openai_api.hpp"
#include "providers/sse.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace maxproxy {

namespace {

const char* const kJson = "application/json";

void send_json(ResponseWriter& out, int status, const json& body) {
    out.respond(status, kJson, body.dump());
}

void send_error(ResponseWriter& out, int status, const std::string& message) {
    send_json(out, status, error_json(message));
}

int http_status(long upstream_status) {
    if (upstream_status < 100 || upstream_status > 599) return 502;
    return static_cast<int>(upstream_status);
}

} // namespace

ProxyService::ProxyService(ChatRelay& relay, CredentialStore& credentials)
    : relay_(relay), credentials_(credentials) {}

void ProxyService::handle(const HttpRequest& req, ResponseWriter& out) {
    if (req.method == "OPTIONS") {
        out.respond(204, "", "");
        return;
    }
    if (req.method == "GET" && (req.path == "/" || req.path == "/health")) {
        handle_health(out);
        return;
    }
    if (req.method == "GET" && req.path == "/v1/models") {
        send_json(out, 200, models_json());
        return;
    }
    if (req.method == "POST" && req.path == "/v1/chat/completions") {
        handle_chat(req, out);
        return;
    }
    send_error(out, 404, "Not found");
}

void ProxyService::handle_health(ResponseWriter& out) {
    try {
        credentials_.resolve();
        send_json(out, 200, {
            {"status", "ok"},
            {"version", kMaxproxyVersion},
            {"mode", "xml-filtered"},
            {"features", {"oauth", "tools", "empty-msg-fix"}}
        });
    } catch (const CredentialError& e) {
        send_json(out, 200, {
            {"status", "error"},
            {"version", kMaxproxyVersion},
            {"error", e.what()}
        });
    }
}

void ProxyService::handle_chat(const HttpRequest& req, ResponseWriter& out) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error&) {
        send_error(out, 400, "Invalid JSON body");
        return;
    }

    ChatRequest chat;
    try {
        chat = parse_chat_request(body);
    } catch (const MalformedRequest& e) {
        send_error(out, 400, e.what());
        return;
    }

    try {
        if (chat.stream) {
            stream_chat(chat, out);
            return;
        }
        ChatResponse response = relay_.complete(chat);
        send_json(out, 200, completion_json(response, new_completion_id(), epoch_seconds()));
    } catch (const CredentialError& e) {
        std::cerr << "[server] Credential error: " << e.what() << "\n";
        if (!out.started()) send_error(out, 401, e.what());
    } catch (const UpstreamError& e) {
        if (!out.started()) send_error(out, http_status(e.status()), e.body());
    } catch (const std::exception& e) {
        std::cerr << "[server] Chat request failed: " << e.what() << "\n";
        if (!out.started()) send_error(out, 500, e.what());
    }
}

void ProxyService::stream_chat(const ChatRequest& chat, ResponseWriter& out) {
    const std::string id = new_completion_id();
    const uint64_t created = epoch_seconds();

    auto emit = [&](const json& payload) {
        if (!out.started() && !out.begin_stream(200, "text/event-stream")) return false;
        return out.write_chunk(sse_frame(payload.dump()));
    };

    relay_.stream(chat, [&](const StreamEvent& ev) -> bool {
        switch (ev.kind) {
            case StreamEventKind::Content:
                return emit(chunk_json(id, created, chat.model, {{"content", ev.content}}));
            case StreamEventKind::Finish: {
                json delta = json::object();
                if (!ev.tool_calls.empty()) {
                    json calls = tool_calls_json(ev.tool_calls);
                    for (size_t i = 0; i < calls.size(); ++i) calls[i]["index"] = i;
                    delta["tool_calls"] = calls;
                }
                return emit(chunk_json(id, created, chat.model, delta, ev.finish_reason));
            }
            case StreamEventKind::Error: {
                std::optional<long> status;
                if (ev.status != 0) status = ev.status;
                return emit(error_json(ev.message, status));
            }
        }
        return true;
    });

    if (!out.started()) out.begin_stream(200, "text/event-stream");
    if (out.failed()) return;
    out.write_chunk(sse_frame("[DONE]"));
    out.end_stream();
}

} // namespace maxproxy
