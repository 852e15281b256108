#include "relay.hpp"
#include "converter.hpp"
#include "errors.hpp"
#include "tool_protocol.hpp"
#include <iostream>

namespace maxproxy {

namespace {

void log_call(const char* mode, const UpstreamRequest& upstream, size_t tools) {
    std::cerr << "[relay] " << mode << " model=" << upstream.model
              << " tools=" << tools << " msgs=" << upstream.turns.size() << "\n";
}

StreamEvent error_event(long status, const std::string& message) {
    StreamEvent ev;
    ev.kind = StreamEventKind::Error;
    ev.status = status;
    ev.message = message;
    return ev;
}

} // namespace

ChatRelay::ChatRelay(Provider& provider, const Config& config)
    : provider_(provider), config_(config) {}

UpstreamRequest ChatRelay::prepare(const ChatRequest& request) const {
    UpstreamPrompt prompt = convert(request.messages, request.tools);

    UpstreamRequest upstream;
    upstream.model = config_.resolve_model(request.model);
    upstream.system = std::move(prompt.system);
    upstream.turns = std::move(prompt.turns);
    upstream.max_tokens = request.max_tokens.value_or(config_.upstream.default_max_tokens);
    upstream.temperature = request.temperature;
    return upstream;
}

ChatResponse ChatRelay::complete(const ChatRequest& request) {
    UpstreamRequest upstream = prepare(request);
    log_call("SYNC", upstream, request.tools.size());
    return complete_prepared(request, upstream);
}

ChatResponse ChatRelay::complete_prepared(const ChatRequest& request,
                                          const UpstreamRequest& upstream) {
    UpstreamReply reply = provider_.send(upstream);
    DecodedReply decoded = decode_reply(reply.text);

    ChatResponse response;
    response.content = std::move(decoded.content);
    response.tool_calls = std::move(decoded.tool_calls);
    response.usage = reply.usage;
    response.model = request.model;
    return response;
}

void ChatRelay::stream(const ChatRequest& request, const StreamSink& sink) {
    UpstreamRequest upstream = prepare(request);
    log_call("STREAM", upstream, request.tools.size());

    try {
        if (!request.tools.empty()) {
            // Markup must be seen whole before it can be stripped, so tool
            // calls are fetched in one piece and replayed as two events.
            ChatResponse response = complete_prepared(request, upstream);

            if (response.content) {
                StreamEvent content;
                content.kind = StreamEventKind::Content;
                content.content = *response.content;
                if (!sink(content)) return;
            }

            StreamEvent finish;
            finish.kind = StreamEventKind::Finish;
            finish.finish_reason = response.finish_reason();
            finish.tool_calls = std::move(response.tool_calls);
            sink(finish);
            return;
        }

        UpstreamReply reply = provider_.send_stream(upstream, [&](const std::string& delta) {
            StreamEvent ev;
            ev.kind = StreamEventKind::Content;
            ev.content = delta;
            return sink(ev);
        });

        if (reply.cancelled) {
            std::cerr << "[relay] Caller disconnected, upstream stream closed\n";
            return;
        }

        StreamEvent finish;
        finish.kind = StreamEventKind::Finish;
        finish.finish_reason = "stop";
        sink(finish);
    } catch (const CredentialError&) {
        throw;
    } catch (const UpstreamError& e) {
        sink(error_event(e.status(), e.body()));
    } catch (const std::exception& e) {
        std::cerr << "[relay] Stream failed: " << e.what() << "\n";
        sink(error_event(0, e.what()));
    }
}

} // namespace maxproxy
