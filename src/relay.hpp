#pragma once
#include "provider.hpp"
#include "config.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace maxproxy {

// A parsed chat-completion call from the caller.
struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::vector<ToolSpec> tools;
    bool stream = false;
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
};

enum class StreamEventKind { Content, Finish, Error };

struct StreamEvent {
    StreamEventKind kind = StreamEventKind::Content;
    std::string content;              // Content
    std::vector<ToolCall> tool_calls; // Finish
    std::string finish_reason;        // Finish
    long status = 0;                  // Error (0 = no upstream status)
    std::string message;              // Error
};

// Receives stream events in order. Return false when the caller is gone.
using StreamSink = std::function<bool(const StreamEvent& event)>;

class ChatRelay {
public:
    ChatRelay(Provider& provider, const Config& config);

    // Single-shot call. Throws CredentialError, UpstreamError.
    ChatResponse complete(const ChatRequest& request);

    // Incremental call. Upstream failures become one Error event; credential
    // failures are thrown before any event is emitted.
    void stream(const ChatRequest& request, const StreamSink& sink);

    UpstreamRequest prepare(const ChatRequest& request) const;

private:
    ChatResponse complete_prepared(const ChatRequest& request,
                                   const UpstreamRequest& upstream);

    Provider& provider_;
    const Config& config_;
};

} // namespace maxproxy
