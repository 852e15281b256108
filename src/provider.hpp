#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace maxproxy {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

std::optional<Role> role_from_string(const std::string& name);

// Tool definition supplied by the caller. An empty description means none was given.
struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters, passed through opaquely
};

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // serialized JSON object
};

// One message of the caller's conversation, content already reduced to text.
struct ChatMessage {
    Role role;
    std::string content;
    std::vector<ToolCall> tool_calls;        // assistant only
    std::optional<std::string> tool_call_id; // tool only
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

// The reply handed back to the caller after decoding.
struct ChatResponse {
    std::optional<std::string> content;
    std::vector<ToolCall> tool_calls;
    TokenUsage usage;
    std::string model;

    bool has_tool_calls() const { return !tool_calls.empty(); }
    const char* finish_reason() const { return has_tool_calls() ? "tool_calls" : "stop"; }
};

// ── Upstream (two-role) model ───────────────────────────────────

struct UpstreamTurn {
    Role role; // Role::User or Role::Assistant only
    std::string content;
};

struct UpstreamRequest {
    std::string model;
    std::string system;
    std::vector<UpstreamTurn> turns;
    uint32_t max_tokens = 8192;
    std::optional<double> temperature;
};

struct UpstreamReply {
    std::string text;
    TokenUsage usage;
    std::string model;
    std::string stop_reason;
    bool cancelled = false; // streaming consumer stopped early
};

// Callback for streaming text deltas. Return false to abort.
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

// The vendor chat endpoint the relay talks to.
class Provider {
public:
    virtual ~Provider() = default;

    virtual UpstreamReply send(const UpstreamRequest& request) = 0;

    virtual UpstreamReply send_stream(const UpstreamRequest& request,
                                      const TextDeltaCallback& on_delta) = 0;

    virtual std::string provider_name() const = 0;
};

} // namespace maxproxy
