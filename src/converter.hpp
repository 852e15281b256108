#pragma once
#include "provider.hpp"
#include <string>
#include <vector>

namespace maxproxy {

// The only system prompt the upstream accepts for OAuth credentials.
extern const char* const kFixedSystemPrompt;

struct UpstreamPrompt {
    std::string system;
    std::vector<UpstreamTurn> turns;
};

// Map the caller's conversation onto the upstream's two-role model.
// Caller system messages and tool definitions travel inside the first user
// turn; prior tool calls are replayed as the markup the model emitted.
UpstreamPrompt convert(const std::vector<ChatMessage>& messages,
                       const std::vector<ToolSpec>& tools);

} // namespace maxproxy
