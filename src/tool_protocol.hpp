#pragma once
#include "provider.hpp"
#include <optional>
#include <string>
#include <vector>

namespace maxproxy {

// Instruction block teaching the model the invocation markup.
extern const char* const kToolUsageInstructions;

// Context prepended to the first user turn: the caller's system texts and,
// when tools are declared, their list plus the usage instructions.
// Returns an empty string when there is nothing to inject.
std::string build_context_block(const std::vector<std::string>& system_texts,
                                const std::vector<ToolSpec>& tools);

// Render tool calls as one <function_calls> block. Output depends only on
// names and arguments, so replaying the same calls yields identical text.
std::string encode_tool_calls(const std::vector<ToolCall>& calls);

struct DecodedReply {
    std::optional<std::string> content; // absent for tool-only replies
    std::vector<ToolCall> tool_calls;
};

// Extract <function_calls> blocks from model output and strip them from the
// visible text. Malformed spans are left in place and scanning continues.
DecodedReply decode_reply(const std::string& text);

} // namespace maxproxy
