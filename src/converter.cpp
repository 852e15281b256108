#include "converter.hpp"
#include "tool_protocol.hpp"
#include "util.hpp"

namespace maxproxy {

const char* const kFixedSystemPrompt =
    "You are Claude Code, Anthropic's official CLI for Claude.";

namespace {

std::string assistant_content(const ChatMessage& msg) {
    std::string markup = encode_tool_calls(msg.tool_calls);
    if (markup.empty()) return msg.content;
    if (trim(msg.content).empty()) return markup;
    return msg.content + "\n" + markup;
}

} // namespace

UpstreamPrompt convert(const std::vector<ChatMessage>& messages,
                       const std::vector<ToolSpec>& tools) {
    UpstreamPrompt prompt;
    prompt.system = kFixedSystemPrompt;

    // Partition by role
    std::vector<std::string> system_texts;
    std::vector<UpstreamTurn> turns;
    for (const auto& msg : messages) {
        switch (msg.role) {
            case Role::System:
                if (!msg.content.empty()) system_texts.push_back(msg.content);
                break;
            case Role::User:
                if (!msg.content.empty()) turns.push_back({Role::User, msg.content});
                break;
            case Role::Assistant: {
                std::string content = assistant_content(msg);
                if (!trim(content).empty()) turns.push_back({Role::Assistant, content});
                break;
            }
            case Role::Tool:
                turns.push_back({Role::User, "[Tool Result: " +
                                 msg.tool_call_id.value_or("") + "]\n" + msg.content});
                break;
        }
    }

    // Merge same-role neighbours
    for (auto& turn : turns) {
        if (!prompt.turns.empty() && prompt.turns.back().role == turn.role) {
            prompt.turns.back().content += "\n\n" + turn.content;
        } else {
            prompt.turns.push_back(std::move(turn));
        }
    }

    // Inject identity and tool context into the first user turn
    std::string context = build_context_block(system_texts, tools);
    if (!context.empty()) {
        for (auto& turn : prompt.turns) {
            if (turn.role == Role::User) {
                turn.content = context + "[User Message]\n" + turn.content;
                break;
            }
        }
    }

    return prompt;
}

} // namespace maxproxy
