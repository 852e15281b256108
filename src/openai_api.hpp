#pragma once
#include "provider.hpp"
#include "relay.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace maxproxy {

// ── Request parsing ──────────────────────────────────────────────

// Reduce message content to text: strings pass through, part arrays are
// joined on their text parts, objects yield their "text" member.
std::string extract_text(const nlohmann::json& content);

// Validate and parse a /v1/chat/completions body. Throws MalformedRequest.
ChatRequest parse_chat_request(const nlohmann::json& body);

// ── Response shapes ──────────────────────────────────────────────

std::string new_completion_id();

nlohmann::json tool_calls_json(const std::vector<ToolCall>& calls);

nlohmann::json completion_json(const ChatResponse& response,
                               const std::string& id, uint64_t created);

// One chat.completion.chunk frame payload. A null finish_reason is sent
// when none is given.
nlohmann::json chunk_json(const std::string& id, uint64_t created,
                          const std::string& model, const nlohmann::json& delta,
                          const std::optional<std::string>& finish_reason = std::nullopt);

nlohmann::json error_json(const std::string& message,
                          std::optional<long> status = std::nullopt);

// Models advertised by GET /v1/models.
nlohmann::json models_json();

} // namespace maxproxy
