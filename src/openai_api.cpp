#include "openai_api.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdint>
#include <iostream>

using json = nlohmann::json;

namespace maxproxy {

namespace {

const char* const kListedModels[] = {"claude-opus-4", "claude-sonnet-4", "claude-haiku-4"};
constexpr uint64_t kModelsCreated = 1700000000;

// Optional string member; present with any other non-null type is a caller error.
std::string string_member(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return "";
    if (!obj[key].is_string()) {
        throw MalformedRequest(std::string(key) + " must be a string");
    }
    return obj[key].get<std::string>();
}

std::vector<ToolCall> parse_tool_calls(const json& arr) {
    std::vector<ToolCall> calls;
    if (!arr.is_array()) return calls;
    for (const auto& tc : arr) {
        if (!tc.is_object()) continue;
        const json& fn = tc.contains("function") && tc["function"].is_object()
            ? tc["function"] : tc;

        ToolCall call;
        call.id = string_member(tc, "id");
        call.name = string_member(fn, "name");
        if (call.name.empty()) {
            throw MalformedRequest("tool_calls entry missing function name");
        }
        if (fn.contains("arguments")) {
            const auto& args = fn["arguments"];
            call.arguments = args.is_string() ? args.get<std::string>() : args.dump();
        } else {
            call.arguments = "{}";
        }
        calls.push_back(std::move(call));
    }
    return calls;
}

ToolSpec parse_tool(const json& t) {
    if (!t.is_object()) throw MalformedRequest("tools entries must be objects");
    const json& fn = t.contains("function") && t["function"].is_object() ? t["function"] : t;

    ToolSpec spec;
    spec.name = string_member(fn, "name");
    if (spec.name.empty()) throw MalformedRequest("tool definition missing name");
    if (fn.contains("description") && fn["description"].is_string()) {
        spec.description = fn["description"].get<std::string>();
    }
    spec.parameters_json = fn.contains("parameters") ? fn["parameters"].dump() : "{}";
    return spec;
}

} // namespace

std::string extract_text(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (content.is_array()) {
        std::vector<std::string> parts;
        for (const auto& part : content) {
            if (part.is_object() && part.contains("type") && part["type"] == "text" &&
                part.contains("text") && part["text"].is_string()) {
                parts.push_back(part["text"].get<std::string>());
            }
        }
        return join(parts, "\n");
    }
    if (content.is_object() && content.contains("text") && content["text"].is_string()) {
        return content["text"].get<std::string>();
    }
    return "";
}

ChatRequest parse_chat_request(const json& body) {
    if (!body.is_object()) throw MalformedRequest("request body must be a JSON object");
    if (!body.contains("messages") || !body["messages"].is_array()) {
        throw MalformedRequest("messages required");
    }
    if (!body.contains("model") || !body["model"].is_string()) {
        throw MalformedRequest("model required");
    }

    ChatRequest req;
    req.model = body["model"].get<std::string>();

    for (const auto& m : body["messages"]) {
        if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) {
            throw MalformedRequest("each message needs a string role");
        }
        std::string role_name = m["role"].get<std::string>();
        auto role = role_from_string(role_name);
        if (!role) {
            std::cerr << "[convert] Dropping message with unknown role: " << role_name << "\n";
            continue;
        }

        ChatMessage msg;
        msg.role = *role;
        msg.content = m.contains("content") ? extract_text(m["content"]) : "";
        if (msg.role == Role::Assistant && m.contains("tool_calls")) {
            msg.tool_calls = parse_tool_calls(m["tool_calls"]);
        }
        if (msg.role == Role::Tool && m.contains("tool_call_id") && m["tool_call_id"].is_string()) {
            msg.tool_call_id = m["tool_call_id"].get<std::string>();
        }
        req.messages.push_back(std::move(msg));
    }

    if (body.contains("tools") && !body["tools"].is_null()) {
        if (!body["tools"].is_array()) throw MalformedRequest("tools must be an array");
        for (const auto& t : body["tools"]) {
            req.tools.push_back(parse_tool(t));
        }
    }

    if (body.contains("stream") && body["stream"].is_boolean()) {
        req.stream = body["stream"].get<bool>();
    }
    if (body.contains("temperature") && body["temperature"].is_number()) {
        req.temperature = body["temperature"].get<double>();
    }
    if (body.contains("max_tokens") && !body["max_tokens"].is_null()) {
        const auto& mt = body["max_tokens"];
        bool valid = mt.is_number_unsigned()
            ? mt.get<uint64_t>() > 0 && mt.get<uint64_t>() <= UINT32_MAX
            : mt.is_number_integer() && mt.get<int64_t>() > 0 && mt.get<int64_t>() <= UINT32_MAX;
        if (!valid) throw MalformedRequest("max_tokens must be a positive integer");
        req.max_tokens = mt.get<uint32_t>();
    }
    return req;
}

std::string new_completion_id() {
    return "chatcmpl-" + generate_id();
}

json tool_calls_json(const std::vector<ToolCall>& calls) {
    json arr = json::array();
    for (const auto& tc : calls) {
        arr.push_back({
            {"id", tc.id},
            {"type", "function"},
            {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
        });
    }
    return arr;
}

json completion_json(const ChatResponse& response, const std::string& id, uint64_t created) {
    json message = {{"role", "assistant"}};
    message["content"] = response.content ? json(*response.content) : json(nullptr);
    if (response.has_tool_calls()) {
        message["tool_calls"] = tool_calls_json(response.tool_calls);
    }

    return {
        {"id", id},
        {"object", "chat.completion"},
        {"created", created},
        {"model", response.model},
        {"choices", json::array({
            {{"index", 0}, {"message", message}, {"finish_reason", response.finish_reason()}}
        })},
        {"usage", {
            {"prompt_tokens", response.usage.prompt_tokens},
            {"completion_tokens", response.usage.completion_tokens},
            {"total_tokens", response.usage.total_tokens}
        }}
    };
}

json chunk_json(const std::string& id, uint64_t created, const std::string& model,
                const json& delta, const std::optional<std::string>& finish_reason) {
    json choice = {{"index", 0}, {"delta", delta}};
    choice["finish_reason"] = finish_reason ? json(*finish_reason) : json(nullptr);
    return {
        {"id", id},
        {"object", "chat.completion.chunk"},
        {"created", created},
        {"model", model},
        {"choices", json::array({choice})}
    };
}

json error_json(const std::string& message, std::optional<long> status) {
    json err = {{"message", message}};
    if (status) err["status"] = *status;
    return {{"error", err}};
}

json models_json() {
    json data = json::array();
    for (const char* id : kListedModels) {
        data.push_back({
            {"id", id},
            {"object", "model"},
            {"created", kModelsCreated},
            {"owned_by", "anthropic"}
        });
    }
    return {{"object", "list"}, {"data", data}};
}

} // namespace maxproxy
