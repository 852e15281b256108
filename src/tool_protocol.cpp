#include "tool_protocol.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace maxproxy {

const char* const kToolUsageInstructions =
    "When you need to use a tool, output XML:\n"
    "<function_calls>\n"
    "<invoke name=\"TOOL_NAME\">\n"
    "<parameter name=\"PARAM\">VALUE</parameter>\n"
    "</invoke>\n"
    "</function_calls>\n"
    "Do NOT show the XML to the user or explain it. Just use it silently.\n\n";

namespace {

const std::string kBlockOpen = "<function_calls>";
const std::string kBlockClose = "</function_calls>";
const std::string kInvokeOpen = "<invoke";
const std::string kInvokeClose = "</invoke>";
const std::string kParamOpen = "<parameter";
const std::string kParamClose = "</parameter>";

// An opening tag of the form <tag name="...">, located inside some text.
struct OpenTag {
    size_t start = std::string::npos; // position of '<'
    size_t body = std::string::npos;  // first position after '>'
    std::string name;                 // empty when the attribute is missing
};

// Find the next `<tag ...>` at or after pos. A prefix match that continues
// with another identifier character (e.g. <invoked>) is not a tag.
OpenTag find_open_tag(const std::string& text, const std::string& tag, size_t pos) {
    OpenTag result;
    while (true) {
        size_t start = text.find(tag, pos);
        if (start == std::string::npos) return result;
        size_t after = start + tag.size();
        if (after < text.size() && text[after] != '>' &&
            text[after] != ' ' && text[after] != '\t' &&
            text[after] != '\n' && text[after] != '\r') {
            pos = after;
            continue;
        }
        size_t gt = text.find('>', after);
        if (gt == std::string::npos) return result;

        result.start = start;
        result.body = gt + 1;

        std::string attrs = text.substr(after, gt - after);
        const std::string key = "name=\"";
        size_t n = attrs.find(key);
        if (n != std::string::npos) {
            size_t value_start = n + key.size();
            size_t quote = attrs.find('"', value_start);
            if (quote != std::string::npos) {
                result.name = attrs.substr(value_start, quote - value_start);
            }
        }
        return result;
    }
}

// Collect <parameter> elements into a JSON object (last write wins).
nlohmann::json parse_parameters(const std::string& body) {
    nlohmann::json params = nlohmann::json::object();
    size_t pos = 0;
    while (pos < body.size()) {
        OpenTag tag = find_open_tag(body, kParamOpen, pos);
        if (tag.start == std::string::npos) break;

        size_t close = body.find(kParamClose, tag.body);
        size_t next = find_open_tag(body, kParamOpen, tag.body).start;
        if (tag.name.empty() || close == std::string::npos ||
            (next != std::string::npos && next < close)) {
            pos = tag.body; // malformed: skip the open tag only
            continue;
        }

        params[tag.name] = body.substr(tag.body, close - tag.body);
        pos = close + kParamClose.size();
    }
    return params;
}

std::string new_call_id(std::unordered_set<std::string>& used) {
    while (true) {
        std::string id = "call_" + generate_id().substr(0, 8);
        if (used.insert(id).second) return id;
    }
}

void parse_invokes(const std::string& block, std::vector<ToolCall>& out,
                   std::unordered_set<std::string>& used_ids) {
    size_t pos = 0;
    while (pos < block.size()) {
        OpenTag tag = find_open_tag(block, kInvokeOpen, pos);
        if (tag.start == std::string::npos) break;

        size_t close = block.find(kInvokeClose, tag.body);
        size_t next = find_open_tag(block, kInvokeOpen, tag.body).start;
        if (tag.name.empty() || close == std::string::npos ||
            (next != std::string::npos && next < close)) {
            pos = tag.body;
            continue;
        }

        ToolCall call;
        call.id = new_call_id(used_ids);
        call.name = tag.name;
        call.arguments = parse_parameters(block.substr(tag.body, close - tag.body)).dump();
        out.push_back(std::move(call));
        pos = close + kInvokeClose.size();
    }
}

} // namespace

std::string build_context_block(const std::vector<std::string>& system_texts,
                                const std::vector<ToolSpec>& tools) {
    std::string context;
    if (!system_texts.empty()) {
        context += "[Assistant Identity]\n" + join(system_texts, "\n") + "\n\n";
    }
    if (!tools.empty()) {
        std::vector<std::string> lines;
        lines.reserve(tools.size());
        for (const auto& tool : tools) {
            lines.push_back("- " + tool.name + ": " +
                            (tool.description.empty() ? "No description" : tool.description));
        }
        context += "[Available Tools]\n" + join(lines, "\n") +
                   "\n\n[Tool Usage]\n" + kToolUsageInstructions;
    }
    return context;
}

std::string encode_tool_calls(const std::vector<ToolCall>& calls) {
    if (calls.empty()) return "";

    std::string out = kBlockOpen + "\n";
    for (const auto& call : calls) {
        out += "<invoke name=\"" + call.name + "\">\n";

        nlohmann::json args;
        try {
            args = nlohmann::json::parse(call.arguments);
        } catch (const nlohmann::json::exception&) {
            args = nullptr;
        }
        if (!args.is_object()) {
            std::cerr << "[convert] Arguments of " << call.name << " (" << call.id
                      << ") are not a JSON object; replaying without parameters\n";
        } else {
            // nlohmann::json objects iterate in sorted key order
            for (auto& [key, value] : args.items()) {
                std::string text = value.is_string() ? value.get<std::string>() : value.dump();
                out += "<parameter name=\"" + key + "\">" + text + kParamClose + "\n";
            }
        }
        out += kInvokeClose + "\n";
    }
    out += kBlockClose;
    return out;
}

DecodedReply decode_reply(const std::string& text) {
    DecodedReply reply;
    std::unordered_set<std::string> used_ids;
    std::string visible;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find(kBlockOpen, pos);
        if (start == std::string::npos) break;

        size_t body = start + kBlockOpen.size();
        size_t end = text.find(kBlockClose, body);
        if (end == std::string::npos) {
            // Unterminated block stays visible
            visible += text.substr(pos, body - pos);
            pos = body;
            continue;
        }

        visible += text.substr(pos, start - pos);
        parse_invokes(text.substr(body, end - body), reply.tool_calls, used_ids);
        pos = end + kBlockClose.size();
    }
    if (pos < text.size()) visible += text.substr(pos);

    visible = trim(visible);
    if (!visible.empty()) {
        reply.content = visible;
    } else if (reply.tool_calls.empty()) {
        reply.content = "Done.";
    }

    if (!reply.content && reply.tool_calls.empty()) {
        throw std::logic_error("decoded reply has neither content nor tool calls");
    }
    return reply;
}

} // namespace maxproxy
