#pragma once
#include <string>
#include <functional>

namespace maxproxy {

struct SSEEvent {
    std::string event; // event type (e.g., "message_start", "content_block_delta")
    std::string data;  // raw JSON data
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE parser. Lines and events may be split across feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    // Dispatch a trailing event that was not followed by a blank line.
    bool finish(const SSECallback& callback);

    void reset();

private:
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    SSEEvent pending_;
    bool has_data_ = false;
};

// Format one outbound SSE frame: "data: <payload>\n\n".
std::string sse_frame(const std::string& payload);

} // namespace maxproxy
