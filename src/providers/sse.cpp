#include "sse.hpp"

namespace maxproxy {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', pos)) != std::string::npos) {
        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            if (!dispatch(callback)) {
                buffer_.erase(0, pos);
                return false;
            }
        } else if (line.rfind("event:", 0) == 0) {
            pending_.event = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) {
                pending_.data += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            pending_.data += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
            has_data_ = true;
        }
        // Comments (":") and unknown fields are ignored
    }

    // Keep the incomplete tail for the next chunk
    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    buffer_ += "\n\n";
    return feed("", callback);
}

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (has_data_) {
        keep_going = callback(pending_);
    }
    pending_ = SSEEvent{};
    has_data_ = false;
    return keep_going;
}

void SSEParser::reset() {
    buffer_.clear();
    pending_ = SSEEvent{};
    has_data_ = false;
}

std::string sse_frame(const std::string& payload) {
    return "data: " + payload + "\n\n";
}

} // namespace maxproxy
