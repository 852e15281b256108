#include <catch2/catch.hpp>
#include "providers/sse.hpp"
#include <string>
#include <vector>

using namespace maxproxy;

namespace {

// A short Messages API stream as the upstream sends it.
const char* const kTranscript =
    "event: message_start\n"
    "data: {\"type\":\"message_start\",\"message\":{\"usage\":{\"input_tokens\":12}}}\n"
    "\n"
    ": keep-alive\n"
    "event: ping\n"
    "data: {\"type\":\"ping\"}\n"
    "\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\",\"text\":\"Hi\"}}\n"
    "\n"
    "event: message_stop\n"
    "data: {\"type\":\"message_stop\"}\n"
    "\n";

struct Recorder {
    std::vector<SSEEvent> events;
    size_t stop_after = 0; // 0: never stop

    SSECallback callback() {
        return [this](const SSEEvent& ev) {
            events.push_back(ev);
            return stop_after == 0 || events.size() < stop_after;
        };
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& ev : events) out.push_back(ev.event);
        return out;
    }
};

const std::vector<std::string> kTranscriptTypes = {
    "message_start", "ping", "content_block_delta", "message_stop"};

} // namespace

// ── Whole transcripts ────────────────────────────────────────────

TEST_CASE("SSEParser: Messages API transcript in one chunk", "[sse]") {
    SSEParser parser;
    Recorder rec;
    REQUIRE(parser.feed(kTranscript, rec.callback()));
    REQUIRE(rec.types() == kTranscriptTypes);
    REQUIRE(rec.events[2].data ==
            "{\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\",\"text\":\"Hi\"}}");
}

TEST_CASE("SSEParser: transcript fed one byte at a time", "[sse]") {
    SSEParser parser;
    Recorder rec;
    std::string all = kTranscript;
    for (char c : all) {
        REQUIRE(parser.feed(std::string(1, c), rec.callback()));
    }
    REQUIRE(rec.types() == kTranscriptTypes);
    REQUIRE(rec.events[3].data == "{\"type\":\"message_stop\"}");
}

TEST_CASE("SSEParser: transcript with CRLF line endings", "[sse]") {
    std::string crlf;
    for (char c : std::string(kTranscript)) {
        if (c == '\n') crlf += '\r';
        crlf += c;
    }
    SSEParser parser;
    Recorder rec;
    parser.feed(crlf, rec.callback());
    REQUIRE(rec.types() == kTranscriptTypes);
    REQUIRE(rec.events[1].data == "{\"type\":\"ping\"}");
}

TEST_CASE("SSEParser: stopping mid-transcript", "[sse]") {
    SSEParser parser;
    Recorder rec;
    rec.stop_after = 2;
    REQUIRE_FALSE(parser.feed(kTranscript, rec.callback()));
    REQUIRE(rec.types() == std::vector<std::string>{"message_start", "ping"});
}

// ── Field handling ───────────────────────────────────────────────

TEST_CASE("SSEParser: data without an event line", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("data:{\"n\":1}\n\n", rec.callback());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].event.empty());
    REQUIRE(rec.events[0].data == "{\"n\":1}");
}

TEST_CASE("SSEParser: repeated data lines join with newline", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("event: error\ndata: {\"type\":\"error\",\ndata: \"x\":1}\n\n", rec.callback());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].event == "error");
    REQUIRE(rec.events[0].data == "{\"type\":\"error\",\n\"x\":1}");
}

TEST_CASE("SSEParser: event type does not leak into the next event", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("event: ping\ndata: 1\n\ndata: 2\n\n", rec.callback());
    REQUIRE(rec.types() == std::vector<std::string>{"ping", ""});
}

TEST_CASE("SSEParser: blank lines and unknown fields dispatch nothing", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("\n\nid: 7\nretry: 1000\n\n: comment only\n\n", rec.callback());
    REQUIRE(rec.events.empty());

    // An event line with no data is dropped at the blank line
    parser.feed("event: ping\n\ndata: x\n\n", rec.callback());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].event.empty());
}

// ── finish / reset ───────────────────────────────────────────────

TEST_CASE("SSEParser: finish flushes an unterminated final event", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("event: message_stop\ndata: {\"type\":\"message_stop\"}", rec.callback());
    REQUIRE(rec.events.empty());

    REQUIRE(parser.finish(rec.callback()));
    REQUIRE(rec.types() == std::vector<std::string>{"message_stop"});
}

TEST_CASE("SSEParser: finish after a complete stream adds nothing", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed(kTranscript, rec.callback());
    parser.finish(rec.callback());
    REQUIRE(rec.events.size() == kTranscriptTypes.size());
}

TEST_CASE("SSEParser: reset drops a half-received event", "[sse]") {
    SSEParser parser;
    Recorder rec;
    parser.feed("event: content_block_delta\ndata: {\"partial\"", rec.callback());
    parser.reset();
    parser.feed("data: fresh\n\n", rec.callback());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].event.empty());
    REQUIRE(rec.events[0].data == "fresh");
}

// ── sse_frame ────────────────────────────────────────────────────

TEST_CASE("sse_frame: parses back as a single event", "[sse]") {
    std::string payload = R"({"object":"chat.completion.chunk"})";
    REQUIRE(sse_frame(payload) == "data: " + payload + "\n\n");
    REQUIRE(sse_frame("[DONE]") == "data: [DONE]\n\n");

    SSEParser parser;
    Recorder rec;
    parser.feed(sse_frame(payload) + sse_frame("[DONE]"), rec.callback());
    REQUIRE(rec.events.size() == 2);
    REQUIRE(rec.events[0].data == payload);
    REQUIRE(rec.events[1].data == "[DONE]");
}
