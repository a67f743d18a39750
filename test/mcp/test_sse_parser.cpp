#include <catch2/catch_test_macros.hpp>

#include <toolmux/mcp/sse_parser.hpp>

#include <string>
#include <vector>

using namespace toolmux;

namespace {

struct Collector {
    std::vector<SseEvent> events;
    SseParser parser{[this](const SseEvent& ev) { events.push_back(ev); }};
};

} // anonymous namespace

// ===========================================================================
// SseParser
// ===========================================================================

TEST_CASE("SseParser: endpoint event", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("event: endpoint\ndata: /messages?sessionId=abc\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0].event == "endpoint");
    CHECK(c.events[0].data == "/messages?sessionId=abc");
}

TEST_CASE("SseParser: event name defaults to message", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("data: {\"jsonrpc\":\"2.0\"}\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0].event == "message");
}

TEST_CASE("SseParser: chunks split anywhere", "[mcp][sse]") {
    Collector c;
    const std::string stream = "event: message\ndata: {\"id\":1}\n\nevent: message\ndata: {\"id\":2}\n\n";
    for (char ch : stream) {
        c.parser.Feed(std::string(1, ch));
    }
    REQUIRE(c.events.size() == 2);
    CHECK(c.events[0].data == "{\"id\":1}");
    CHECK(c.events[1].data == "{\"id\":2}");
}

TEST_CASE("SseParser: CRLF and CR line endings", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("data: a\r\n\r\n");
    c.parser.Feed("data: b\r\r");
    c.parser.Feed("data: c\r");
    c.parser.Feed("\n\r\n");
    REQUIRE(c.events.size() == 3);
    CHECK(c.events[0].data == "a");
    CHECK(c.events[1].data == "b");
    CHECK(c.events[2].data == "c");
}

TEST_CASE("SseParser: multi-line data is joined with newlines", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("data: first\ndata:second\ndata\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0].data == "first\nsecond\n");
}

TEST_CASE("SseParser: comments and empty events are ignored", "[mcp][sse]") {
    Collector c;
    c.parser.Feed(": keep-alive\n\n");
    c.parser.Feed("event: endpoint\n\n");
    c.parser.Feed("data: x\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0].event == "message");
}

TEST_CASE("SseParser: id and retry fields", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("id: 7\nretry: 1500\ndata: x\n\ndata: y\n\n");
    REQUIRE(c.events.size() == 2);
    CHECK(c.events[0].id == "7");
    CHECK(c.events[1].id == "7");
    CHECK(c.parser.RetryMs() == 1500);
}

TEST_CASE("SseParser: incomplete event is held back", "[mcp][sse]") {
    Collector c;
    c.parser.Feed("data: partial\n");
    CHECK(c.events.empty());
    c.parser.Feed("\n");
    CHECK(c.events.size() == 1);
}
