// ─────────────────────────────────────────────────────────────────────────────
// SseParser Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpc/transport/sse_parser.hpp"

using namespace mcpc;

TEST_CASE("SseParser dispatches on blank line", "[sse]") {
    SseParser parser;

    auto events = parser.feed("event: endpoint\ndata: /messages?session=1\n\n");
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE(events->front().event == "endpoint");
    REQUIRE(events->front().data == "/messages?session=1");
}

TEST_CASE("SseParser defaults event type to message", "[sse]") {
    SseParser parser;
    auto events = parser.feed("data: {\"id\":1}\n\n");
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE(events->front().event == "message");
}

TEST_CASE("SseParser handles chunks split anywhere", "[sse]") {
    SseParser parser;
    const std::string stream = "event: message\r\ndata: {\"a\":\r\ndata: 1}\r\n\r\n";

    std::vector<SseEvent> all;
    for (char c : stream) {
        auto events = parser.feed(std::string_view(&c, 1));
        REQUIRE(events.has_value());
        for (auto& event : *events) {
            all.push_back(std::move(event));
        }
    }

    REQUIRE(all.size() == 1);
    REQUIRE(all[0].data == "{\"a\":\n1}");
}

TEST_CASE("SseParser ignores comments and unknown fields", "[sse]") {
    SseParser parser;
    auto events = parser.feed(": keep-alive\n\nfoo: bar\ndata: x\n\n");
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == "x");
}

TEST_CASE("SseParser tracks id and retry", "[sse]") {
    SseParser parser;
    auto events = parser.feed("id: 7\nretry: 1500\ndata: a\n\ndata: b\n\n");
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 2);
    REQUIRE((*events)[0].id == "7");
    REQUIRE((*events)[0].retry == 1500u);
    REQUIRE((*events)[1].id == "7");
    REQUIRE_FALSE((*events)[1].retry.has_value());
    REQUIRE(parser.last_event_id() == "7");
}

TEST_CASE("SseParser finish dispatches a trailing event", "[sse]") {
    SseParser parser;
    auto events = parser.feed("event: message\ndata: {\"id\":2}");
    REQUIRE(events.has_value());
    REQUIRE(events->empty());

    auto last = parser.finish();
    REQUIRE(last.has_value());
    REQUIRE(last->data == "{\"id\":2}");
    REQUIRE_FALSE(parser.finish().has_value());
}

TEST_CASE("SseParser enforces line limit", "[sse]") {
    SseParser parser(SseParserLimits{16, 64});
    auto events = parser.feed("data: " + std::string(32, 'x'));
    REQUIRE_FALSE(events.has_value());
    REQUIRE(events.error().category == ErrorCategory::Transport);

    // The parser resets and keeps working.
    auto after = parser.feed("data: ok\n\n");
    REQUIRE(after.has_value());
    REQUIRE(after->size() == 1);
}

TEST_CASE("SseParser enforces event limit", "[sse]") {
    SseParser parser(SseParserLimits{64, 20});
    auto events = parser.feed("data: 0123456789\ndata: 0123456789\n");
    REQUIRE_FALSE(events.has_value());
}
