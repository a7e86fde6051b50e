#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include "wire_codec.h"

namespace {
    std::vector<std::string> FeedText(LineFramer& framer, const std::string& text) {
        return framer.Feed(text.data(), text.size());
    }
}

TEST_CASE("LineFramer joins a line split across reads") {
    LineFramer framer;

    REQUIRE(FeedText(framer, "{\"type\":\"HEART").empty());
    REQUIRE(framer.GetPendingSize() == std::strlen("{\"type\":\"HEART"));

    auto lines = FeedText(framer, "BEAT_ACK\"}\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "{\"type\":\"HEARTBEAT_ACK\"}");
    REQUIRE(framer.GetPendingSize() == 0);
}

TEST_CASE("LineFramer returns every complete line from one read") {
    LineFramer framer;

    auto lines = FeedText(framer, "one\ntwo\nthr");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "one");
    REQUIRE(lines[1] == "two");

    lines = FeedText(framer, "ee\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "three");
}

TEST_CASE("LineFramer strips carriage returns and skips blank lines") {
    LineFramer framer;

    auto lines = FeedText(framer, "a\r\n\n\r\nb\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "a");
    REQUIRE(lines[1] == "b");
}

TEST_CASE("LineFramer drops an oversized line and recovers at the next newline") {
    LineFramer framer(8);

    REQUIRE(FeedText(framer, "0123456789abc").empty());
    REQUIRE(framer.GetDiscardedLineCount() == 1);
    REQUIRE(FeedText(framer, "still the same line").empty());

    auto lines = FeedText(framer, "tail\nok\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "ok");
    REQUIRE(framer.GetDiscardedLineCount() == 1);
}

TEST_CASE("LineFramer drops an oversized line that arrives complete") {
    LineFramer framer(4);

    auto lines = FeedText(framer, "toolong\nfine\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "fine");
    REQUIRE(framer.GetDiscardedLineCount() == 1);
}

TEST_CASE("LineFramer Clear forgets a partial line") {
    LineFramer framer;
    FeedText(framer, "partial");
    framer.Clear();

    auto lines = FeedText(framer, "fresh\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "fresh");
}
