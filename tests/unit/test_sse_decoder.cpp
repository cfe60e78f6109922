/*
 * Unit tests for the streamed-response decoder
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "SseDecoder.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <vector>

TEST_CASE("Frames Hel, lo, [DONE] produce Hello in two ordered callbacks") {
    std::vector<std::string> fragments;
    SseDecoder decoder([&](const std::string& fragment) { fragments.push_back(fragment); });

    REQUIRE(decoder.feed(delta_frame("Hel")));
    REQUIRE(decoder.feed(delta_frame("lo")));
    REQUIRE_FALSE(decoder.feed("data: [DONE]\n"));

    REQUIRE(decoder.done());
    REQUIRE(decoder.text() == "Hello");
    REQUIRE(fragments == std::vector<std::string>{"Hel", "lo"});
}

TEST_CASE("A frame split across chunks is held until its newline") {
    std::vector<std::string> fragments;
    SseDecoder decoder([&](const std::string& fragment) { fragments.push_back(fragment); });

    const std::string frame = delta_frame("split");
    decoder.feed(frame.substr(0, 9));
    REQUIRE(fragments.empty());
    decoder.feed(frame.substr(9));

    REQUIRE(fragments == std::vector<std::string>{"split"});
}

TEST_CASE("Several frames in one chunk are delivered one by one") {
    std::vector<std::string> fragments;
    SseDecoder decoder([&](const std::string& fragment) { fragments.push_back(fragment); });

    decoder.feed(delta_frame("a") + "\n" + delta_frame("b") + delta_frame("c"));

    REQUIRE(fragments == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(decoder.fragment_count() == 3);
}

TEST_CASE("Malformed frames are skipped without ending the stream") {
    SseDecoder decoder;

    decoder.feed(delta_frame("one"));
    decoder.feed("data: {not json\n");
    decoder.feed(delta_frame("two"));

    REQUIRE(decoder.text() == "onetwo");
    REQUIRE(decoder.skipped_frames() == 1);
    REQUIRE_FALSE(decoder.done());
}

TEST_CASE("Non-data lines and contentless deltas are ignored") {
    SseDecoder decoder;

    decoder.feed(": keep-alive\n");
    decoder.feed("event: message\n");
    decoder.feed("data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n");
    decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":null}}]}\n");
    decoder.feed("data: {\"choices\":[]}\n");
    decoder.feed(delta_frame("text"));

    REQUIRE(decoder.text() == "text");
    REQUIRE(decoder.fragment_count() == 1);
    REQUIRE(decoder.skipped_frames() == 0);
}

TEST_CASE("CRLF line endings are accepted") {
    SseDecoder decoder;

    decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\r\n");
    REQUIRE_FALSE(decoder.feed("data: [DONE]\r\n"));

    REQUIRE(decoder.text() == "x");
    REQUIRE(decoder.done());
}

TEST_CASE("Nothing after [DONE] is processed") {
    int calls = 0;
    SseDecoder decoder([&](const std::string&) { ++calls; });

    decoder.feed("data: [DONE]\n" + delta_frame("late"));
    REQUIRE_FALSE(decoder.feed(delta_frame("later")));

    REQUIRE(calls == 0);
    REQUIRE(decoder.text().empty());
}

TEST_CASE("finish() processes a trailing frame without newline") {
    SseDecoder decoder;

    decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":\"tail\"}}]}");
    REQUIRE(decoder.text().empty());

    decoder.finish();
    REQUIRE(decoder.text() == "tail");
}
