#include <catch2/catch_test_macros.hpp>

#include "asr/lan_recognizer.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("LanRecognizer::parse_segments", "[asr]") {

    SECTION("VerboseJsonSegments") {
        auto segs = LanRecognizer::parse_segments(R"({
            "text": " Hello world",
            "language": "english",
            "segments": [
                { "id": 0, "start": 0.0, "end": 1.5, "text": " Hello" },
                { "id": 1, "start": 1.5, "end": 3.25, "text": " world" }
            ]
        })");
        REQUIRE(segs.has_value());
        REQUIRE(segs->size() == 2);
        REQUIRE((*segs)[0].start == 0ms);
        REQUIRE((*segs)[0].end == 1500ms);
        REQUIRE((*segs)[0].text == " Hello");
        REQUIRE((*segs)[1].start == 1500ms);
        REQUIRE((*segs)[1].end == 3250ms);
    }

    SECTION("EndBeforeStartIsClamped") {
        auto segs = LanRecognizer::parse_segments(
            R"({ "segments": [ { "start": 2.0, "end": 1.0, "text": "x" } ] })");
        REQUIRE(segs.has_value());
        REQUIRE((*segs)[0].end == 2000ms);
    }

    SECTION("EmptySegmentList") {
        auto segs = LanRecognizer::parse_segments(R"({ "segments": [] })");
        REQUIRE(segs.has_value());
        REQUIRE(segs->empty());
    }

    SECTION("ServerErrorString") {
        auto segs = LanRecognizer::parse_segments(R"({ "error": "model not loaded" })");
        REQUIRE_FALSE(segs.has_value());
        REQUIRE(segs.error() == "server error: model not loaded");
    }

    SECTION("OpenAiErrorObject") {
        auto segs = LanRecognizer::parse_segments(
            R"({ "error": { "message": "Invalid file format.", "type": "invalid_request_error" } })");
        REQUIRE_FALSE(segs.has_value());
        REQUIRE(segs.error() == "server error: Invalid file format.");
    }

    SECTION("PlainTextResponseIsRejected") {
        auto segs = LanRecognizer::parse_segments(R"({ "text": "no timing" })");
        REQUIRE_FALSE(segs.has_value());
        REQUIRE(segs.error().starts_with("unexpected response"));
    }

    SECTION("InvalidJson") {
        auto segs = LanRecognizer::parse_segments("<html>502</html>");
        REQUIRE_FALSE(segs.has_value());
        REQUIRE(segs.error().starts_with("JSON parse error"));
    }
}
