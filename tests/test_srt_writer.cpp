#include <catch2/catch_test_macros.hpp>

#include "subtitle/srt_writer.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("srt::format_timestamp", "[srt]") {

    SECTION("Zero") {
        REQUIRE(srt::format_timestamp(0ms) == "00:00:00,000");
    }

    SECTION("AllFieldsPadded") {
        REQUIRE(srt::format_timestamp(1h + 2min + 3s + 4ms) == "01:02:03,004");
    }

    SECTION("SubSecond") {
        REQUIRE(srt::format_timestamp(1500ms) == "00:00:01,500");
        REQUIRE(srt::format_timestamp(3250ms) == "00:00:03,250");
    }

    SECTION("FieldRollover") {
        REQUIRE(srt::format_timestamp(59s + 999ms) == "00:00:59,999");
        REQUIRE(srt::format_timestamp(60s) == "00:01:00,000");
        REQUIRE(srt::format_timestamp(59min + 59s) == "00:59:59,000");
    }

    SECTION("HoursNotWrapped") {
        REQUIRE(srt::format_timestamp(25h + 1ms) == "25:00:00,001");
    }

    SECTION("NegativeClampsToZero") {
        REQUIRE(srt::format_timestamp(-5ms) == "00:00:00,000");
    }
}

TEST_CASE("srt::format_document", "[srt]") {

    SECTION("EmptyInputIsEmptyString") {
        REQUIRE(srt::format_document({}).empty());
    }

    SECTION("TwoSegments") {
        std::vector<Segment> segs = {
            {.start = 0ms, .end = 1500ms, .text = "Hello"},
            {.start = 1500ms, .end = 3250ms, .text = "world"},
        };
        REQUIRE(srt::format_document(segs) ==
                "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n"
                "2\n00:00:01,500 --> 00:00:03,250\nworld\n\n");
    }

    SECTION("IndicesFollowInputOrder") {
        std::vector<Segment> segs;
        for (int i = 0; i < 12; ++i) {
            segs.push_back({.start = std::chrono::seconds(i), .end = std::chrono::seconds(i + 1),
                            .text = "line " + std::to_string(i)});
        }
        auto doc = srt::format_document(segs);

        // Each entry is exactly four lines.
        size_t newlines = std::count(doc.begin(), doc.end(), '\n');
        REQUIRE(newlines == segs.size() * 4);

        for (size_t i = 0; i < segs.size(); ++i) {
            auto block = std::to_string(i + 1) + "\n" +
                         srt::format_timestamp(segs[i].start) + " --> " +
                         srt::format_timestamp(segs[i].end) + "\n" + segs[i].text + "\n\n";
            REQUIRE(doc.find(block) != std::string::npos);
        }
        REQUIRE(doc.starts_with("1\n"));
        REQUIRE(doc.find("12\n00:00:11,000") != std::string::npos);
    }

    SECTION("TextIsVerbatim") {
        std::vector<Segment> segs = {
            {.start = 0ms, .end = 10ms, .text = "  leading space, <i>tag</i>\nsecond line "},
        };
        REQUIRE(srt::format_document(segs) ==
                "1\n00:00:00,000 --> 00:00:00,010\n  leading space, <i>tag</i>\nsecond line \n\n");
    }

    SECTION("NoCarriageReturns") {
        std::vector<Segment> segs = {{.start = 0ms, .end = 1s, .text = "x"}};
        auto doc = srt::format_document(segs);
        REQUIRE(doc.find('\r') == std::string::npos);
    }
}

TEST_CASE("srt::subtitle_path_for", "[srt]") {
    REQUIRE(srt::subtitle_path_for("clip.mp4") == std::filesystem::path("clip.srt"));
    REQUIRE(srt::subtitle_path_for("/videos/a.b.mkv") == std::filesystem::path("/videos/a.b.srt"));
    REQUIRE(srt::subtitle_path_for("noext") == std::filesystem::path("noext.srt"));
}

TEST_CASE("srt::write_document", "[srt]") {
    testing::TmpDir dir;

    SECTION("WritesFileAndMetadata") {
        std::vector<Segment> segs = {{.start = 0ms, .end = 1500ms, .text = "Hello"}};
        auto out = dir / "clip.srt";

        auto res = srt::write_document(out, segs);
        REQUIRE(res.has_value());
        REQUIRE(res->path == out);
        REQUIRE(res->entries == 1);

        auto content = testing::read_file(out);
        REQUIRE(content == "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n");
        REQUIRE(res->size_bytes == content.size());
    }

    SECTION("UnwritableDirectoryFails") {
        auto res = srt::write_document(dir / "missing" / "clip.srt", {});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().starts_with("srt:"));
    }
}
