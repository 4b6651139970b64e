#include <catch2/catch_test_macros.hpp>

#include "media/ffmpeg_transcoder.hpp"
#include "media/wav_codec.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Writes an executable shell script standing in for ffmpeg: it copies a
// prepared WAV to the last argument (the output path).
fs::path fake_ffmpeg(const fs::path& dir, const fs::path& fixture, int exit_code = 0) {
    auto script = dir / "ffmpeg";
    std::string body = "#!/bin/sh\n"
                       "for a in \"$@\"; do out=\"$a\"; done\n";
    if (exit_code != 0) {
        body += "echo 'Invalid data found when processing input' >&2\nexit " +
                std::to_string(exit_code) + "\n";
    } else {
        body += "cp '" + fixture.string() + "' \"$out\"\n";
    }
    testing::write_file(script, body);
    fs::permissions(script, fs::perms::owner_all);
    return script;
}

void write_wav(const fs::path& path, const std::vector<int16_t>& samples, uint32_t rate) {
    auto bytes = wav::encode(samples, rate);
    testing::write_file(path, std::string(bytes.begin(), bytes.end()));
}

} // namespace

TEST_CASE("FfmpegTranscoder", "[media]") {
    testing::TmpDir dir;
    WorkingCache cache(dir / "cache");
    REQUIRE(cache.ensure().has_value());

    auto input = dir / "clip.mp4";
    testing::write_file(input, "not really an mp4");

    std::vector<int16_t> samples = {0, 1, -1, 1000, -1000};
    auto fixture = dir / "fixture.wav";
    write_wav(fixture, samples, 16000);

    SECTION("CommandLinePutsSampleRateAfterInput") {
        FfmpegTranscoder t("/opt/ffmpeg/ffmpeg", cache);
        auto args = t.command_line("in.mkv", "out.wav", 16000);

        REQUIRE(args.front() == "/opt/ffmpeg/ffmpeg");
        REQUIRE(args.back() == "out.wav");
        auto input_at = std::find(args.begin(), args.end(), "-i");
        auto rate_at = std::find(args.begin(), args.end(), "-ar");
        REQUIRE(input_at != args.end());
        REQUIRE(rate_at != args.end());
        REQUIRE(*(input_at + 1) == "in.mkv");
        REQUIRE(*(rate_at + 1) == "16000");
        REQUIRE(rate_at > input_at);
        REQUIRE(std::find(args.begin(), args.end(), "-ac") != args.end());
    }

    SECTION("DecodesAndDeletesTempFiles") {
        FfmpegTranscoder t(fake_ffmpeg(dir.path, fixture), cache);
        auto audio = t.decode(input, 16000);
        REQUIRE(audio.has_value());
        REQUIRE(audio->samples == samples);
        REQUIRE(audio->sample_rate == 16000);

        REQUIRE_FALSE(fs::exists(input));
        REQUIRE_FALSE(fs::exists(cache.temp_audio_path(input)));
    }

    SECTION("KeepTempFilesRetainsInputAndIntermediate") {
        FfmpegTranscoder t(fake_ffmpeg(dir.path, fixture), cache, true);
        REQUIRE(t.decode(input, 16000).has_value());
        REQUIRE(fs::exists(input));
        REQUIRE(fs::exists(cache.temp_audio_path(input)));
        REQUIRE(cache.temp_audio_path(input) == cache.root() / "clip.wav");
    }

    SECTION("FfmpegFailureKeepsInput") {
        FfmpegTranscoder t(fake_ffmpeg(dir.path, fixture, 1), cache);
        auto audio = t.decode(input, 16000);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().find("exited with code 1: Invalid data found") != std::string::npos);
        REQUIRE(fs::exists(input));
    }

    SECTION("WrongSampleRateIsRejected") {
        write_wav(fixture, samples, 44100);
        FfmpegTranscoder t(fake_ffmpeg(dir.path, fixture), cache);
        auto audio = t.decode(input, 16000);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error() == "transcode: expected 16000 Hz output, got 44100 Hz");
    }

    SECTION("MissingInput") {
        FfmpegTranscoder t(fake_ffmpeg(dir.path, fixture), cache);
        auto audio = t.decode(dir / "absent.mp4", 16000);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().starts_with("transcode: input"));
    }
}
