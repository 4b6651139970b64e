#pragma once

#include "asr/recognizer.hpp"
#include "media/transcoder.hpp"
#include "net/http_client.hpp"
#include "provision/asset_provisioner.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// Serves one fixed body. Setting fail_after truncates the transfer there and
// reports a network error, leaving the partial file on disk.
class FakeHttpClient : public HttpClient {
public:
    std::optional<uint64_t> remote_size;
    std::string body;
    size_t fail_after = std::numeric_limits<size_t>::max();
    std::string probe_error;
    // Runs after the body is on disk, before download() returns.
    std::function<void()> after_write;

    int probes = 0;
    int downloads = 0;
    std::vector<std::string> urls;

    std::expected<std::optional<uint64_t>, std::string>
    content_length(const std::string& url) override {
        ++probes;
        urls.push_back("HEAD " + url);
        if (!probe_error.empty()) return std::unexpected(probe_error);
        return remote_size;
    }

    std::expected<void, std::string>
    download(const std::string& url, const std::filesystem::path& dest, std::stop_token stop) override {
        ++downloads;
        urls.push_back("GET " + url);
        if (stop.stop_requested()) return std::unexpected("cancelled");

        size_t n = std::min(fail_after, body.size());
        std::ofstream f(dest, std::ios::binary | std::ios::trunc);
        f.write(body.data(), static_cast<std::streamsize>(n));
        f.close();
        if (after_write) after_write();
        if (n < body.size()) return std::unexpected("connection reset");
        return {};
    }
};

class FakeProvisioner : public AssetProvisioner {
public:
    std::filesystem::path transcoder_dir = "/fake/ffmpeg";
    std::filesystem::path model_path = "/fake/ggml-tiny.bin";
    std::string transcoder_error;
    std::string model_error;

    std::vector<std::string> calls;

    std::expected<std::filesystem::path, std::string> ensure_transcoder_available(std::stop_token) override {
        calls.push_back("transcoder");
        if (!transcoder_error.empty()) return std::unexpected(transcoder_error);
        return transcoder_dir;
    }

    std::expected<std::filesystem::path, std::string>
    ensure_model_available(const std::string& variant, std::stop_token) override {
        calls.push_back("model:" + variant);
        if (!model_error.empty()) return std::unexpected(model_error);
        return model_path;
    }
};

class FakeTranscoder : public Transcoder {
public:
    AudioBuffer audio{.samples = std::vector<int16_t>(16000, 0), .sample_rate = 16000};
    std::string error;
    std::vector<std::string>* log = nullptr;
    std::filesystem::path last_source;
    uint32_t last_rate = 0;

    std::expected<AudioBuffer, std::string>
    decode(const std::filesystem::path& source, uint32_t sample_rate) override {
        if (log) log->push_back("decode");
        last_source = source;
        last_rate = sample_rate;
        if (!error.empty()) return std::unexpected(error);
        return audio;
    }
};

// Emits its scripted segments in order. before_segment runs ahead of each
// one, so a test can trigger cancellation at a chosen point.
class FakeRecognizer : public Recognizer {
public:
    std::vector<Segment> script;
    std::string error;
    std::function<void(size_t index)> before_segment;
    std::vector<std::string>* log = nullptr;
    std::string last_language;

    std::expected<void, std::string>
    transcribe(const AudioBuffer&, const std::string& language, std::stop_token stop,
               const SegmentSink& on_segment) override {
        if (log) log->push_back("transcribe");
        last_language = language;
        for (size_t i = 0; i < script.size(); ++i) {
            if (before_segment) before_segment(i);
            if (stop.stop_requested()) return std::unexpected("cancelled");
            on_segment(script[i]);
        }
        if (!error.empty()) return std::unexpected(error);
        return {};
    }
};
