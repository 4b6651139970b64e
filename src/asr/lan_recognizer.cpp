#include "lan_recognizer.hpp"

#include "log.hpp"
#include "media/wav_codec.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<std::stop_token*>(userdata)->stop_requested() ? 1 : 0;
}

static std::chrono::milliseconds seconds_to_ms(double s) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(s * 1000.0)));
}

LanRecognizer::LanRecognizer(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanRecognizer::~LanRecognizer() {
    curl_global_cleanup();
}

std::expected<void, std::string>
LanRecognizer::transcribe(const AudioBuffer& audio, const std::string& language,
                          std::stop_token stop, const SegmentSink& on_segment) {
    if (audio.samples.empty()) {
        return std::unexpected("lan: empty audio");
    }

    auto wav_data = wav::encode(audio.samples, audio.sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);

        // The OpenAI API detects the language when the field is omitted.
        if (language != "auto") {
            part = curl_mime_addpart(mime);
            curl_mime_name(part, "language");
            curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
        }
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_ABORTED_BY_CALLBACK || stop.stop_requested()) {
        return std::unexpected("cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto segments = parse_segments(response_body);
    if (!segments) {
        return std::unexpected(segments.error());
    }

    logging::debug("lan: {} segments in {:.1f}s", segments->size(), processing_s);

    for (auto& seg : *segments) {
        if (stop.stop_requested()) {
            return std::unexpected("cancelled");
        }
        on_segment(std::move(seg));
    }
    return {};
}

std::expected<std::vector<Segment>, std::string>
LanRecognizer::parse_segments(const std::string& response_body) {
    try {
        auto j = json::parse(response_body);

        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                            : err.is_object() ? err.value("message", err.dump())
                                              : err.dump();
            return std::unexpected("server error: " + msg);
        }
        if (!j.contains("segments") || !j["segments"].is_array()) {
            return std::unexpected("unexpected response: " + response_body);
        }

        std::vector<Segment> out;
        for (const auto& s : j["segments"]) {
            Segment seg;
            seg.start = seconds_to_ms(s.value("start", 0.0));
            seg.end = std::max(seg.start, seconds_to_ms(s.value("end", 0.0)));
            seg.text = s.value("text", "");
            out.push_back(std::move(seg));
        }
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
