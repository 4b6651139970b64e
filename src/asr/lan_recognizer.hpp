#pragma once

#include "recognizer.hpp"

#include <string>
#include <vector>

// Sends the audio to a whisper.cpp server or an OpenAI-compatible endpoint
// and reads timed segments from its verbose_json response.
class LanRecognizer : public Recognizer {
public:
    // api_format: "whisper.cpp" or "openai"
    LanRecognizer(std::string url, std::string api_format = "whisper.cpp");
    ~LanRecognizer() override;

    LanRecognizer(const LanRecognizer&) = delete;
    LanRecognizer& operator=(const LanRecognizer&) = delete;

    std::expected<void, std::string>
        transcribe(const AudioBuffer& audio, const std::string& language,
                   std::stop_token stop, const SegmentSink& on_segment) override;

    // Extracts the "segments" array of a verbose_json body.
    static std::expected<std::vector<Segment>, std::string>
        parse_segments(const std::string& response_body);

private:
    std::string url_;
    std::string api_format_;
};
