#pragma once

#include "media/audio_buffer.hpp"
#include "subtitle/segment.hpp"

#include <expected>
#include <functional>
#include <stop_token>
#include <string>

// Receives segments in the order the engine produces them.
using SegmentSink = std::function<void(Segment)>;

class Recognizer {
public:
    virtual ~Recognizer() = default;

    // language is an ISO code or "auto". Returns "cancelled" as the error
    // when stop is requested; segments already handed to on_segment stay
    // with the caller.
    virtual std::expected<void, std::string>
        transcribe(const AudioBuffer& audio, const std::string& language,
                   std::stop_token stop, const SegmentSink& on_segment) = 0;
};
