#pragma once

#include "audio_buffer.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

class Transcoder {
public:
    virtual ~Transcoder() = default;

    // Decodes any media file to mono 16-bit PCM at sample_rate.
    virtual std::expected<AudioBuffer, std::string>
        decode(const std::filesystem::path& source, uint32_t sample_rate) = 0;
};
