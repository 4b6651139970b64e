#pragma once

#include "audio_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Encodes raw PCM int16 samples into a WAV file in memory, and decodes
// 16-bit PCM WAV data back into a mono AudioBuffer.
namespace wav {

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Walks the RIFF chunk list, so LIST/INFO chunks written by ffmpeg before
// "data" are skipped. Multi-channel input is averaged down to mono.
inline std::expected<AudioBuffer, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* expected) {
        return std::memcmp(bytes.data() + pos, expected, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("wav: not a RIFF/WAVE stream");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;

        if (tag(pos, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return std::unexpected("wav: truncated fmt chunk");
            }
            format = r16(body);
            channels = r16(body + 2);
            sample_rate = r32(body + 4);
            bits_per_sample = r16(body + 14);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("wav: data chunk before fmt chunk");
            // WAVE_FORMAT_EXTENSIBLE (0xFFFE) carries PCM in its sub-format.
            if ((format != 1 && format != 0xFFFE) || bits_per_sample != 16) {
                return std::unexpected("wav: only 16-bit PCM is supported");
            }
            if (channels == 0 || sample_rate == 0) {
                return std::unexpected("wav: invalid channel count or sample rate");
            }

            // ffmpeg writes 0xFFFFFFFF sizes when streaming to a pipe.
            size_t avail = bytes.size() - body;
            size_t data_size = std::min<size_t>(chunk_size, avail);
            size_t frames = data_size / (sizeof(int16_t) * channels);

            AudioBuffer out;
            out.sample_rate = sample_rate;
            out.samples.resize(frames);
            const uint8_t* src = bytes.data() + body;
            for (size_t i = 0; i < frames; ++i) {
                int32_t acc = 0;
                for (uint16_t c = 0; c < channels; ++c) {
                    int16_t s;
                    std::memcpy(&s, src + (i * channels + c) * sizeof(int16_t), sizeof(int16_t));
                    acc += s;
                }
                out.samples[i] = static_cast<int16_t>(acc / channels);
            }
            return out;
        }

        // Chunks are padded to an even size.
        pos = body + chunk_size + (chunk_size & 1);
    }

    return std::unexpected("wav: no data chunk");
}

} // namespace wav
