#pragma once

#include <cstdint>
#include <vector>

// Decoded mono PCM, ready for recognition.
struct AudioBuffer {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};
