#pragma once

#include <chrono>
#include <string>

// One span of recognized speech. Offsets are measured from the start of the media.
struct Segment {
    std::chrono::milliseconds start{0};
    std::chrono::milliseconds end{0};
    std::string text;
};
