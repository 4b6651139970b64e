#pragma once

#include "segment.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

// SubRip rendering.
namespace srt {

// "HH:MM:SS,mmm". Hours are not wrapped at 24; negative offsets clamp to zero.
std::string format_timestamp(std::chrono::milliseconds offset);

// Renders one block per segment: index, "start --> end", text, blank line.
// Indices start at 1 and follow the input order. Text is emitted verbatim.
std::string format_document(std::span<const Segment> segments);

// "movie.mkv" -> "movie.srt", in the same directory.
std::filesystem::path subtitle_path_for(const std::filesystem::path& media);

struct WrittenFile {
    std::filesystem::path path;
    uintmax_t size_bytes = 0;
    size_t entries = 0;
};

std::expected<WrittenFile, std::string>
    write_document(const std::filesystem::path& path, std::span<const Segment> segments);

} // namespace srt
