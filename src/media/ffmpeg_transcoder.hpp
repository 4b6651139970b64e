#pragma once

#include "transcoder.hpp"

#include "provision/working_cache.hpp"

#include <string>
#include <vector>

// Runs an ffmpeg executable to write "<cache>/<stem>.wav", then reads it back.
// Unless keep_temp_files is set, a successful decode deletes both the
// intermediate file and the source media.
class FfmpegTranscoder : public Transcoder {
public:
    FfmpegTranscoder(std::filesystem::path executable, const WorkingCache& cache,
                     bool keep_temp_files = false);

    std::expected<AudioBuffer, std::string>
        decode(const std::filesystem::path& source, uint32_t sample_rate) override;

    // ffmpeg arguments; the sample rate follows the input.
    std::vector<std::string> command_line(const std::filesystem::path& source,
                                          const std::filesystem::path& target,
                                          uint32_t sample_rate) const;

private:
    std::filesystem::path executable_;
    const WorkingCache& cache_;
    bool keep_temp_files_;
};
