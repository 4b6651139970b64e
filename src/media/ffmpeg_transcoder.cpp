#include "ffmpeg_transcoder.hpp"
#include "wav_codec.hpp"

#include "log.hpp"
#include "platform/process.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {

std::expected<std::vector<uint8_t>, std::string> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("cannot open {}", path.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected(std::format("read of {} failed", path.string()));
    }
    return bytes;
}

} // namespace

FfmpegTranscoder::FfmpegTranscoder(fs::path executable, const WorkingCache& cache,
                                   bool keep_temp_files)
    : executable_(std::move(executable)), cache_(cache), keep_temp_files_(keep_temp_files) {}

std::vector<std::string> FfmpegTranscoder::command_line(const fs::path& source,
                                                        const fs::path& target,
                                                        uint32_t sample_rate) const {
    return {
        executable_.string(),
        "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", source.string(),
        "-vn", "-ac", "1",
        "-ar", std::to_string(sample_rate),
        "-c:a", "pcm_s16le",
        target.string(),
    };
}

std::expected<AudioBuffer, std::string>
FfmpegTranscoder::decode(const fs::path& source, uint32_t sample_rate) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return std::unexpected(std::format("transcode: input {} does not exist", source.string()));
    }

    auto target = cache_.temp_audio_path(source);
    logging::debug("ffmpeg: {} -> {} @ {} Hz", source.string(), target.string(), sample_rate);

    auto ran = platform::run_process(command_line(source, target, sample_rate));
    if (!ran) {
        return std::unexpected("transcode: " + ran.error());
    }

    auto bytes = read_file(target);
    if (!bytes) {
        return std::unexpected("transcode: " + bytes.error());
    }

    auto audio = wav::decode(*bytes);
    if (!audio) {
        return std::unexpected("transcode: " + audio.error());
    }
    if (audio->sample_rate != sample_rate) {
        return std::unexpected(std::format("transcode: expected {} Hz output, got {} Hz",
                                           sample_rate, audio->sample_rate));
    }

    if (!keep_temp_files_) {
        for (const auto& path : {source, target}) {
            fs::remove(path, ec);
            if (ec) {
                return std::unexpected(std::format("transcode: cannot delete {}: {}",
                                                   path.string(), ec.message()));
            }
        }
    }

    logging::debug("decoded {:.1f}s of audio", audio->duration_s());
    return std::move(*audio);
}
