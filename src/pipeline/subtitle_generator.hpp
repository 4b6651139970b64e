#pragma once

#include "asr/recognizer.hpp"
#include "media/transcoder.hpp"
#include "provision/asset_provisioner.hpp"
#include "provision/working_cache.hpp"
#include "subtitle/srt_writer.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view kCancelled = "cancelled";

// Media file in, "<name>.srt" beside it out. Steps run strictly in order:
// cache dir, transcoder, model, recognizer load, decode, recognition, write.
class SubtitleGenerator {
public:
    // Receives the provisioned transcoder directory (empty when not provisioned).
    using TranscoderFactory = std::function<std::expected<std::unique_ptr<Transcoder>, std::string>(
        const std::filesystem::path& transcoder_dir)>;
    // Receives the provisioned model path (nullopt when not provisioned).
    using RecognizerFactory = std::function<std::expected<std::unique_ptr<Recognizer>, std::string>(
        const std::optional<std::filesystem::path>& model_path)>;

    struct Options {
        std::string model_variant = "large-v3";
        std::string language = "auto";
        uint32_t sample_rate = 16000;
        bool provision_transcoder = true;
        bool provision_model = true;
    };

    SubtitleGenerator(const WorkingCache& cache, AssetProvisioner& assets,
                      TranscoderFactory make_transcoder, RecognizerFactory make_recognizer,
                      Options options);

    // On cancellation returns kCancelled and writes nothing; segments()
    // still holds whatever was recognized before the stop.
    std::expected<srt::WrittenFile, std::string>
        generate(const std::filesystem::path& input, std::stop_token stop);

    const std::vector<Segment>& segments() const { return segments_; }

private:
    std::expected<void, std::string> recognize(Recognizer& recognizer, const AudioBuffer& audio,
                                               std::stop_token stop);

    const WorkingCache& cache_;
    AssetProvisioner& assets_;
    TranscoderFactory make_transcoder_;
    RecognizerFactory make_recognizer_;
    Options options_;
    std::vector<Segment> segments_;
};
