#include "subtitle_generator.hpp"

#include "log.hpp"

namespace fs = std::filesystem;

SubtitleGenerator::SubtitleGenerator(const WorkingCache& cache, AssetProvisioner& assets,
                                     TranscoderFactory make_transcoder,
                                     RecognizerFactory make_recognizer, Options options)
    : cache_(cache), assets_(assets), make_transcoder_(std::move(make_transcoder)),
      make_recognizer_(std::move(make_recognizer)), options_(std::move(options)) {}

std::expected<srt::WrittenFile, std::string>
SubtitleGenerator::generate(const fs::path& input, std::stop_token stop) {
    segments_.clear();
    auto cancelled = [] { return std::unexpected(std::string(kCancelled)); };

    if (auto ok = cache_.ensure(); !ok) {
        return std::unexpected(ok.error());
    }

    logging::info("Checking libraries...");
    fs::path transcoder_dir;
    if (options_.provision_transcoder) {
        auto dir = assets_.ensure_transcoder_available(stop);
        if (!dir) {
            if (stop.stop_requested()) return cancelled();
            return std::unexpected(dir.error());
        }
        transcoder_dir = *dir;
    }
    if (stop.stop_requested()) return cancelled();

    std::optional<fs::path> model_path;
    if (options_.provision_model) {
        auto path = assets_.ensure_model_available(options_.model_variant, stop);
        if (!path) {
            if (stop.stop_requested()) return cancelled();
            return std::unexpected(path.error());
        }
        model_path = *path;
    }
    if (stop.stop_requested()) return cancelled();

    auto recognizer = make_recognizer_(model_path);
    if (!recognizer) return std::unexpected(recognizer.error());

    auto transcoder = make_transcoder_(transcoder_dir);
    if (!transcoder) return std::unexpected(transcoder.error());

    // Derived before decoding, which may delete the input.
    auto subtitle_path = srt::subtitle_path_for(input);

    logging::info("Generating subtitles...");
    logging::info("Converting media to wave...");
    auto audio = (*transcoder)->decode(input, options_.sample_rate);
    if (!audio) return std::unexpected(audio.error());
    if (stop.stop_requested()) return cancelled();

    logging::info("Recognizing speech...");
    if (auto ok = recognize(**recognizer, *audio, stop); !ok) {
        if (stop.stop_requested()) return cancelled();
        return std::unexpected(ok.error());
    }
    if (stop.stop_requested()) return cancelled();

    logging::info("Generating subtitle...");
    return srt::write_document(subtitle_path, segments_);
}

std::expected<void, std::string>
SubtitleGenerator::recognize(Recognizer& recognizer, const AudioBuffer& audio, std::stop_token stop) {
    return recognizer.transcribe(audio, options_.language, stop, [this](Segment seg) {
        logging::info("Recognized speech: {}", seg.text);
        segments_.push_back(std::move(seg));
    });
}
