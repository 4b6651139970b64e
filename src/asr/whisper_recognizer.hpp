#pragma once

#include "recognizer.hpp"

#include <filesystem>
#include <memory>

struct whisper_context;

// In-process whisper.cpp inference over a ggml model file.
class WhisperRecognizer : public Recognizer {
public:
    static std::expected<std::unique_ptr<WhisperRecognizer>, std::string>
        load(const std::filesystem::path& model_path, int threads = 0);

    struct ContextDeleter {
        void operator()(whisper_context* ctx) const;
    };
    using ContextPtr = std::unique_ptr<whisper_context, ContextDeleter>;

    // Only load() can name Key, so construction goes through it.
    class Key {
        friend class WhisperRecognizer;
        Key() = default;
    };
    WhisperRecognizer(Key, ContextPtr ctx, int threads);

    std::expected<void, std::string>
        transcribe(const AudioBuffer& audio, const std::string& language,
                   std::stop_token stop, const SegmentSink& on_segment) override;

private:
    ContextPtr ctx_;
    int threads_;
};
