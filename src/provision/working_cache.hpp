#pragma once

#include <expected>
#include <filesystem>
#include <string>

// The hidden directory holding downloaded assets and transient audio.
class WorkingCache {
public:
    explicit WorkingCache(std::filesystem::path root);

    // Creates the root if absent.
    std::expected<void, std::string> ensure() const;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path transcoder_dir() const { return root_ / "ffmpeg"; }
    std::filesystem::path model_path(const std::string& variant) const;
    // Intermediate decode target for a given input, e.g. "<root>/clip.wav".
    std::filesystem::path temp_audio_path(const std::filesystem::path& media) const;

private:
    std::filesystem::path root_;
};
