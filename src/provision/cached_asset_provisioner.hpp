#pragma once

#include "asset_provisioner.hpp"
#include "cached_asset.hpp"
#include "progress.hpp"
#include "working_cache.hpp"

#include "net/http_client.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

// Downloads the transcoder distribution and speech models into a
// WorkingCache on first use, and replaces a model whose size no longer
// matches the remote copy. Not safe against concurrent runs sharing a cache.
class CachedAssetProvisioner : public AssetProvisioner {
public:
    // Unpacks a downloaded archive into a staging directory.
    using Extractor = std::function<std::expected<void, std::string>(
        const std::filesystem::path& archive, const std::filesystem::path& dest)>;

    struct Options {
        std::string model_base_url;
        std::string transcoder_url;
        std::vector<std::string> transcoder_binaries = {"ffmpeg", "ffprobe"};
        std::chrono::milliseconds progress_interval{1000};
        ProgressCallback on_progress;
        Extractor extract;
    };

    CachedAssetProvisioner(const WorkingCache& cache, HttpClient& http, Options options);

    std::expected<std::filesystem::path, std::string>
        ensure_transcoder_available(std::stop_token stop) override;

    std::expected<std::filesystem::path, std::string>
        ensure_model_available(const std::string& variant, std::stop_token stop) override;

    AssetState model_state() const { return model_state_; }
    AssetState transcoder_state() const { return transcoder_state_; }

    // Runs "tar -xf archive -C dest".
    static std::expected<void, std::string> extract_with_tar(const std::filesystem::path& archive,
                                                             const std::filesystem::path& dest);

private:
    static void set_state(AssetState& slot, const std::string& asset, AssetState next);
    std::expected<void, std::string> install_transcoder(const std::filesystem::path& dir,
                                                        std::stop_token stop);

    const WorkingCache& cache_;
    HttpClient& http_;
    Options options_;
    AssetState model_state_ = AssetState::Unchecked;
    AssetState transcoder_state_ = AssetState::Unchecked;
};
