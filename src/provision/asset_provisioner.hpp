#pragma once

#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

class AssetProvisioner {
public:
    virtual ~AssetProvisioner() = default;

    // Returns the directory holding the transcoder executables.
    virtual std::expected<std::filesystem::path, std::string>
        ensure_transcoder_available(std::stop_token stop) = 0;

    // Returns the path of a model file whose size matches the remote copy.
    virtual std::expected<std::filesystem::path, std::string>
        ensure_model_available(const std::string& variant, std::stop_token stop) = 0;
};
