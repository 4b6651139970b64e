#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

enum class AssetState { Unchecked, Downloading, Ready };

const char* to_string(AssetState state);

// On-disk view of one downloadable dependency.
struct CachedAsset {
    std::string id;
    std::filesystem::path path;
    std::optional<uint64_t> expected_size;
    bool exists = false;
    uint64_t actual_size = 0;
    bool executable = false;

    // Exists, and matches the expected size when one is known.
    bool is_valid() const {
        return exists && (!expected_size || *expected_size == actual_size);
    }

    // Stats path without throwing; a stat failure reads as "does not exist".
    static CachedAsset inspect(std::string id, std::filesystem::path path,
                               std::optional<uint64_t> expected_size = std::nullopt);
};
