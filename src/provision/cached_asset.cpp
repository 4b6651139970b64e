#include "cached_asset.hpp"

namespace fs = std::filesystem;

const char* to_string(AssetState state) {
    switch (state) {
        case AssetState::Unchecked: return "unchecked";
        case AssetState::Downloading: return "downloading";
        case AssetState::Ready: return "ready";
    }
    return "unknown";
}

CachedAsset CachedAsset::inspect(std::string id, fs::path path,
                                 std::optional<uint64_t> expected_size) {
    CachedAsset asset{
        .id = std::move(id),
        .path = std::move(path),
        .expected_size = expected_size,
    };

    std::error_code ec;
    auto status = fs::status(asset.path, ec);
    if (ec || !fs::is_regular_file(status)) return asset;

    auto size = fs::file_size(asset.path, ec);
    if (ec) return asset;

    asset.exists = true;
    asset.actual_size = size;
    asset.executable = (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
    return asset;
}
