#include "working_cache.hpp"

#include "model_catalog.hpp"

#include <format>

namespace fs = std::filesystem;

WorkingCache::WorkingCache(fs::path root) : root_(std::move(root)) {}

std::expected<void, std::string> WorkingCache::ensure() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return std::unexpected(std::format("cache: cannot create {}: {}", root_.string(), ec.message()));
    }
    if (!fs::is_directory(root_, ec)) {
        return std::unexpected(std::format("cache: {} is not a directory", root_.string()));
    }
    return {};
}

fs::path WorkingCache::model_path(const std::string& variant) const {
    return root_ / models::file_name(variant);
}

fs::path WorkingCache::temp_audio_path(const fs::path& media) const {
    return root_ / media.filename().replace_extension(".wav");
}
