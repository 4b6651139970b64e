#pragma once

#include <array>
#include <algorithm>
#include <string>
#include <string_view>

// ggml model variants published for whisper.cpp.
namespace models {

inline constexpr std::array<std::string_view, 12> kVariants = {
    "tiny",   "tiny.en",   "base",     "base.en",  "small",    "small.en",
    "medium", "medium.en", "large-v1", "large-v2", "large-v3", "large-v3-turbo",
};

inline constexpr std::string_view kDefaultVariant = "large-v3";

inline bool is_known_variant(std::string_view variant) {
    return std::find(kVariants.begin(), kVariants.end(), variant) != kVariants.end();
}

inline std::string file_name(std::string_view variant) {
    return "ggml-" + std::string(variant) + ".bin";
}

inline std::string url(std::string_view base_url, std::string_view variant) {
    std::string out(base_url);
    if (!out.empty() && out.back() != '/') out += '/';
    return out + file_name(variant);
}

} // namespace models
