#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/subtitle-ai";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/subtitle-ai";
}

std::string default_transcoder_url() {
#if defined(__aarch64__)
    return "https://johnvansickle.com/ffmpeg/releases/ffmpeg-release-arm64-static.tar.xz";
#elif defined(__i386__)
    return "https://johnvansickle.com/ffmpeg/releases/ffmpeg-release-i686-static.tar.xz";
#else
    return "https://johnvansickle.com/ffmpeg/releases/ffmpeg-release-amd64-static.tar.xz";
#endif
}

std::string executable_name(const std::string& tool) {
    return tool;
}

std::expected<void, std::string> make_executable(const std::filesystem::path& file) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::permissions(file, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return std::unexpected(std::format("chmod +x {} failed: {}", file.string(), ec.message()));
    }
    return {};
}

} // namespace platform
