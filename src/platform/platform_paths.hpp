#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace platform {

// Directory holding config.json, or empty if no home directory is known.
std::string config_dir();

// Static ffmpeg build archive for the architecture this binary targets.
std::string default_transcoder_url();

// Executable file name for a tool, e.g. "ffmpeg" (".exe" on Windows).
std::string executable_name(const std::string& tool);

// Adds execute permission to an installed tool.
std::expected<void, std::string> make_executable(const std::filesystem::path& file);

} // namespace platform
