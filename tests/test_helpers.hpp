#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace testing {

// RAII temp directory that is removed with everything under it.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        auto tmpl_path = std::filesystem::temp_directory_path() / "subtitle_ai_test_XXXXXX";
        std::string s = tmpl_path.string();
        // mkdtemp needs a mutable char*
        std::vector<char> tmpl(s.begin(), s.end());
        tmpl.push_back('\0');
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path operator/(const std::string& name) const { return path / name; }
};

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

} // namespace testing
