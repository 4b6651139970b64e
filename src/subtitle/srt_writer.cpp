#include "srt_writer.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace srt {

std::string format_timestamp(std::chrono::milliseconds offset) {
    using namespace std::chrono;
    if (offset < milliseconds::zero()) offset = milliseconds::zero();

    auto h = duration_cast<hours>(offset);
    offset -= h;
    auto m = duration_cast<minutes>(offset);
    offset -= m;
    auto s = duration_cast<seconds>(offset);
    offset -= s;

    return std::format("{:02}:{:02}:{:02},{:03}", h.count(), m.count(), s.count(), offset.count());
}

std::string format_document(std::span<const Segment> segments) {
    std::string out;
    size_t index = 1;
    for (const auto& seg : segments) {
        out += std::format("{}\n", index++);
        out += format_timestamp(seg.start);
        out += " --> ";
        out += format_timestamp(seg.end);
        out += '\n';
        out += seg.text;
        out += "\n\n";
    }
    return out;
}

fs::path subtitle_path_for(const fs::path& media) {
    fs::path out = media;
    out.replace_extension(".srt");
    return out;
}

std::expected<WrittenFile, std::string>
write_document(const fs::path& path, std::span<const Segment> segments) {
    auto body = format_document(segments);

    // Binary mode so "\n" is never translated.
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected(std::format("srt: cannot open {} for writing: {}",
                                           path.string(), std::strerror(errno)));
    }
    f.write(body.data(), static_cast<std::streamsize>(body.size()));
    f.close();
    if (!f) {
        return std::unexpected(std::format("srt: write to {} failed", path.string()));
    }

    return WrittenFile{
        .path = path,
        .size_bytes = body.size(),
        .entries = segments.size(),
    };
}

} // namespace srt
