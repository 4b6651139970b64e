#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "provision/model_catalog.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::expected<void, std::string> Config::validate() const {
    if (!models::is_known_variant(model.variant)) {
        return std::unexpected("config: unknown model variant " + model.variant);
    }
    if (backend.type != "local" && backend.type != "lan") {
        return std::unexpected("config: unknown backend type " + backend.type);
    }
    if (backend.api_format != "whisper.cpp" && backend.api_format != "openai") {
        return std::unexpected("config: unknown api_format " + backend.api_format);
    }
    if (audio.sample_rate == 0) {
        return std::unexpected("config: sample_rate must be positive");
    }
    // whisper.cpp only accepts 16 kHz input.
    if (backend.type == "local" && audio.sample_rate != 16000) {
        return std::unexpected(std::format("config: the local backend requires a 16000 Hz sample_rate, got {}",
                                           audio.sample_rate));
    }
    if (download.progress_interval_ms == 0) {
        return std::unexpected("config: progress_interval_ms must be positive");
    }
    if (cache.dir.empty()) {
        return std::unexpected("config: cache.dir must not be empty");
    }
    return {};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("cache")) {
            auto& c = j["cache"];
            if (c.contains("dir")) cfg.cache.dir = c["dir"].get<std::string>();
            if (c.contains("keep_temp_files")) cfg.cache.keep_temp_files = c["keep_temp_files"].get<bool>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("variant")) cfg.model.variant = m["variant"].get<std::string>();
            if (m.contains("base_url")) cfg.model.base_url = m["base_url"].get<std::string>();
        }

        if (j.contains("transcoder")) {
            auto& t = j["transcoder"];
            if (t.contains("url")) cfg.transcoder.url = t["url"].get<std::string>();
            if (t.contains("executable")) cfg.transcoder.executable = t["executable"].get<std::string>();
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
        }

        if (j.contains("recognition")) {
            auto& r = j["recognition"];
            if (r.contains("language")) cfg.recognition.language = r["language"].get<std::string>();
            if (r.contains("threads")) cfg.recognition.threads = r["threads"].get<int>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
        }

        if (j.contains("download")) {
            auto& d = j["download"];
            if (d.contains("progress_interval_ms")) {
                cfg.download.progress_interval_ms = d["progress_interval_ms"].get<uint32_t>();
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}
