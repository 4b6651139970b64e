#pragma once

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Cache {
        std::string dir = ".subtitle-ai-cache";
        bool keep_temp_files = false;
    } cache;

    struct Model {
        std::string variant = "large-v3";
        std::string base_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    } model;

    struct Transcoder {
        std::string url;        // empty: platform default archive
        std::string executable; // empty: use the provisioned copy in the cache
    } transcoder;

    struct Backend {
        std::string type = "local"; // "local" or "lan"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } backend;

    struct Recognition {
        std::string language = "auto";
        int threads = 0; // 0: one per hardware thread
    } recognition;

    struct Audio {
        uint32_t sample_rate = 16000;
    } audio;

    struct Download {
        uint32_t progress_interval_ms = 1000;
    } download;

    std::expected<void, std::string> validate() const;

    static Config load(const std::string& path);
    static Config load_default();
};
