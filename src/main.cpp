#include "asr/lan_recognizer.hpp"
#include "asr/whisper_recognizer.hpp"
#include "config.hpp"
#include "log.hpp"
#include "media/ffmpeg_transcoder.hpp"
#include "net/curl_http_client.hpp"
#include "pipeline/subtitle_generator.hpp"
#include "platform/platform_paths.hpp"
#include "platform/signal_watcher.hpp"
#include "provision/cached_asset_provisioner.hpp"

#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

static const std::string version("subtitle-ai 1.0.0");

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <input-media>", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH     Config file path");
    std::println(stderr, "  -m, --model VARIANT   Whisper model variant (default: large-v3)");
    std::println(stderr, "  -l, --language CODE   Spoken language, or \"auto\" (default)");
    std::println(stderr, "  -k, --keep-temp       Keep the input and intermediate audio files");
    std::println(stderr, "      --cache-dir DIR   Working cache directory");
    std::println(stderr, "      --backend TYPE    local | lan");
    std::println(stderr, "      --url URL         Server URL for the lan backend");
    std::println(stderr, "  -v, --verbose         Enable debug logging");
    std::println(stderr, "  -q, --quiet           Only log warnings and errors");
    std::println(stderr, "  -V, --version         Print version and exit");
    std::println(stderr, "  -h, --help            Show this help");
}

static void report_progress(const DownloadProgress& p) {
    std::string_view what = p.asset == "ffmpeg" ? "FFmpeg" : "model";
    if (p.fraction) {
        logging::info("Downloading {}: {:.2f}%", what, *p.fraction * 100.0);
    } else {
        logging::info("Downloading {}: {} bytes", what, p.bytes);
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string input;
    std::optional<std::string> model, language, cache_dir, backend, url;
    bool keep_temp = false;
    bool verbose = false;
    bool quiet = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires an argument", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto next_opt = [&](std::optional<std::string>& out) {
            std::string v;
            if (!next(v)) return false;
            out = std::move(v);
            return true;
        };

        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-V") {
            std::println("{}", version);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--keep-temp" || arg == "-k") {
            keep_temp = true;
        } else if (arg == "--config" || arg == "-c") {
            ok = next(config_path);
        } else if (arg == "--model" || arg == "-m") {
            ok = next_opt(model);
        } else if (arg == "--language" || arg == "-l") {
            ok = next_opt(language);
        } else if (arg == "--cache-dir") {
            ok = next_opt(cache_dir);
        } else if (arg == "--backend") {
            ok = next_opt(backend);
        } else if (arg == "--url") {
            ok = next_opt(url);
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            ok = false;
        } else if (input.empty()) {
            input = arg;
        } else {
            std::println(stderr, "Only one input file may be given");
            ok = false;
        }

        if (!ok) {
            usage(argv[0]);
            return 1;
        }
    }

    if (input.empty()) {
        usage(argv[0]);
        return 1;
    }

    if (verbose) logging::set_level(logging::Level::Debug);
    else if (quiet) logging::set_level(logging::Level::Warn);

    // Load config, then apply command line overrides
    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (model) config.model.variant = *model;
    if (language) config.recognition.language = *language;
    if (cache_dir) config.cache.dir = *cache_dir;
    if (backend) config.backend.type = *backend;
    if (url) config.backend.url = *url;
    if (keep_temp) config.cache.keep_temp_files = true;
    if (config.transcoder.url.empty()) config.transcoder.url = platform::default_transcoder_url();

    if (auto valid = config.validate(); !valid) {
        logging::error("{}", valid.error());
        return 1;
    }

    std::stop_source cancel;
    SignalWatcher signals(cancel);
    if (!signals.start()) {
        logging::warn("signal handling unavailable, Ctrl+C will not cancel cleanly");
    }

    WorkingCache cache{fs::path(config.cache.dir)};
    CurlHttpClient http;
    CachedAssetProvisioner assets(cache, http, {
        .model_base_url = config.model.base_url,
        .transcoder_url = config.transcoder.url,
        .progress_interval = std::chrono::milliseconds(config.download.progress_interval_ms),
        .on_progress = report_progress,
    });

    const bool use_system_ffmpeg = !config.transcoder.executable.empty();
    auto make_transcoder = [&](const fs::path& dir)
        -> std::expected<std::unique_ptr<Transcoder>, std::string> {
        fs::path exe = use_system_ffmpeg ? fs::path(config.transcoder.executable)
                                         : dir / platform::executable_name("ffmpeg");
        return std::make_unique<FfmpegTranscoder>(exe, cache, config.cache.keep_temp_files);
    };

    auto make_recognizer = [&](const std::optional<fs::path>& model_path)
        -> std::expected<std::unique_ptr<Recognizer>, std::string> {
        if (config.backend.type == "lan") {
            logging::debug("using lan backend at {} ({})", config.backend.url, config.backend.api_format);
            return std::make_unique<LanRecognizer>(config.backend.url, config.backend.api_format);
        }
        if (!model_path) {
            return std::unexpected("no model available for the local backend");
        }
        auto loaded = WhisperRecognizer::load(*model_path, config.recognition.threads);
        if (!loaded) return std::unexpected(loaded.error());
        return std::unique_ptr<Recognizer>(std::move(*loaded));
    };

    SubtitleGenerator generator(cache, assets, make_transcoder, make_recognizer, {
        .model_variant = config.model.variant,
        .language = config.recognition.language,
        .sample_rate = config.audio.sample_rate,
        .provision_transcoder = !use_system_ffmpeg,
        .provision_model = config.backend.type == "local",
    });

    auto result = generator.generate(fs::path(input), cancel.get_token());
    if (!result) {
        if (cancel.stop_requested()) {
            logging::warn("cancelled after {} segments, no subtitle written",
                          generator.segments().size());
            return 130;
        }
        logging::error("{}", result.error());
        return 1;
    }

    logging::info("Subtitle written: {} ({} entries, {} bytes)",
                  result->path.string(), result->entries, result->size_bytes);
    std::println("{}", result->path.string());
    return 0;
}
