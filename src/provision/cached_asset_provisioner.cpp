#include "cached_asset_provisioner.hpp"
#include "model_catalog.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"
#include "platform/process.hpp"

#include <format>
#include <optional>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool directory_has_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    return fs::directory_iterator(dir, ec) != fs::directory_iterator();
}

// Removes a staging path on scope exit; failures are only logged.
struct ScopedRemove {
    fs::path path;
    ~ScopedRemove() {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) logging::debug("could not remove {}: {}", path.string(), ec.message());
    }
};

// Leaves dir in place but removes everything inside it.
void clear_directory(const fs::path& dir) {
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
        if (rm_ec) logging::warn("could not remove {}: {}", it->path().string(), rm_ec.message());
    }
    if (ec) logging::warn("could not clear {}: {}", dir.string(), ec.message());
}

} // namespace

CachedAssetProvisioner::CachedAssetProvisioner(const WorkingCache& cache, HttpClient& http,
                                               Options options)
    : cache_(cache), http_(http), options_(std::move(options)) {
    if (!options_.extract) options_.extract = &CachedAssetProvisioner::extract_with_tar;
}

void CachedAssetProvisioner::set_state(AssetState& slot, const std::string& asset, AssetState next) {
    if (slot != next) logging::debug("{}: {} -> {}", asset, to_string(slot), to_string(next));
    slot = next;
}

std::expected<fs::path, std::string>
CachedAssetProvisioner::ensure_transcoder_available(std::stop_token stop) {
    set_state(transcoder_state_, "ffmpeg", AssetState::Unchecked);
    auto dir = cache_.transcoder_dir();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("transcoder: cannot create {}: {}", dir.string(), ec.message()));
    }

    logging::info("Checking FFmpeg...");
    if (directory_has_files(dir)) {
        set_state(transcoder_state_, "ffmpeg", AssetState::Ready);
        return dir;
    }

    logging::info("FFmpeg not found - downloading...");
    set_state(transcoder_state_, "ffmpeg", AssetState::Downloading);
    auto installed = install_transcoder(dir, stop);
    if (!installed) {
        set_state(transcoder_state_, "ffmpeg", AssetState::Unchecked);
        return std::unexpected(installed.error());
    }

    logging::info("FFmpeg downloaded");
    set_state(transcoder_state_, "ffmpeg", AssetState::Ready);
    return dir;
}

std::expected<void, std::string> CachedAssetProvisioner::install_transcoder(const fs::path& dir,
                                                                            std::stop_token stop) {
    // Download and unpack beside the target; dir is only written once every
    // binary has been found, and is emptied again if installing one fails.
    auto archive = cache_.root() / "ffmpeg-download.archive";
    auto staging = cache_.root() / "ffmpeg-staging";
    ScopedRemove remove_archive{archive};
    ScopedRemove remove_staging{staging};

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return std::unexpected(std::format("transcoder: cannot create {}: {}", staging.string(), ec.message()));
    }

    // The size is only used for progress; a failed HEAD request does not stop the download.
    std::optional<uint64_t> total;
    if (auto size = http_.content_length(options_.transcoder_url)) {
        total = *size;
    } else {
        logging::debug("transcoder: {}", size.error());
    }

    std::expected<void, std::string> downloaded;
    {
        ProgressSampler sampler(archive, ProgressTracker("ffmpeg", total),
                                options_.progress_interval, options_.on_progress);
        sampler.start(stop);
        downloaded = http_.download(options_.transcoder_url, archive, stop);
        sampler.stop();
    }
    if (!downloaded) {
        return std::unexpected("transcoder: download failed: " + downloaded.error());
    }

    auto extracted = options_.extract(archive, staging);
    if (!extracted) {
        return std::unexpected("transcoder: extraction failed: " + extracted.error());
    }

    std::vector<std::pair<fs::path, fs::path>> binaries;
    for (const auto& tool : options_.transcoder_binaries) {
        auto name = platform::executable_name(tool);

        fs::path found;
        for (auto it = fs::recursive_directory_iterator(staging, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().filename() == name) {
                found = it->path();
                break;
            }
        }
        if (ec) {
            return std::unexpected(std::format("transcoder: cannot scan {}: {}", staging.string(), ec.message()));
        }
        if (found.empty()) {
            return std::unexpected(std::format("transcoder: {} not found in archive", name));
        }
        binaries.emplace_back(found, dir / name);
    }

    for (const auto& [found, target] : binaries) {
        std::expected<void, std::string> installed;
        fs::copy_file(found, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            installed = std::unexpected(std::format("cannot install {}: {}", target.string(), ec.message()));
        } else {
            installed = platform::make_executable(target);
        }

        if (!installed) {
            clear_directory(dir);
            return std::unexpected("transcoder: " + installed.error());
        }
        logging::debug("installed {}", target.string());
    }

    return {};
}

std::expected<fs::path, std::string>
CachedAssetProvisioner::ensure_model_available(const std::string& variant, std::stop_token stop) {
    set_state(model_state_, variant, AssetState::Unchecked);
    if (!models::is_known_variant(variant)) {
        return std::unexpected("model: unknown variant " + variant);
    }

    logging::info("Checking speech model...");
    auto url = models::url(options_.model_base_url, variant);
    auto remote_size = http_.content_length(url);
    if (!remote_size) {
        return std::unexpected("model: " + remote_size.error());
    }

    auto asset = CachedAsset::inspect(variant, cache_.model_path(variant), *remote_size);
    if (asset.exists && !asset.is_valid()) {
        logging::info("Model size mismatch - deleting model");
        logging::debug("{}: {} bytes on disk, {} expected", asset.path.string(),
                       asset.actual_size, *asset.expected_size);
        std::error_code ec;
        fs::remove(asset.path, ec);
        if (ec) {
            return std::unexpected(std::format("model: cannot delete {}: {}", asset.path.string(), ec.message()));
        }
        asset.exists = false;
    }

    if (asset.is_valid()) {
        logging::info("Model already exists: {}", asset.path.string());
        set_state(model_state_, variant, AssetState::Ready);
        return asset.path;
    }

    logging::info("Downloading model: {}", variant);
    set_state(model_state_, variant, AssetState::Downloading);

    std::expected<void, std::string> downloaded;
    {
        ProgressSampler sampler(asset.path, ProgressTracker(variant, *remote_size),
                                options_.progress_interval, options_.on_progress);
        sampler.start(stop);
        downloaded = http_.download(url, asset.path, stop);
        sampler.stop();
    }

    if (!downloaded) {
        // The partial file is left for the next run's size check.
        set_state(model_state_, variant, AssetState::Unchecked);
        return std::unexpected("model: download failed: " + downloaded.error());
    }

    logging::info("Model downloaded: {}", asset.path.string());
    set_state(model_state_, variant, AssetState::Ready);
    return asset.path;
}

std::expected<void, std::string> CachedAssetProvisioner::extract_with_tar(const fs::path& archive,
                                                                          const fs::path& dest) {
    return platform::run_process({"tar", "-xf", archive.string(), "-C", dest.string()});
}
