#include "progress.hpp"

#include <cmath>

namespace fs = std::filesystem;

ProgressTracker::ProgressTracker(std::string asset, std::optional<uint64_t> total)
    : asset_(std::move(asset)), total_(total) {}

double ProgressTracker::round_fraction(uint64_t bytes, uint64_t total) {
    if (total == 0) return 0.0;
    double fraction = static_cast<double>(bytes) / static_cast<double>(total);
    return std::round(fraction * 10000.0) / 10000.0;
}

std::optional<DownloadProgress> ProgressTracker::update(uint64_t bytes) {
    if (total_ && *total_ > 0) {
        double rounded = round_fraction(bytes, *total_);
        if (rounded == last_fraction_) return std::nullopt;
        last_fraction_ = rounded;
        last_bytes_ = bytes;
        return DownloadProgress{.asset = asset_, .bytes = bytes, .total = total_, .fraction = rounded};
    }

    if (bytes == last_bytes_) return std::nullopt;
    last_bytes_ = bytes;
    return DownloadProgress{.asset = asset_, .bytes = bytes, .total = total_, .fraction = std::nullopt};
}

ProgressSampler::ProgressSampler(fs::path file, ProgressTracker tracker,
                                 std::chrono::milliseconds interval, ProgressCallback on_progress)
    : file_(std::move(file)), tracker_(std::move(tracker)), interval_(interval),
      on_progress_(std::move(on_progress)) {}

ProgressSampler::~ProgressSampler() {
    stop();
}

void ProgressSampler::start(std::stop_token cancel) {
    if (!on_progress_ || thread_.joinable()) return;

    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    cancel_link_.emplace(std::move(cancel), [this] { thread_.request_stop(); });
}

void ProgressSampler::stop() {
    cancel_link_.reset();
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void ProgressSampler::run(std::stop_token stop) {
    std::unique_lock lock(mu_);
    while (!stop.stop_requested()) {
        // Returns early when stop is requested.
        cv_.wait_for(lock, stop, interval_, [] { return false; });
        if (stop.stop_requested()) break;

        std::error_code ec;
        auto size = fs::file_size(file_, ec);
        if (ec) continue;

        if (auto event = tracker_.update(size)) {
            on_progress_(*event);
        }
    }
}
