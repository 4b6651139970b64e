#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

struct DownloadProgress {
    std::string asset;
    uint64_t bytes = 0;
    std::optional<uint64_t> total;
    // Fraction in [0, 1] rounded to 4 decimal places; unset when total is unknown.
    std::optional<double> fraction;
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

// Decides whether a byte count is worth reporting: only when the rounded
// fraction moves (or, with no known total, when the byte count moves).
class ProgressTracker {
public:
    ProgressTracker(std::string asset, std::optional<uint64_t> total);

    std::optional<DownloadProgress> update(uint64_t bytes);

    static double round_fraction(uint64_t bytes, uint64_t total);

private:
    std::string asset_;
    std::optional<uint64_t> total_;
    double last_fraction_ = 0.0;
    uint64_t last_bytes_ = 0;
};

// Samples the size of a file being written, once per interval, on its own
// thread. Purely observational: it never touches the file's contents and
// stat failures are ignored.
class ProgressSampler {
public:
    ProgressSampler(std::filesystem::path file, ProgressTracker tracker,
                    std::chrono::milliseconds interval, ProgressCallback on_progress);
    ~ProgressSampler();

    ProgressSampler(const ProgressSampler&) = delete;
    ProgressSampler& operator=(const ProgressSampler&) = delete;

    // Sampling also ends when `cancel` is triggered.
    void start(std::stop_token cancel);
    void stop();

private:
    void run(std::stop_token stop);

    std::filesystem::path file_;
    ProgressTracker tracker_;
    std::chrono::milliseconds interval_;
    ProgressCallback on_progress_;

    std::mutex mu_;
    std::condition_variable_any cv_;
    std::optional<std::stop_callback<std::function<void()>>> cancel_link_;
    std::jthread thread_;
};
