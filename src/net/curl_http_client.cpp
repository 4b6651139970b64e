#include "curl_http_client.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <format>

namespace {

constexpr const char* kUserAgent = "subtitle-ai/1.0";

struct DownloadSink {
    std::FILE* file = nullptr;
    bool write_failed = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t n = std::fwrite(ptr, size, nmemb, sink->file);
    if (n != nmemb) sink->write_failed = true;
    return n * size;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

void set_common_options(CURL* curl, const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

std::expected<std::optional<uint64_t>, std::string>
CurlHttpClient::content_length(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    set_common_options(curl, url);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    CURLcode res = curl_easy_perform(curl);
    curl_off_t length = -1;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::format("HEAD {} failed: {}", url, curl_easy_strerror(res)));
    }
    if (length < 0) return std::optional<uint64_t>{};
    return std::optional<uint64_t>{static_cast<uint64_t>(length)};
}

std::expected<void, std::string>
CurlHttpClient::download(const std::string& url, const std::filesystem::path& dest,
                         std::stop_token stop) {
    DownloadSink sink;
    sink.file = std::fopen(dest.c_str(), "wb");
    if (!sink.file) {
        return std::unexpected(std::format("cannot open {} for writing: {}",
                                           dest.string(), std::strerror(errno)));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(sink.file);
        return std::unexpected("curl_easy_init failed");
    }

    set_common_options(curl, url);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    // Abort stalled transfers: under 1 KiB/s for 60 seconds.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool close_failed = std::fclose(sink.file) != 0;

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("cancelled");
    }
    if (res == CURLE_WRITE_ERROR || sink.write_failed) {
        return std::unexpected(std::format("write to {} failed", dest.string()));
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::format("GET {} failed: {}", url, curl_easy_strerror(res)));
    }
    if (close_failed) {
        return std::unexpected(std::format("closing {} failed: {}", dest.string(), std::strerror(errno)));
    }
    return {};
}
