#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Size of the resource after redirects, or nullopt when the server does
    // not announce one.
    virtual std::expected<std::optional<uint64_t>, std::string>
        content_length(const std::string& url) = 0;

    // Streams the body into dest (truncated first). Bytes already written
    // stay on disk when the transfer fails or is cancelled.
    virtual std::expected<void, std::string>
        download(const std::string& url, const std::filesystem::path& dest,
                 std::stop_token stop) = 0;
};
