#pragma once

#include "http_client.hpp"

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::expected<std::optional<uint64_t>, std::string>
        content_length(const std::string& url) override;

    std::expected<void, std::string>
        download(const std::string& url, const std::filesystem::path& dest,
                 std::stop_token stop) override;
};
