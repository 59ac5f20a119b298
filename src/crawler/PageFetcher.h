#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <curl/curl.h>
#include "../../include/site_mirror/crawler/HttpClient.h"

namespace site_mirror::crawler {

class PageFetcher : public HttpClient {
public:
    PageFetcher(const std::string& userAgent,
                std::chrono::milliseconds timeout,
                bool followRedirects = true,
                size_t maxRedirects = 5);
    ~PageFetcher() override;

    // Fetch a page or asset from a URL. Each call uses its own easy handle.
    PageFetchResult fetch(const std::string& url) override;

    // Set custom headers
    void setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers);

    // Enable/disable SSL verification
    void setVerifySSL(bool verify);

    void setConnectTimeout(std::chrono::milliseconds connectTimeout);

private:
    // Write callback for CURL
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string userAgent;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds connectTimeout;
    bool followRedirects;
    size_t maxRedirects;
    std::vector<std::pair<std::string, std::string>> customHeaders;
    bool verifySSL;
};

} // namespace site_mirror::crawler
