#pragma once

#include <string>
#include "models/FailureType.h"

namespace site_mirror::crawler {

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string errorMessage;
    std::string finalUrl;  // After redirects
    int curlCode = 0;      // CURLcode of the transfer, 0 when it completed
    FailureType failureType = FailureType::NONE;
};

// Blocking GET transport used for pages and assets. Implementations must be
// safe to call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // success is true only for a 2xx response
    virtual PageFetchResult fetch(const std::string& url) = 0;
};

} // namespace site_mirror::crawler
