#pragma once

#include <string>
#include <curl/curl.h>
#include "../../include/site_mirror/crawler/models/FailureType.h"

namespace site_mirror::crawler {

class FailureClassifier {
public:
    /**
     * Classify the outcome of a transfer
     * @param httpCode HTTP status code (0 if no response was received)
     * @param curlCode CURL result of the transfer
     * @return NONE for a 2xx response, otherwise the failure category
     */
    static FailureType classify(int httpCode, CURLcode curlCode);

    /**
     * Get a human-readable description of the failure type
     * @param failureType The failure type
     * @return String description
     */
    static std::string describe(FailureType failureType);

private:
    /**
     * Map a CURL error to a failure category
     * @param curlCode CURL error code, never CURLE_OK
     */
    static FailureType classifyCurlError(CURLcode curlCode);
};

} // namespace site_mirror::crawler
