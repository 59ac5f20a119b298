#include "PageFetcher.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/site_mirror/crawler/PathMapper.h"
#include <mutex>
#include <stdexcept>

namespace site_mirror::crawler {

namespace {

std::once_flag curlGlobalInitFlag;

} // namespace

PageFetcher::PageFetcher(const std::string& userAgent,
                         std::chrono::milliseconds timeout,
                         bool followRedirects,
                         size_t maxRedirects)
    : userAgent(userAgent)
    , timeout(timeout)
    , connectTimeout(10000)
    , followRedirects(followRedirects)
    , maxRedirects(maxRedirects)
    , verifySSL(true) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);

    CURLcode globalInit = CURLE_OK;
    std::call_once(curlGlobalInitFlag, [&globalInit]() {
        globalInit = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (globalInit != CURLE_OK) {
        LOG_ERROR("Failed to initialize CURL: " + std::string(curl_easy_strerror(globalInit)));
        throw std::runtime_error("Failed to initialize CURL");
    }
}

PageFetcher::~PageFetcher() {
    LOG_DEBUG("PageFetcher destructor called");
}

PageFetchResult PageFetcher::fetch(const std::string& url) {
    const std::string cleanedUrl = sanitizeUrl(url);
    LOG_DEBUG("PageFetcher::fetch called for URL: " + cleanedUrl);
    PageFetchResult result;

    if (!isHttpUrl(cleanedUrl)) {
        result.errorMessage = "Not an http(s) URL";
        result.failureType = FailureType::BAD_URL;
        LOG_WARNING("Refusing to fetch " + cleanedUrl + ": " + result.errorMessage);
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.errorMessage = "Failed to create CURL handle";
        result.failureType = FailureType::UNKNOWN;
        LOG_ERROR("Error: " + result.errorMessage);
        return result;
    }

    curl_easy_setopt(curl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    // Set error buffer for better diagnostics
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    long timeoutMs = static_cast<long>(timeout.count());
    LOG_TRACE_STREAM("Setting timeout: " << timeoutMs << "ms");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);

    struct curl_slist* headers = nullptr;
    for (const auto& header : customHeaders) {
        std::string headerStr = header.first + ": " + header.second;
        LOG_TRACE("Adding custom header: " + headerStr);
        headers = curl_slist_append(headers, headerStr.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    std::string responseData;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);

    CURLcode res = curl_easy_perform(curl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        result.errorMessage = std::string(curl_easy_strerror(res));
        if (errbuf[0] != '\0') {
            result.errorMessage += " | " + std::string(errbuf);
        }
        result.curlCode = static_cast<int>(res);
        result.failureType = FailureClassifier::classify(0, res);
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + result.errorMessage + " (" +
                    FailureClassifier::describe(result.failureType) + ")");
        curl_easy_cleanup(curl);
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    // Get final URL (after redirects)
    char* finalUrl = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &finalUrl);
    result.finalUrl = finalUrl ? std::string(finalUrl) : cleanedUrl;

    result.content = std::move(responseData);

    // 2xx status codes are considered successful
    result.success = (result.statusCode >= 200 && result.statusCode < 300);
    result.failureType = FailureClassifier::classify(result.statusCode, CURLE_OK);

    if (result.success) {
        LOG_INFO("HTTP " + std::to_string(result.statusCode) + " " + cleanedUrl + " (" +
                 std::to_string(result.content.size()) + " bytes)");
    } else {
        result.errorMessage = "HTTP status " + std::to_string(result.statusCode);
        LOG_WARNING("HTTP " + std::to_string(result.statusCode) + " " + cleanedUrl);
    }

    curl_easy_cleanup(curl);
    return result;
}

void PageFetcher::setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers) {
    LOG_DEBUG("PageFetcher::setCustomHeaders called with " + std::to_string(headers.size()) + " headers");
    customHeaders = headers;
}

void PageFetcher::setVerifySSL(bool verify) {
    LOG_DEBUG("PageFetcher::setVerifySSL called with: " + std::string(verify ? "true" : "false"));
    verifySSL = verify;
}

void PageFetcher::setConnectTimeout(std::chrono::milliseconds value) {
    connectTimeout = value;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

} // namespace site_mirror::crawler
