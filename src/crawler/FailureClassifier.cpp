#include "FailureClassifier.h"
#include "../../include/Logger.h"

namespace site_mirror::crawler {

FailureType FailureClassifier::classify(int httpCode, CURLcode curlCode) {
    if (curlCode != CURLE_OK) {
        FailureType type = classifyCurlError(curlCode);
        LOG_DEBUG("Classified CURL error " + std::to_string(static_cast<int>(curlCode)) +
                  " as " + describe(type));
        return type;
    }

    if (httpCode >= 200 && httpCode < 300) {
        return FailureType::NONE;
    }

    if (httpCode == 0) {
        return FailureType::UNKNOWN;
    }

    LOG_DEBUG("Classified HTTP " + std::to_string(httpCode) + " as HTTP_STATUS");
    return FailureType::HTTP_STATUS;
}

std::string FailureClassifier::describe(FailureType failureType) {
    switch (failureType) {
        case FailureType::NONE:
            return "NONE";
        case FailureType::HTTP_STATUS:
            return "HTTP_STATUS";
        case FailureType::TIMEOUT:
            return "TIMEOUT";
        case FailureType::DNS:
            return "DNS";
        case FailureType::CONNECTION:
            return "CONNECTION";
        case FailureType::TLS:
            return "TLS";
        case FailureType::BAD_URL:
            return "BAD_URL";
        case FailureType::UNKNOWN:
            return "UNKNOWN";
        default:
            return "INVALID";
    }
}

FailureType FailureClassifier::classifyCurlError(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_OPERATION_TIMEDOUT:       // Transfer or connect timeout
            return FailureType::TIMEOUT;

        case CURLE_COULDNT_RESOLVE_HOST:     // DNS failure
        case CURLE_COULDNT_RESOLVE_PROXY:
            return FailureType::DNS;

        case CURLE_COULDNT_CONNECT:          // Refused or unreachable
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:              // Empty reply from server
        case CURLE_PARTIAL_FILE:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_TOO_MANY_REDIRECTS:
            return FailureType::CONNECTION;

        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
            return FailureType::TLS;

        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return FailureType::BAD_URL;

        default:
            return FailureType::UNKNOWN;
    }
}

} // namespace site_mirror::crawler
