#pragma once

namespace site_mirror::crawler {

// Why a single page or asset request failed. Failures are never retried;
// the value only drives log messages and the crawl summary.
enum class FailureType {
    NONE,         // Request succeeded with a 2xx status
    HTTP_STATUS,  // Server answered with a non-2xx status
    TIMEOUT,      // Per-request timeout elapsed
    DNS,          // Host name could not be resolved
    CONNECTION,   // Connect/send/receive failure
    TLS,          // Certificate or handshake failure
    BAD_URL,      // URL rejected before any I/O
    UNKNOWN
};

} // namespace site_mirror::crawler
