#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace site_mirror::crawler {

struct CrawlConfig {
    // Sent with every page and asset request
    std::string userAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                            "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    // Total time allowed for one page or asset request
    std::chrono::milliseconds requestTimeout{30000};

    // Time allowed for establishing the connection
    std::chrono::milliseconds connectTimeout{10000};

    // Sent in addition to the User-Agent
    std::vector<std::pair<std::string, std::string>> requestHeaders = {
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.9"},
    };

    bool followRedirects = true;
    size_t maxRedirects = 5;
    bool verifySSL = true;

    // === DISCOVERY ===

    // Pages deeper than this (start page = 0) are not fetched
    size_t discoveryMaxDepth = 3;

    // Newly discovered internal links followed per page
    size_t discoveryFanOut = 10;

    // === MIRROR ===

    // Ceiling on visited pages when following every internal link
    size_t maxMirrorPages = 150;

    // Ceiling on an explicit page selection
    size_t maxSelectedPages = 25;

    // Asset downloads issued in parallel while rewriting one page
    size_t maxConcurrentAssetDownloads = 6;

    // Rewrite url(...) references inside downloaded stylesheets
    bool rewriteStylesheets = true;
};

} // namespace site_mirror::crawler
