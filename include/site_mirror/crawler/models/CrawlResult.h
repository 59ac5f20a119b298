#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "FailureType.h"

namespace site_mirror::crawler {

// Job-level failure reasons. Per-page and per-asset failures never fail a job.
enum class CrawlErrorKind {
    NONE,
    CONFIGURATION,      // Unsupported platform, bad start URL, missing output root
    CAPACITY_EXCEEDED,  // Explicit selection larger than the configured ceiling
    IO_ERROR            // Output root cannot be created
};

std::string crawlErrorKindName(CrawlErrorKind kind);

struct PageRecord {
    std::string url;

    // Clean path relative to the output root
    std::string localPath;

    std::string title;
};

struct FailedPage {
    std::string url;
    FailureType failureType = FailureType::UNKNOWN;
    int statusCode = 0;
    std::string errorMessage;
};

struct CrawlResult {
    bool success = false;

    // Number of page files written
    size_t pageCount = 0;

    std::string outputRoot;

    CrawlErrorKind errorKind = CrawlErrorKind::NONE;
    std::string message;

    std::vector<PageRecord> pages;
    std::vector<FailedPage> failedPages;

    // Unique asset URLs stored under the output root
    size_t assetCount = 0;
};

struct DiscoveryResult {
    bool success = false;
    CrawlErrorKind errorKind = CrawlErrorKind::NONE;
    std::string message;
    std::vector<PageRecord> pages;
};

} // namespace site_mirror::crawler
