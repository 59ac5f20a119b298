#include "../../include/site_mirror/crawler/models/CrawlJob.h"
#include "../../include/site_mirror/crawler/models/CrawlResult.h"
#include <algorithm>
#include <cctype>

namespace site_mirror::crawler {

std::optional<CrawlMode> parseCrawlMode(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "single_page") return CrawlMode::SINGLE_PAGE;
    if (lowered == "multi_page") return CrawlMode::MULTI_PAGE;
    return std::nullopt;
}

std::string crawlModeName(CrawlMode mode) {
    switch (mode) {
        case CrawlMode::SINGLE_PAGE: return "single_page";
        case CrawlMode::MULTI_PAGE: return "multi_page";
        default: return "unknown";
    }
}

std::string crawlErrorKindName(CrawlErrorKind kind) {
    switch (kind) {
        case CrawlErrorKind::NONE: return "none";
        case CrawlErrorKind::CONFIGURATION: return "configuration_error";
        case CrawlErrorKind::CAPACITY_EXCEEDED: return "capacity_exceeded";
        case CrawlErrorKind::IO_ERROR: return "io_error";
        default: return "unknown";
    }
}

} // namespace site_mirror::crawler
