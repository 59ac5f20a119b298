#pragma once

#include <optional>
#include <string>
#include <vector>

namespace site_mirror::crawler {

enum class CrawlMode {
    SINGLE_PAGE,
    MULTI_PAGE
};

// Accepts "single_page" and "multi_page".
std::optional<CrawlMode> parseCrawlMode(const std::string& name);

std::string crawlModeName(CrawlMode mode);

// One mirror request. Built by the caller and never modified by the crawler.
struct CrawlJob {
    std::string startUrl;

    // Declared site platform, see parsePlatform()
    std::string platform = "general";

    CrawlMode mode = CrawlMode::MULTI_PAGE;

    // When present and non-empty, exactly these pages are mirrored
    std::optional<std::vector<std::string>> selectedPages;

    std::string outputRoot;
};

} // namespace site_mirror::crawler
