#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include "HtmlRewriter.h"
#include "../../include/site_mirror/crawler/HttpClient.h"
#include "../../include/site_mirror/crawler/models/CrawlConfig.h"
#include "../../include/site_mirror/crawler/models/CrawlJob.h"
#include "../../include/site_mirror/crawler/models/CrawlResult.h"

namespace site_mirror::crawler {

class AssetFetcher;
class PlatformStripper;

// Runs the page traversal of a job. Expects validated input; every call
// works on fresh per-job state (frontier, asset cache), so one instance can
// serve several jobs one after another.
class Crawler {
public:
    Crawler(HttpClient& client, const CrawlConfig& config);
    ~Crawler();

    // Mirror mode: fetch, rewrite, strip and write the job's pages
    CrawlResult mirror(const CrawlJob& job, const PlatformStripper& stripper);

    // Discovery mode: depth- and fan-out-limited traversal, writes nothing
    DiscoveryResult discover(const std::string& startUrl);

    // Whether a Content-Type header denotes an HTML document (empty counts)
    static bool isHtmlContentType(const std::string& contentType);

private:
    struct MirrorRun {
        std::filesystem::path outputRoot;
        const PlatformStripper& stripper;
        AssetFetcher& assets;
        HtmlRewriter& rewriter;
        CrawlResult& result;
        std::unordered_map<std::string, std::string> writtenPaths;  // clean path -> URL
    };

    // Process a single page; returns its links when the page could be fetched
    std::optional<PageLinks> mirrorPage(const std::string& url, MirrorRun& run);
    std::optional<PageLinks> discoverPage(const std::string& url, DiscoveryResult& result);

    void runUnrestrictedMirror(const std::string& startUrl, MirrorRun& run);

    static FailedPage failedPage(const std::string& url, const PageFetchResult& response);

    HttpClient& client;
    CrawlConfig config;
};

} // namespace site_mirror::crawler
