#include "Crawler.h"
#include "AssetFetcher.h"
#include "FailureClassifier.h"
#include "OutputWriter.h"
#include "PlatformStripper.h"
#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/site_mirror/crawler/PathMapper.h"
#include <algorithm>
#include <cctype>

namespace site_mirror::crawler {

Crawler::Crawler(HttpClient& client, const CrawlConfig& config)
    : client(client)
    , config(config) {
    LOG_DEBUG("Crawler constructor called");
}

Crawler::~Crawler() {
    LOG_DEBUG("Crawler destructor called");
}

bool Crawler::isHtmlContentType(const std::string& contentType) {
    if (contentType.empty()) {
        return true;
    }
    std::string lowered = contentType;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("text/html") != std::string::npos ||
           lowered.find("application/xhtml") != std::string::npos;
}

FailedPage Crawler::failedPage(const std::string& url, const PageFetchResult& response) {
    FailedPage failed;
    failed.url = url;
    failed.failureType = response.failureType;
    failed.statusCode = response.statusCode;
    failed.errorMessage = response.errorMessage;
    return failed;
}

CrawlResult Crawler::mirror(const CrawlJob& job, const PlatformStripper& stripper) {
    CrawlResult result;
    result.outputRoot = job.outputRoot;

    const std::string startUrl = canonicalPageUrl(job.startUrl);
    AssetFetcher assets(client, job.outputRoot, extractHost(startUrl), config);
    HtmlRewriter rewriter(assets);
    MirrorRun run{job.outputRoot, stripper, assets, rewriter, result, {}};

    LOG_INFO("Mirroring " + startUrl + " (" + crawlModeName(job.mode) + ", platform " +
             platformName(stripper.platform()) + ") into " + job.outputRoot);

    if (job.mode == CrawlMode::SINGLE_PAGE) {
        mirrorPage(startUrl, run);
    } else if (job.selectedPages && !job.selectedPages->empty()) {
        URLFrontier frontier;
        for (const auto& page : *job.selectedPages) {
            std::string url = canonicalPageUrl(page);
            if (!frontier.markVisited(url)) {
                LOG_DEBUG("Skipping duplicate selected page: " + url);
                continue;
            }
            mirrorPage(url, run);
        }
    } else {
        runUnrestrictedMirror(startUrl, run);
    }

    result.pageCount = result.pages.size();
    result.assetCount = assets.storedCount();
    result.success = true;
    result.message = "Mirrored " + std::to_string(result.pageCount) + " pages and " +
                     std::to_string(result.assetCount) + " assets";
    if (!result.failedPages.empty()) {
        result.message += ", " + std::to_string(result.failedPages.size()) + " pages skipped";
    }
    LOG_INFO(result.message);
    return result;
}

void Crawler::runUnrestrictedMirror(const std::string& startUrl, MirrorRun& run) {
    URLFrontier frontier;
    frontier.addURL(startUrl, 0);

    while (true) {
        if (frontier.visitedCount() >= config.maxMirrorPages) {
            if (!frontier.isEmpty()) {
                LOG_WARNING("Reached page limit (" + std::to_string(config.maxMirrorPages) + "), stopping crawl");
            }
            break;
        }
        auto next = frontier.claimNextURL();
        if (!next) {
            break;
        }

        LOG_INFO_STREAM("Crawling page " << next->url << " (" << frontier.visitedCount() << "/"
                        << config.maxMirrorPages << ", depth " << next->depth << ")");
        auto links = mirrorPage(next->url, run);
        if (links) {
            size_t added = frontier.addURLs(links->internalLinks, next->depth + 1);
            LOG_DEBUG("Queued " + std::to_string(added) + " links from " + next->url);
        }
    }
}

std::optional<PageLinks> Crawler::mirrorPage(const std::string& url, MirrorRun& run) {
    PageFetchResult response = client.fetch(url);
    if (!response.success) {
        LOG_WARNING("Skipping page " + url + " (" + FailureClassifier::describe(response.failureType) + "): " +
                    response.errorMessage);
        run.result.failedPages.push_back(failedPage(url, response));
        return std::nullopt;
    }
    if (!isHtmlContentType(response.contentType)) {
        LOG_WARNING("Skipping page " + url + ": not an HTML document (" + response.contentType + ")");
        response.errorMessage = "Unsupported content type " + response.contentType;
        run.result.failedPages.push_back(failedPage(url, response));
        return std::nullopt;
    }

    RewrittenPage page;
    std::string html;
    try {
        page = run.rewriter.rewrite(response.content, url);
        html = run.stripper.stripBadge(page.html);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to process page " + url + ": " + e.what());
        response.errorMessage = e.what();
        run.result.failedPages.push_back(failedPage(url, response));
        return std::nullopt;
    }

    std::string localPath = cleanPath(url);
    auto written = run.writtenPaths.find(localPath);
    if (written != run.writtenPaths.end()) {
        LOG_WARNING(url + " maps to " + localPath + ", already written for " + written->second);
    }

    if (!writeOutputFile(run.outputRoot, localPath, html)) {
        response.errorMessage = "Could not write " + localPath;
        run.result.failedPages.push_back(failedPage(url, response));
        return page.links;
    }
    run.writtenPaths[localPath] = url;

    PageRecord record;
    record.url = url;
    record.localPath = localPath;
    record.title = page.links.title.value_or(pageNameFromUrl(url));
    run.result.pages.push_back(record);
    LOG_INFO("Saved " + url + " as " + localPath);
    return page.links;
}

DiscoveryResult Crawler::discover(const std::string& startUrl) {
    DiscoveryResult result;
    URLFrontier frontier;
    frontier.addURL(startUrl, 0);

    LOG_INFO("Discovering pages of " + canonicalPageUrl(startUrl));

    while (auto next = frontier.claimNextURL()) {
        auto links = discoverPage(next->url, result);
        if (!links || next->depth >= config.discoveryMaxDepth) {
            continue;
        }

        std::vector<std::string> follow;
        for (const auto& link : links->internalLinks) {
            if (follow.size() >= config.discoveryFanOut) {
                break;
            }
            if (!frontier.isVisited(link)) {
                follow.push_back(link);
            }
        }
        frontier.addURLs(follow, next->depth + 1);
    }

    result.success = true;
    result.message = "Discovered " + std::to_string(result.pages.size()) + " pages";
    LOG_INFO(result.message);
    return result;
}

std::optional<PageLinks> Crawler::discoverPage(const std::string& url, DiscoveryResult& result) {
    PageFetchResult response = client.fetch(url);
    if (!response.success) {
        LOG_WARNING("Skipping page " + url + " (" + FailureClassifier::describe(response.failureType) + "): " +
                    response.errorMessage);
        return std::nullopt;
    }
    if (!isHtmlContentType(response.contentType)) {
        LOG_DEBUG("Ignoring non-HTML page " + url + " (" + response.contentType + ")");
        return std::nullopt;
    }

    PageLinks links = HtmlRewriter::inspect(response.content, url);

    PageRecord record;
    record.url = url;
    record.localPath = cleanPath(url);
    record.title = links.title.value_or(pageNameFromUrl(url));
    result.pages.push_back(record);
    LOG_DEBUG("Discovered " + url + " with " + std::to_string(links.internalLinks.size()) + " internal links");
    return links;
}

} // namespace site_mirror::crawler
