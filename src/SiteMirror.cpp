#include "../include/site_mirror/SiteMirror.h"
#include "../include/Logger.h"
#include "../include/site_mirror/crawler/PathMapper.h"
#include "crawler/Crawler.h"
#include "crawler/PageFetcher.h"
#include "crawler/PlatformStripper.h"
#include <filesystem>
#include <system_error>
#include <unordered_set>

namespace site_mirror {

using namespace crawler;

namespace {

std::unique_ptr<HttpClient> makePageFetcher(const CrawlConfig& config) {
    auto fetcher = std::make_unique<PageFetcher>(config.userAgent, config.requestTimeout,
                                                 config.followRedirects, config.maxRedirects);
    fetcher->setVerifySSL(config.verifySSL);
    fetcher->setConnectTimeout(config.connectTimeout);
    fetcher->setCustomHeaders(config.requestHeaders);
    return fetcher;
}

CrawlResult rejected(const CrawlJob& job, CrawlErrorKind kind, const std::string& message) {
    LOG_ERROR("Rejecting crawl of " + job.startUrl + ": " + message);
    CrawlResult result;
    result.success = false;
    result.outputRoot = job.outputRoot;
    result.errorKind = kind;
    result.message = message;
    return result;
}

} // namespace

SiteMirror::SiteMirror(const CrawlConfig& config)
    : ownedClient(makePageFetcher(config))
    , client(*ownedClient)
    , config(config) {
}

SiteMirror::SiteMirror(HttpClient& client, const CrawlConfig& config)
    : client(client)
    , config(config) {
}

SiteMirror::~SiteMirror() = default;

std::optional<CrawlResult> SiteMirror::validate(const CrawlJob& job, CrawlJob& normalized) const {
    normalized = job;

    if (!parsePlatform(job.platform)) {
        return rejected(job, CrawlErrorKind::CONFIGURATION, "Unsupported platform: " + job.platform);
    }
    if (!isHttpUrl(job.startUrl)) {
        return rejected(job, CrawlErrorKind::CONFIGURATION, "Invalid start URL: " + job.startUrl);
    }
    if (job.outputRoot.empty()) {
        return rejected(job, CrawlErrorKind::CONFIGURATION, "Output root is required");
    }

    if (job.mode == CrawlMode::MULTI_PAGE && job.selectedPages && !job.selectedPages->empty()) {
        std::vector<std::string> selection;
        std::unordered_set<std::string> seen;
        for (const auto& page : *job.selectedPages) {
            std::string url = resolveUrl(job.startUrl, page);
            if (!isHttpUrl(url)) {
                return rejected(job, CrawlErrorKind::CONFIGURATION, "Invalid selected page: " + page);
            }
            if (seen.insert(canonicalPageUrl(url)).second) {
                selection.push_back(url);
            }
        }
        if (selection.size() > config.maxSelectedPages) {
            return rejected(job, CrawlErrorKind::CAPACITY_EXCEEDED,
                            "Too many selected pages: " + std::to_string(selection.size()) +
                            " (maximum " + std::to_string(config.maxSelectedPages) + ")");
        }
        normalized.selectedPages = selection;
    } else {
        normalized.selectedPages.reset();
    }
    return std::nullopt;
}

CrawlResult SiteMirror::crawl(const CrawlJob& job) {
    CrawlJob normalized;
    if (auto failure = validate(job, normalized)) {
        return *failure;
    }

    std::error_code ec;
    std::filesystem::create_directories(normalized.outputRoot, ec);
    if (ec) {
        return rejected(job, CrawlErrorKind::IO_ERROR,
                        "Cannot create output root " + normalized.outputRoot + ": " + ec.message());
    }

    Platform platform = parsePlatform(normalized.platform).value_or(Platform::GENERAL);
    std::unique_ptr<PlatformStripper> stripper = makeStripper(platform);

    Crawler crawler(client, config);
    return crawler.mirror(normalized, *stripper);
}

DiscoveryResult SiteMirror::discover(const std::string& startUrl, const std::string& platform) {
    DiscoveryResult result;
    if (!parsePlatform(platform)) {
        result.errorKind = CrawlErrorKind::CONFIGURATION;
        result.message = "Unsupported platform: " + platform;
        LOG_ERROR("Rejecting discovery of " + startUrl + ": " + result.message);
        return result;
    }
    if (!isHttpUrl(startUrl)) {
        result.errorKind = CrawlErrorKind::CONFIGURATION;
        result.message = "Invalid start URL: " + startUrl;
        LOG_ERROR("Rejecting discovery: " + result.message);
        return result;
    }

    Crawler crawler(client, config);
    return crawler.discover(startUrl);
}

} // namespace site_mirror
