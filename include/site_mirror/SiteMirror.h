#pragma once

#include <memory>
#include <optional>
#include <string>
#include "crawler/HttpClient.h"
#include "crawler/models/CrawlConfig.h"
#include "crawler/models/CrawlJob.h"
#include "crawler/models/CrawlResult.h"

namespace site_mirror {

// Entry point of the library. Validates requests, picks the platform
// stripper and runs one crawler per call; no state is shared between calls.
class SiteMirror {
public:
    // Uses the libcurl transport configured from config.
    // Throws std::runtime_error if libcurl cannot be initialized.
    explicit SiteMirror(const crawler::CrawlConfig& config = crawler::CrawlConfig());

    // Uses the given transport, which must outlive this object
    SiteMirror(crawler::HttpClient& client, const crawler::CrawlConfig& config = crawler::CrawlConfig());

    ~SiteMirror();

    SiteMirror(const SiteMirror&) = delete;
    SiteMirror& operator=(const SiteMirror&) = delete;

    // Mirror the job's pages under job.outputRoot. Invalid jobs are rejected
    // before any request with success == false and an error kind.
    crawler::CrawlResult crawl(const crawler::CrawlJob& job);

    // List the site's pages without writing anything
    crawler::DiscoveryResult discover(const std::string& startUrl, const std::string& platform = "general");

private:
    // Failure result for an invalid job, nullopt if the job can run.
    // Resolves and de-duplicates the page selection of normalized.
    std::optional<crawler::CrawlResult> validate(const crawler::CrawlJob& job, crawler::CrawlJob& normalized) const;

    std::unique_ptr<crawler::HttpClient> ownedClient;
    crawler::HttpClient& client;
    crawler::CrawlConfig config;
};

} // namespace site_mirror
