#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../../include/site_mirror/crawler/HttpClient.h"
#include "../../include/site_mirror/crawler/models/CrawlConfig.h"

namespace site_mirror::crawler {

// Downloads stylesheets, scripts, images and fonts of one job into the
// output tree. Every absolute URL is requested at most once per job; later
// references, also from concurrent callers, reuse the stored path.
class AssetFetcher {
public:
    AssetFetcher(HttpClient& client,
                 const std::filesystem::path& outputRoot,
                 const std::string& siteHost,
                 const CrawlConfig& config);

    // Local path relative to the output root. Returns ref unchanged for
    // data: URIs, non-http references and failed downloads.
    std::string fetchAsset(const std::string& ref, const std::string& baseUrl);

    // Fetches several references with bounded parallelism. Maps each
    // distinct ref to the value fetchAsset() would return for it.
    std::unordered_map<std::string, std::string> fetchAll(const std::vector<std::string>& refs,
                                                          const std::string& baseUrl);

    // Rewrites url(...) references of a stylesheet. Referenced files are
    // downloaded and the references replaced with paths relative to
    // fromLocalPath, the stylesheet's (or page's) own location.
    std::string rewriteCssUrls(const std::string& css,
                               const std::string& cssBaseUrl,
                               const std::string& fromLocalPath);

    // Unique assets written so far
    size_t storedCount() const { return stored.load(); }

private:
    struct StoredAsset {
        std::string localPath;
        bool stylesheet = false;
        std::string content;
    };

    // Single-flight lookup: downloads on first request, waits otherwise
    std::optional<std::string> fetchShared(const std::string& absoluteUrl, bool processStylesheet);

    std::optional<StoredAsset> download(const std::string& absoluteUrl);

    // Absolute URL for ref, or nullopt when it must be left untouched
    std::optional<std::string> resolveAssetUrl(const std::string& ref, const std::string& baseUrl) const;

    HttpClient& client;
    std::filesystem::path outputRoot;
    std::string siteHost;
    size_t maxConcurrentDownloads;
    bool rewriteStylesheets;

    std::mutex cacheMutex;
    std::unordered_map<std::string, std::shared_future<std::optional<std::string>>> cache;
    std::atomic<size_t> stored{0};
};

} // namespace site_mirror::crawler
