#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace site_mirror::crawler {

struct QueuedURL {
    std::string url;
    size_t depth = 0;  // Crawl depth (0 = start URL, 1 = first level, etc.)
};

// Work stack plus cycle guard of one crawl job. URLs are tracked by their
// canonical form and handed out last-in first-out, so pushing a page's links
// in reverse visits them depth-first in document order.
class URLFrontier {
public:
    URLFrontier();
    ~URLFrontier();

    // Add a URL unless it was already visited. Returns true if queued.
    bool addURL(const std::string& url, size_t depth = 0);

    // Add links so that links.front() is handed out first
    size_t addURLs(const std::vector<std::string>& urls, size_t depth);

    // Pops the next URL that has not been visited and marks it visited
    std::optional<QueuedURL> claimNextURL();

    // Mark a URL as visited. Returns false if it already was.
    bool markVisited(const std::string& url);

    // Check if a URL has been visited
    bool isVisited(const std::string& url) const;

    bool isEmpty() const;

    // URLs waiting on the stack, visited ones included until popped
    size_t size() const;

    size_t visitedCount() const;

private:
    std::string normalizeURL(const std::string& url) const;

    std::vector<QueuedURL> pending;
    std::unordered_set<std::string> visitedURLs;
    mutable std::mutex mutex;
};

} // namespace site_mirror::crawler
