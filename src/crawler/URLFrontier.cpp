#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/site_mirror/crawler/PathMapper.h"

namespace site_mirror::crawler {

URLFrontier::URLFrontier() {
    LOG_TRACE("URLFrontier constructor called");
}

URLFrontier::~URLFrontier() {
    LOG_TRACE("URLFrontier destructor called");
}

std::string URLFrontier::normalizeURL(const std::string& url) const {
    return canonicalPageUrl(url);
}

bool URLFrontier::addURL(const std::string& url, size_t depth) {
    std::string normalizedURL = normalizeURL(url);

    std::lock_guard<std::mutex> lock(mutex);
    if (visitedURLs.find(normalizedURL) != visitedURLs.end()) {
        LOG_TRACE("URL already visited, skipping: " + normalizedURL);
        return false;
    }
    pending.push_back(QueuedURL{normalizedURL, depth});
    LOG_TRACE_STREAM("Queued " << normalizedURL << " at depth " << depth << ", frontier size: " << pending.size());
    return true;
}

size_t URLFrontier::addURLs(const std::vector<std::string>& urls, size_t depth) {
    size_t added = 0;
    for (auto it = urls.rbegin(); it != urls.rend(); ++it) {
        if (addURL(*it, depth)) {
            added++;
        }
    }
    return added;
}

std::optional<QueuedURL> URLFrontier::claimNextURL() {
    std::lock_guard<std::mutex> lock(mutex);
    while (!pending.empty()) {
        QueuedURL next = std::move(pending.back());
        pending.pop_back();
        if (visitedURLs.insert(next.url).second) {
            return next;
        }
        LOG_TRACE("Skipping already visited URL: " + next.url);
    }
    return std::nullopt;
}

bool URLFrontier::markVisited(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex);
    return visitedURLs.insert(normalizeURL(url)).second;
}

bool URLFrontier::isVisited(const std::string& url) const {
    std::string normalizedURL = normalizeURL(url);
    std::lock_guard<std::mutex> lock(mutex);
    return visitedURLs.find(normalizedURL) != visitedURLs.end();
}

bool URLFrontier::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.empty();
}

size_t URLFrontier::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

size_t URLFrontier::visitedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return visitedURLs.size();
}

} // namespace site_mirror::crawler
