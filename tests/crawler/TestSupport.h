#pragma once

#include <algorithm>
#include <thread>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "../../include/site_mirror/crawler/HttpClient.h"

namespace site_mirror::test {

// In-memory transport serving canned responses and recording every request.
// Unknown URLs answer 404.
class FakeHttpClient : public crawler::HttpClient {
public:
    void addPage(const std::string& url, const std::string& html,
                 const std::string& contentType = "text/html; charset=utf-8") {
        addResponse(url, 200, html, contentType);
    }

    void addAsset(const std::string& url, const std::string& body, const std::string& contentType) {
        addResponse(url, 200, body, contentType);
    }

    void addResponse(const std::string& url, int statusCode, const std::string& body,
                     const std::string& contentType) {
        crawler::PageFetchResult response;
        response.success = statusCode >= 200 && statusCode < 300;
        response.statusCode = statusCode;
        response.content = body;
        response.contentType = contentType;
        response.finalUrl = url;
        response.failureType = response.success ? crawler::FailureType::NONE : crawler::FailureType::HTTP_STATUS;
        if (!response.success) {
            response.errorMessage = "HTTP status " + std::to_string(statusCode);
        }
        std::lock_guard<std::mutex> lock(mutex);
        responses[url] = response;
    }

    void addTimeout(const std::string& url) {
        crawler::PageFetchResult response;
        response.errorMessage = "Timeout was reached";
        response.failureType = crawler::FailureType::TIMEOUT;
        response.curlCode = 28;
        std::lock_guard<std::mutex> lock(mutex);
        responses[url] = response;
    }

    // Delays every response, used to overlap concurrent requests
    void setLatency(std::chrono::milliseconds value) {
        latency = value;
    }

    crawler::PageFetchResult fetch(const std::string& url) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            requestLog.push_back(url);
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        std::lock_guard<std::mutex> lock(mutex);
        auto it = responses.find(url);
        if (it != responses.end()) {
            return it->second;
        }
        crawler::PageFetchResult notFound;
        notFound.statusCode = 404;
        notFound.finalUrl = url;
        notFound.errorMessage = "HTTP status 404";
        notFound.failureType = crawler::FailureType::HTTP_STATUS;
        return notFound;
    }

    size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count(requestLog.begin(), requestLog.end(), url));
    }

    size_t totalRequests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requestLog.size();
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requestLog;
    }

private:
    mutable std::mutex mutex;
    std::map<std::string, crawler::PageFetchResult> responses;
    std::vector<std::string> requestLog;
    std::chrono::milliseconds latency{0};
};

// Scratch directory removed with everything in it when the test ends
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("site_mirror_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline size_t countFiles(const std::filesystem::path& root) {
    if (!std::filesystem::exists(root)) {
        return 0;
    }
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            count++;
        }
    }
    return count;
}

inline std::string readFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace site_mirror::test
