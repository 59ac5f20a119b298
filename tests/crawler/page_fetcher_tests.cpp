#include <catch2/catch_test_macros.hpp>
#include "PageFetcher.h"
#include "../../include/site_mirror/crawler/models/CrawlConfig.h"
#include <chrono>

using namespace site_mirror::crawler;

TEST_CASE("PageFetcher rejects non-http URLs", "[PageFetcher]") {
    PageFetcher fetcher("TestBot/1.0", std::chrono::seconds(5));

    SECTION("Other schemes") {
        auto result = fetcher.fetch("ftp://example.com/file");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.failureType == FailureType::BAD_URL);
        REQUIRE_FALSE(result.errorMessage.empty());
    }

    SECTION("Relative references") {
        auto result = fetcher.fetch("/about");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.failureType == FailureType::BAD_URL);
    }
}

TEST_CASE("PageFetcher classifies connection failures", "[PageFetcher]") {
    PageFetcher fetcher("TestBot/1.0", std::chrono::seconds(5));
    fetcher.setConnectTimeout(std::chrono::seconds(2));

    // Nothing listens on port 1 of the loopback interface
    auto result = fetcher.fetch("http://127.0.0.1:1/");

    REQUIRE_FALSE(result.success);
    REQUIRE(result.statusCode == 0);
    REQUIRE(result.failureType == FailureType::CONNECTION);
    REQUIRE(result.curlCode != 0);
    REQUIRE_FALSE(result.errorMessage.empty());
}

TEST_CASE("PageFetcher accepts configuration", "[PageFetcher]") {
    PageFetcher fetcher("TestBot/1.0", std::chrono::milliseconds(100), false, 0);
    fetcher.setVerifySSL(false);
    fetcher.setCustomHeaders(CrawlConfig().requestHeaders);

    auto result = fetcher.fetch("http://127.0.0.1:1/");
    REQUIRE_FALSE(result.success);
}
