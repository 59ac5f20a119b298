#include <catch2/catch_test_macros.hpp>
#include "../../include/site_mirror/crawler/models/CrawlConfig.h"
#include "../../include/site_mirror/crawler/models/CrawlJob.h"
#include "../../include/site_mirror/crawler/models/CrawlResult.h"
#include "../../include/site_mirror/crawler/models/ResultJson.h"

using namespace site_mirror::crawler;

TEST_CASE("Crawl modes parse from their names", "[CrawlModels]") {
    REQUIRE(parseCrawlMode("single_page") == CrawlMode::SINGLE_PAGE);
    REQUIRE(parseCrawlMode("MULTI_PAGE") == CrawlMode::MULTI_PAGE);
    REQUIRE_FALSE(parseCrawlMode("recursive").has_value());
    REQUIRE(crawlModeName(CrawlMode::SINGLE_PAGE) == "single_page");
}

TEST_CASE("Rejected jobs serialize their error kind", "[CrawlModels]") {
    CrawlResult result;
    result.outputRoot = "/tmp/out";
    result.errorKind = CrawlErrorKind::CAPACITY_EXCEEDED;
    result.message = "Too many selected pages: 30 (maximum 25)";

    nlohmann::json j = toJson(result);
    REQUIRE(j["success"] == false);
    REQUIRE(j["error_kind"] == "capacity_exceeded");
    REQUIRE(j["output_root"] == "/tmp/out");
    REQUIRE(j["pages"].empty());
    REQUIRE(j["failed_urls"].empty());

    REQUIRE(crawlErrorKindName(CrawlErrorKind::CONFIGURATION) == "configuration_error");
    REQUIRE(crawlErrorKindName(CrawlErrorKind::IO_ERROR) == "io_error");
}

TEST_CASE("Page records serialize url, title and path", "[CrawlModels]") {
    PageRecord record{"https://example.com/about", "about.html", "About"};
    nlohmann::json j = toJson(record);
    REQUIRE(j["url"] == "https://example.com/about");
    REQUIRE(j["path"] == "about.html");
    REQUIRE(j["title"] == "About");
}

TEST_CASE("Results with invalid UTF-8 still print", "[CrawlModels]") {
    CrawlResult result;
    result.errorKind = CrawlErrorKind::CONFIGURATION;
    result.message = "Invalid start URL: https://example.com/\xff\xfe";

    std::string text;
    REQUIRE_NOTHROW(text = dumpJson(toJson(result)));
    REQUIRE(text.find("Invalid start URL: https://example.com/\xEF\xBF\xBD") != std::string::npos);
    REQUIRE(text.find("\"error_kind\": \"configuration_error\"") != std::string::npos);
}

TEST_CASE("Default configuration sends browser-like request headers", "[CrawlModels]") {
    CrawlConfig config;
    bool hasAccept = false;
    bool hasLanguage = false;
    for (const auto& [name, value] : config.requestHeaders) {
        hasAccept = hasAccept || (name == "Accept" && value == "*/*");
        hasLanguage = hasLanguage || name == "Accept-Language";
    }
    REQUIRE(hasAccept);
    REQUIRE(hasLanguage);
}
