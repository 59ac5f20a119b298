#include "../../include/site_mirror/crawler/models/ResultJson.h"
#include "FailureClassifier.h"

namespace site_mirror::crawler {

nlohmann::json toJson(const PageRecord& page) {
    nlohmann::json item = nlohmann::json::object();
    item["url"] = page.url;
    item["title"] = page.title;
    item["path"] = page.localPath;
    return item;
}

nlohmann::json toJson(const FailedPage& page) {
    nlohmann::json item = nlohmann::json::object();
    item["url"] = page.url;
    item["failure"] = FailureClassifier::describe(page.failureType);
    item["status_code"] = page.statusCode;
    item["error"] = page.errorMessage;
    return item;
}

nlohmann::json toJson(const CrawlResult& result) {
    nlohmann::json j = nlohmann::json::object();
    j["success"] = result.success;
    j["page_count"] = result.pageCount;
    j["asset_count"] = result.assetCount;
    j["output_root"] = result.outputRoot;
    j["message"] = result.message;
    if (result.errorKind != CrawlErrorKind::NONE) {
        j["error_kind"] = crawlErrorKindName(result.errorKind);
    }

    j["pages"] = nlohmann::json::array();
    for (const auto& page : result.pages) {
        j["pages"].push_back(toJson(page));
    }
    j["failed_urls"] = nlohmann::json::array();
    for (const auto& page : result.failedPages) {
        j["failed_urls"].push_back(toJson(page));
    }
    return j;
}

nlohmann::json toJson(const DiscoveryResult& result) {
    nlohmann::json j = nlohmann::json::object();
    j["success"] = result.success;
    j["message"] = result.message;
    if (result.errorKind != CrawlErrorKind::NONE) {
        j["error_kind"] = crawlErrorKindName(result.errorKind);
    }
    j["pages"] = nlohmann::json::array();
    for (const auto& page : result.pages) {
        j["pages"].push_back(toJson(page));
    }
    return j;
}

std::string dumpJson(const nlohmann::json& value) {
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace site_mirror::crawler
