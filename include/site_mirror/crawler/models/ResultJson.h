#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "CrawlResult.h"

namespace site_mirror::crawler {

nlohmann::json toJson(const PageRecord& page);
nlohmann::json toJson(const FailedPage& page);
nlohmann::json toJson(const CrawlResult& result);
nlohmann::json toJson(const DiscoveryResult& result);

// Pretty-printed output. Invalid UTF-8 in strings is replaced with U+FFFD
// instead of throwing.
std::string dumpJson(const nlohmann::json& value);

} // namespace site_mirror::crawler
