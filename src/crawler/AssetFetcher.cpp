#include "AssetFetcher.h"
#include "FailureClassifier.h"
#include "OutputWriter.h"
#include "../../include/Logger.h"
#include "../../include/site_mirror/crawler/PathMapper.h"
#include <algorithm>
#include <cctype>

namespace site_mirror::crawler {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool looksLikeStylesheet(const std::string& url, const std::string& contentType) {
    if (toLower(contentType).find("text/css") != std::string::npos) {
        return true;
    }
    return endsWith(toLower(stripQueryAndFragment(url)), ".css");
}

bool isCssSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

bool matchesIgnoreCase(const std::string& text, size_t pos, const char* word) {
    for (size_t i = 0; word[i] != '\0'; ++i) {
        if (pos + i >= text.size() ||
            std::tolower(static_cast<unsigned char>(text[pos + i])) != word[i]) {
            return false;
        }
    }
    return true;
}

// One url(...) token of a stylesheet
struct CssUrlToken {
    size_t begin;
    size_t length;
    size_t valueBegin;
    size_t valueLength;
};

// Single left-to-right pass. Values are delimited with find(), so long
// inline data: URIs cost no more than a memchr over their bytes.
std::vector<CssUrlToken> scanCssUrls(const std::string& css) {
    std::vector<CssUrlToken> tokens;
    size_t pos = css.find('(');
    while (pos != std::string::npos) {
        size_t open = pos;
        pos = css.find('(', open + 1);
        if (open < 3 || !matchesIgnoreCase(css, open - 3, "url") ||
            (open > 3 && isIdentifierChar(css[open - 4]))) {
            continue;
        }

        size_t cursor = open + 1;
        while (cursor < css.size() && isCssSpace(css[cursor])) cursor++;
        if (cursor >= css.size()) {
            break;
        }

        size_t valueBegin = cursor;
        size_t valueEnd;
        size_t close;
        char quote = css[cursor];
        if (quote == '"' || quote == '\'') {
            valueBegin = cursor + 1;
            valueEnd = css.find(quote, valueBegin);
            if (valueEnd == std::string::npos) {
                break;
            }
            close = valueEnd + 1;
            while (close < css.size() && isCssSpace(css[close])) close++;
            if (close >= css.size() || css[close] != ')') {
                pos = css.find('(', valueEnd);
                continue;
            }
        } else {
            close = css.find(')', valueBegin);
            if (close == std::string::npos) {
                break;
            }
            valueEnd = close;
            while (valueEnd > valueBegin && isCssSpace(css[valueEnd - 1])) valueEnd--;
        }

        if (valueEnd > valueBegin) {
            tokens.push_back(CssUrlToken{open - 3, close + 1 - (open - 3), valueBegin, valueEnd - valueBegin});
        }
        pos = css.find('(', close + 1);
    }
    return tokens;
}

} // namespace

AssetFetcher::AssetFetcher(HttpClient& client,
                           const std::filesystem::path& outputRoot,
                           const std::string& siteHost,
                           const CrawlConfig& config)
    : client(client)
    , outputRoot(outputRoot)
    , siteHost(siteHost)
    , maxConcurrentDownloads(std::max<size_t>(1, config.maxConcurrentAssetDownloads))
    , rewriteStylesheets(config.rewriteStylesheets) {
}

std::optional<std::string> AssetFetcher::resolveAssetUrl(const std::string& ref, const std::string& baseUrl) const {
    std::string cleaned = sanitizeUrl(ref);
    if (cleaned.empty() || cleaned[0] == '#') {
        return std::nullopt;
    }
    std::string lowered = toLower(cleaned.substr(0, 11));
    if (lowered.rfind("data:", 0) == 0 || lowered.rfind("blob:", 0) == 0 ||
        lowered.rfind("javascript:", 0) == 0 || lowered.rfind("about:", 0) == 0) {
        return std::nullopt;
    }

    std::string absolute = resolveUrl(baseUrl, cleaned);
    size_t hash = absolute.find('#');
    if (hash != std::string::npos) {
        absolute.erase(hash);
    }
    if (!isHttpUrl(absolute)) {
        return std::nullopt;
    }
    return absolute;
}

std::string AssetFetcher::fetchAsset(const std::string& ref, const std::string& baseUrl) {
    auto absolute = resolveAssetUrl(ref, baseUrl);
    if (!absolute) {
        LOG_TRACE("Leaving asset reference untouched: " + ref);
        return ref;
    }
    auto local = fetchShared(*absolute, rewriteStylesheets);
    return local.value_or(ref);
}

std::unordered_map<std::string, std::string> AssetFetcher::fetchAll(const std::vector<std::string>& refs,
                                                                     const std::string& baseUrl) {
    std::vector<std::string> unique;
    for (const auto& ref : refs) {
        if (std::find(unique.begin(), unique.end(), ref) == unique.end()) {
            unique.push_back(ref);
        }
    }

    std::vector<std::string> results(unique.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < unique.size(); i = next++) {
            results[i] = fetchAsset(unique[i], baseUrl);
        }
    };

    size_t workerCount = std::min(maxConcurrentDownloads, unique.size());
    if (workerCount <= 1) {
        worker();
    } else {
        LOG_DEBUG_STREAM("Fetching " << unique.size() << " assets with " << workerCount << " workers");
        std::vector<std::future<void>> workers;
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.push_back(std::async(std::launch::async, worker));
        }
        for (auto& future : workers) {
            future.get();
        }
    }

    std::unordered_map<std::string, std::string> mapping;
    for (size_t i = 0; i < unique.size(); ++i) {
        mapping.emplace(unique[i], results[i]);
    }
    return mapping;
}

std::optional<std::string> AssetFetcher::fetchShared(const std::string& absoluteUrl, bool processStylesheet) {
    std::promise<std::optional<std::string>> promise;
    std::shared_future<std::optional<std::string>> pending;
    {
        std::lock_guard<std::mutex> lock(cacheMutex);
        auto it = cache.find(absoluteUrl);
        if (it != cache.end()) {
            pending = it->second;
        } else {
            cache.emplace(absoluteUrl, promise.get_future().share());
        }
    }

    if (pending.valid()) {
        LOG_TRACE("Asset cache hit: " + absoluteUrl);
        return pending.get();
    }

    std::optional<StoredAsset> asset;
    try {
        asset = download(absoluteUrl);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to store asset " + absoluteUrl + ": " + e.what());
    }

    std::optional<std::string> localPath;
    if (asset) {
        localPath = asset->localPath;
    }
    // Published before stylesheet processing so that stylesheets referencing
    // each other do not wait on themselves
    promise.set_value(localPath);

    if (asset && asset->stylesheet && processStylesheet) {
        try {
            std::string rewritten = rewriteCssUrls(asset->content, absoluteUrl, asset->localPath);
            if (rewritten != asset->content && !writeOutputFile(outputRoot, asset->localPath, rewritten)) {
                LOG_WARNING("Keeping unmodified stylesheet " + asset->localPath);
            }
        } catch (const std::exception& e) {
            LOG_WARNING("Failed to rewrite stylesheet " + absoluteUrl + ": " + e.what());
        }
    }
    return localPath;
}

std::optional<AssetFetcher::StoredAsset> AssetFetcher::download(const std::string& absoluteUrl) {
    PageFetchResult response = client.fetch(absoluteUrl);
    if (!response.success) {
        LOG_WARNING("Asset download failed for " + absoluteUrl + " (" +
                    FailureClassifier::describe(response.failureType) + "): " + response.errorMessage);
        return std::nullopt;
    }

    StoredAsset asset;
    asset.localPath = assetLocalPath(absoluteUrl, siteHost);
    asset.stylesheet = looksLikeStylesheet(absoluteUrl, response.contentType);
    if (!writeOutputFile(outputRoot, asset.localPath, response.content)) {
        return std::nullopt;
    }
    stored++;
    LOG_DEBUG("Stored asset " + absoluteUrl + " as " + asset.localPath);
    asset.content = std::move(response.content);
    return asset;
}

std::string AssetFetcher::rewriteCssUrls(const std::string& css,
                                         const std::string& cssBaseUrl,
                                         const std::string& fromLocalPath) {
    struct Reference {
        size_t begin;
        size_t length;
        std::string absoluteUrl;
    };

    std::vector<Reference> references;
    for (const CssUrlToken& token : scanCssUrls(css)) {
        // Inline data is left in place without copying it
        if (matchesIgnoreCase(css, token.valueBegin, "data:")) {
            continue;
        }
        auto absolute = resolveAssetUrl(css.substr(token.valueBegin, token.valueLength), cssBaseUrl);
        if (!absolute) {
            continue;
        }
        references.push_back(Reference{token.begin, token.length, *absolute});
    }
    if (references.empty()) {
        return css;
    }

    // Nested references are stored but not processed as stylesheets again
    std::unordered_map<std::string, std::string> resolved;
    for (const auto& reference : references) {
        if (resolved.count(reference.absoluteUrl) > 0) {
            continue;
        }
        auto local = fetchShared(reference.absoluteUrl, false);
        resolved.emplace(reference.absoluteUrl, local.value_or(""));
    }

    std::string result;
    result.reserve(css.size());
    size_t cursor = 0;
    for (const auto& reference : references) {
        result.append(css, cursor, reference.begin - cursor);
        const std::string& local = resolved[reference.absoluteUrl];
        if (!local.empty()) {
            result += "url(\"" + relativeLink(fromLocalPath, local) + "\")";
        } else {
            result.append(css, reference.begin, reference.length);
        }
        cursor = reference.begin + reference.length;
    }
    result.append(css, cursor, std::string::npos);
    return result;
}

} // namespace site_mirror::crawler
