#pragma once

#include <optional>
#include <string>
#include <vector>

namespace site_mirror::crawler {

class AssetFetcher;
class HtmlDocument;
class HtmlEditor;

struct PageLinks {
    std::optional<std::string> title;

    // Internal page URLs in DOM order, canonicalized and de-duplicated
    std::vector<std::string> internalLinks;
};

struct RewrittenPage {
    std::string html;
    PageLinks links;
};

// Turns a fetched page into its standalone local form: internal hyperlinks
// point at the clean paths of their targets and embedded resources at the
// downloaded copies.
class HtmlRewriter {
public:
    explicit HtmlRewriter(AssetFetcher& assets);

    RewrittenPage rewrite(const std::string& html, const std::string& pageUrl);

    // Title and internal links of a page, without downloading or editing
    static PageLinks inspect(const std::string& html, const std::string& pageUrl);

    // Textual pass turning absolute URLs of the page's own origin into
    // root-relative ones. Best effort: the DOM pass handles what it misses.
    static std::string collapseSameOriginUrls(const std::string& html, const std::string& pageUrl);

private:
    static std::string effectiveBaseUrl(const HtmlDocument& document, const std::string& pageUrl);
    // Links resolve against baseUrl and count as internal on pageUrl's host
    static PageLinks collectLinks(const HtmlDocument& document, const std::string& pageUrl,
                                  const std::string& baseUrl);

    void rewriteHyperlinks(const HtmlDocument& document, const std::string& pageUrl,
                           const std::string& baseUrl, const std::string& pageCleanPath,
                           HtmlEditor& editor) const;
    void rewriteAssets(const HtmlDocument& document, const std::string& baseUrl,
                       const std::string& pageCleanPath, HtmlEditor& editor);

    AssetFetcher& assets;
};

} // namespace site_mirror::crawler
