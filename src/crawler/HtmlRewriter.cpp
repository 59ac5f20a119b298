#include "HtmlRewriter.h"
#include "AssetFetcher.h"
#include "HtmlDocument.h"
#include "../../include/Logger.h"
#include "../../include/site_mirror/crawler/PathMapper.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace site_mirror::crawler {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(begin, end - begin);
}

// Links that never point at another page
bool isNonNavigational(const std::string& href) {
    std::string lowered = toLower(trim(href));
    return lowered.empty() || lowered[0] == '#' || lowered.rfind("mailto:", 0) == 0 ||
           lowered.rfind("tel:", 0) == 0 || lowered.rfind("javascript:", 0) == 0;
}

struct SrcsetCandidate {
    std::string url;
    std::string descriptor;
};

std::vector<SrcsetCandidate> parseSrcset(const std::string& value) {
    std::vector<SrcsetCandidate> candidates;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string piece = trim(value.substr(start, comma - start));
        if (!piece.empty()) {
            size_t space = piece.find_first_of(" \t\r\n");
            SrcsetCandidate candidate;
            candidate.url = piece.substr(0, space);
            if (space != std::string::npos) {
                candidate.descriptor = trim(piece.substr(space));
            }
            candidates.push_back(candidate);
        }
        start = comma + 1;
    }
    return candidates;
}

bool isAssetLinkRel(const std::string& rel) {
    std::string lowered = toLower(rel);
    size_t start = 0;
    while (start < lowered.size()) {
        size_t end = lowered.find_first_of(" \t\r\n", start);
        if (end == std::string::npos) {
            end = lowered.size();
        }
        std::string token = lowered.substr(start, end - start);
        if (token == "stylesheet" || token.find("icon") != std::string::npos) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

struct AssetAttribute {
    SourceSpan span;
    std::string value;
    bool srcset = false;
};

} // namespace

HtmlRewriter::HtmlRewriter(AssetFetcher& assets)
    : assets(assets) {
}

std::string HtmlRewriter::collapseSameOriginUrls(const std::string& html, const std::string& pageUrl) {
    std::string host = extractHost(pageUrl);
    if (host.empty()) {
        return html;
    }
    UrlParts parts = splitUrl(pageUrl);

    std::string result = html;
    for (const std::string scheme : {"https", "http"}) {
        std::string prefix = scheme + "://" + parts.authority + "/";
        size_t replaced = 0;
        for (size_t pos = result.find(prefix); pos != std::string::npos; pos = result.find(prefix, pos + 1)) {
            result.replace(pos, prefix.size(), "/");
            replaced++;
        }
        if (replaced > 0) {
            LOG_DEBUG("Collapsed " + std::to_string(replaced) + " absolute " + scheme + " URLs of " + host);
        }
    }
    return result;
}

std::string HtmlRewriter::effectiveBaseUrl(const HtmlDocument& document, const std::string& pageUrl) {
    for (const GumboNode* node : document.elementsByTag(GUMBO_TAG_BASE)) {
        auto href = HtmlDocument::attribute(node, "href");
        if (href && !trim(*href).empty()) {
            std::string base = resolveUrl(pageUrl, *href);
            if (isHttpUrl(base)) {
                return base;
            }
        }
    }
    return pageUrl;
}

PageLinks HtmlRewriter::collectLinks(const HtmlDocument& document, const std::string& pageUrl,
                                     const std::string& baseUrl) {
    PageLinks links;
    links.title = document.title();

    std::unordered_set<std::string> seen;
    for (const GumboNode* node : document.elements()) {
        GumboTag tag = node->v.element.tag;
        if (tag != GUMBO_TAG_A && tag != GUMBO_TAG_AREA) {
            continue;
        }
        auto href = HtmlDocument::attribute(node, "href");
        if (!href || isNonNavigational(*href) || !isInternalLink(*href, pageUrl, baseUrl)) {
            continue;
        }
        std::string target = canonicalPageUrl(resolveUrl(baseUrl, *href));
        if (seen.insert(target).second) {
            links.internalLinks.push_back(target);
        }
    }
    return links;
}

PageLinks HtmlRewriter::inspect(const std::string& html, const std::string& pageUrl) {
    HtmlDocument document(html);
    return collectLinks(document, pageUrl, effectiveBaseUrl(document, pageUrl));
}

RewrittenPage HtmlRewriter::rewrite(const std::string& html, const std::string& pageUrl) {
    auto document = std::make_unique<HtmlDocument>(collapseSameOriginUrls(html, pageUrl));
    std::string baseUrl = effectiveBaseUrl(*document, pageUrl);
    // Root-relative forms of the page's own URLs would resolve against a
    // <base> of another origin
    if (extractOrigin(baseUrl) != extractOrigin(pageUrl)) {
        document = std::make_unique<HtmlDocument>(html);
        baseUrl = effectiveBaseUrl(*document, pageUrl);
    }
    HtmlEditor editor(document->source());
    std::string pageCleanPath = cleanPath(pageUrl);

    RewrittenPage page;
    page.links = collectLinks(*document, pageUrl, baseUrl);

    rewriteHyperlinks(*document, pageUrl, baseUrl, pageCleanPath, editor);
    rewriteAssets(*document, baseUrl, pageCleanPath, editor);

    // Stored pages resolve references relative to their own location
    for (const GumboNode* node : document->elementsByTag(GUMBO_TAG_BASE)) {
        auto span = document->elementSpan(node);
        if (span) {
            editor.remove(*span);
        }
    }

    LOG_DEBUG("Rewriting " + pageUrl + " as " + pageCleanPath + " with " +
              std::to_string(editor.editCount()) + " edits");
    page.html = editor.apply();
    return page;
}

void HtmlRewriter::rewriteHyperlinks(const HtmlDocument& document, const std::string& pageUrl,
                                     const std::string& baseUrl, const std::string& pageCleanPath,
                                     HtmlEditor& editor) const {
    for (const GumboNode* node : document.elements()) {
        GumboTag tag = node->v.element.tag;
        if (tag != GUMBO_TAG_A && tag != GUMBO_TAG_AREA) {
            continue;
        }
        const GumboAttribute* href = HtmlDocument::findAttribute(node, "href");
        if (!href || isNonNavigational(href->value)) {
            continue;
        }
        auto span = document.attributeValueSpan(href);
        if (!span) {
            continue;
        }

        if (!isInternalLink(href->value, pageUrl, baseUrl)) {
            // The <base> element is dropped from stored pages, so external
            // links that depended on it are made absolute
            std::string absolute = resolveUrl(baseUrl, href->value);
            if (baseUrl != pageUrl && isHttpUrl(absolute) && absolute != href->value) {
                editor.setAttributeValue(*span, absolute);
            }
            continue;
        }

        UrlParts target = splitUrl(resolveUrl(baseUrl, href->value));
        std::string link = relativeLink(pageCleanPath, cleanPath(joinUrl(target)));
        if (target.hasFragment && !target.fragment.empty()) {
            link += "#" + target.fragment;
        }
        LOG_TRACE("Link " + std::string(href->value) + " -> " + link);
        editor.setAttributeValue(*span, link);
    }
}

void HtmlRewriter::rewriteAssets(const HtmlDocument& document, const std::string& baseUrl,
                                 const std::string& pageCleanPath, HtmlEditor& editor) {
    std::vector<AssetAttribute> attributes;
    std::vector<const GumboNode*> styleTexts;

    auto addAttribute = [&document, &attributes](const GumboNode* node, const char* name, bool srcset) {
        const GumboAttribute* attr = HtmlDocument::findAttribute(node, name);
        if (!attr) {
            return;
        }
        auto span = document.attributeValueSpan(attr);
        if (!span || trim(attr->value).empty()) {
            return;
        }
        // Commas inside data: URIs make srcset ambiguous
        if (srcset && toLower(attr->value).find("data:") != std::string::npos) {
            return;
        }
        attributes.push_back(AssetAttribute{*span, attr->value, srcset});
    };

    for (const GumboNode* node : document.elements()) {
        switch (node->v.element.tag) {
            case GUMBO_TAG_LINK: {
                auto rel = HtmlDocument::attribute(node, "rel");
                if (rel && isAssetLinkRel(*rel)) {
                    addAttribute(node, "href", false);
                }
                break;
            }
            case GUMBO_TAG_SCRIPT:
                addAttribute(node, "src", false);
                break;
            case GUMBO_TAG_IMG:
            case GUMBO_TAG_SOURCE:
                addAttribute(node, "src", false);
                addAttribute(node, "srcset", true);
                break;
            case GUMBO_TAG_VIDEO:
                addAttribute(node, "src", false);
                addAttribute(node, "poster", false);
                break;
            case GUMBO_TAG_AUDIO:
                addAttribute(node, "src", false);
                break;
            case GUMBO_TAG_STYLE:
                for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
                    styleTexts.push_back(static_cast<const GumboNode*>(node->v.element.children.data[i]));
                }
                break;
            default:
                break;
        }
    }

    std::vector<std::string> refs;
    for (const auto& attribute : attributes) {
        if (attribute.srcset) {
            for (const auto& candidate : parseSrcset(attribute.value)) {
                refs.push_back(candidate.url);
            }
        } else {
            refs.push_back(trim(attribute.value));
        }
    }

    std::unordered_map<std::string, std::string> fetched = assets.fetchAll(refs, baseUrl);
    auto localReference = [&fetched, &pageCleanPath](const std::string& ref) {
        auto it = fetched.find(ref);
        if (it == fetched.end() || it->second == ref) {
            return ref;
        }
        return relativeLink(pageCleanPath, it->second);
    };

    for (const auto& attribute : attributes) {
        std::string replacement;
        if (attribute.srcset) {
            for (const auto& candidate : parseSrcset(attribute.value)) {
                if (!replacement.empty()) {
                    replacement += ", ";
                }
                replacement += localReference(candidate.url);
                if (!candidate.descriptor.empty()) {
                    replacement += " " + candidate.descriptor;
                }
            }
        } else {
            replacement = localReference(trim(attribute.value));
        }
        if (replacement != attribute.value) {
            editor.setAttributeValue(attribute.span, replacement);
        }
    }

    for (const GumboNode* text : styleTexts) {
        auto span = document.textSpan(text);
        if (!span) {
            continue;
        }
        std::string css = document.source().substr(span->begin, span->end - span->begin);
        std::string rewritten = assets.rewriteCssUrls(css, baseUrl, pageCleanPath);
        if (rewritten != css) {
            editor.replace(*span, rewritten);
        }
    }
}

} // namespace site_mirror::crawler
