#include "PlatformStripper.h"
#include "HtmlDocument.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>

namespace site_mirror::crawler {

namespace {

// Elements shorter than this are badge-sized
constexpr size_t kShortTextLimit = 50;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

struct PlatformEntry {
    Platform platform;
    const char* name;
};

const std::vector<PlatformEntry>& platformEntries() {
    static const std::vector<PlatformEntry> entries = {
        {Platform::FRAMER, "framer"},
        {Platform::WEBFLOW, "webflow"},
        {Platform::WORDPRESS, "wordpress"},
        {Platform::WIX, "wix"},
        {Platform::SHOPIFY, "shopify"},
        {Platform::BOLT, "bolt"},
        {Platform::LOVABLE, "lovable"},
        {Platform::GUMROAD, "gumroad"},
        {Platform::REPLIT, "replit"},
        {Platform::SQUARESPACE, "squarespace"},
        {Platform::NOTION, "notion"},
        {Platform::ROCKET, "rocket"},
        {Platform::GENERAL, "general"},
    };
    return entries;
}

// Selectors shared by most builders: links to the builder and *-badge hooks
std::vector<std::string> commonSelectors(const std::string& key, const std::vector<std::string>& domains) {
    std::vector<std::string> selectors;
    for (const auto& domain : domains) {
        selectors.push_back("a[href*=\"" + domain + "\"]");
    }
    selectors.push_back("[data-" + key + "-badge]");
    selectors.push_back("[class*=\"" + key + "-badge\"]");
    selectors.push_back("[id*=\"" + key + "-badge\"]");
    return selectors;
}

} // namespace

std::optional<Platform> parsePlatform(const std::string& name) {
    std::string lowered = toLower(name);
    lowered.erase(0, lowered.find_first_not_of(" \t"));
    lowered.erase(lowered.find_last_not_of(" \t") + 1);
    for (const auto& entry : platformEntries()) {
        if (lowered == entry.name) {
            return entry.platform;
        }
    }
    return std::nullopt;
}

std::string platformName(Platform platform) {
    for (const auto& entry : platformEntries()) {
        if (entry.platform == platform) {
            return entry.name;
        }
    }
    return "general";
}

std::vector<Platform> allPlatforms() {
    std::vector<Platform> platforms;
    for (const auto& entry : platformEntries()) {
        platforms.push_back(entry.platform);
    }
    return platforms;
}

BadgeProfile badgeProfileFor(Platform platform) {
    BadgeProfile p;
    p.platform = platform;

    switch (platform) {
        case Platform::FRAMER:
            p.hiddenSelectors = {
                "#__framer-badge-container",
                "[data-framer-name=\"Made with Framer\"]",
                ".framer-badge",
                "a[href*=\"framer.com\"][target=\"_blank\"]",
                "a[href*=\"framer.com/templates\"]",
                "[data-framer-name*=\"Edit template\"]",
                "[class*=\"edit-template\"]",
                "[class*=\"template-badge\"]",
            };
            p.badgeClasses = {"framer-badge", "edit-template", "template-badge"};
            p.badgeIds = {"__framer-badge-container"};
            p.badgeAttributeValues = {{"data-framer-name", "Made with Framer"}};
            p.linkDomains = {"framer.com"};
            p.linkKeywords = {"made", "framer", "built", "edit", "template", "free"};
            p.shortTextPhrases = {"edit template"};
            break;

        case Platform::WEBFLOW:
            p.hiddenSelectors = {
                ".w-webflow-badge",
                ".webflow-badge",
                ".w-badge",
                ".buy-badge.w-inline-block",
                "a[href*=\"webflow.com\"]",
                "a[href*=\"webflow.io\"]",
                "[data-w-id*=\"badge\"]",
                "[data-w-id*=\"webflow\"]",
            };
            p.badgeClasses = {"w-webflow-badge", "webflow-badge", "w-badge"};
            p.linkDomains = {"webflow.com", "webflow.io"};
            p.linkKeywords = {"made", "webflow", "built", "template", "free"};
            break;

        case Platform::WORDPRESS:
            p.hiddenSelectors = {
                ".wp-badge",
                ".wordpress-badge",
                ".powered-by",
                "a[href*=\"wordpress.org\"]",
                "a[href*=\"wordpress.com\"]",
                ".site-info a[href*=\"wordpress\"]",
                ".footer-credits a[href*=\"wordpress\"]",
                "[class*=\"wp-badge\"]",
                "[id*=\"wp-badge\"]",
            };
            p.badgeClasses = {"wp-badge", "wordpress-badge", "powered-by"};
            p.linkDomains = {"wordpress.org", "wordpress.com"};
            p.linkKeywords = {"powered", "wordpress", "built", "made"};
            p.generatorKeyword = "wordpress";
            break;

        case Platform::WIX:
            p.hiddenSelectors = {
                ".wix-badge",
                ".wix-banner",
                "a[href*=\"wix.com\"]",
                "[data-wix-id*=\"badge\"]",
                "[class*=\"wix-badge\"]",
                "[id*=\"wix-badge\"]",
                "div[style*=\"position: fixed\"][style*=\"top\"]",
            };
            p.extraCss = "body { margin-top: 0 !important; padding-top: 0 !important; }";
            p.badgeClasses = {"wix-badge", "wix-banner"};
            p.linkDomains = {"wix.com"};
            p.linkKeywords = {"created", "designed", "website", "free", "build"};
            break;

        case Platform::SHOPIFY:
            p.hiddenSelectors = {
                ".shopify-badge",
                ".powered-by-shopify",
                ".shopify-credits",
                "a[href*=\"shopify.com\"]",
                ".site-footer a[href*=\"shopify\"]",
                ".footer a[href*=\"shopify\"]",
                "[class*=\"shopify-badge\"]",
                "[id*=\"shopify-badge\"]",
                "[class*=\"powered-by\"]",
            };
            p.badgeClasses = {"shopify-badge", "powered-by-shopify", "shopify-credits"};
            p.linkDomains = {"shopify.com"};
            p.linkKeywords = {"powered", "shopify", "built", "made"};
            p.creditLinkPhrases = {"powered by", "shopify"};
            break;

        case Platform::BOLT:
            p.hiddenSelectors = {".bolt-badge", ".made-in-bolt"};
            for (auto& selector : commonSelectors("bolt", {"bolt.new"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"bolt-badge", "made-in-bolt"};
            p.badgeAttributes = {"data-bolt-badge"};
            p.linkDomains = {"bolt.new", "bolt.host"};
            p.linkKeywords = {"made", "bolt", "built", "powered", "created"};
            p.shortTextPhrases = {"made in bolt"};
            break;

        case Platform::LOVABLE:
            p.hiddenSelectors = {".lovable-badge", ".edit-with-lovable"};
            for (auto& selector : commonSelectors("lovable", {"lovable.dev"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"lovable-badge", "edit-with-lovable"};
            p.badgeAttributes = {"data-lovable-badge"};
            p.linkDomains = {"lovable.dev"};
            p.linkKeywords = {"edit", "lovable", "made"};
            break;

        case Platform::GUMROAD:
            p.hiddenSelectors = {".gumroad-badge", ".powered-by-gumroad"};
            for (auto& selector : commonSelectors("gumroad", {"gumroad.com"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"gumroad-badge", "powered-by-gumroad"};
            p.linkDomains = {"gumroad.com"};
            p.linkKeywords = {"powered", "gumroad", "made"};
            break;

        case Platform::REPLIT:
            p.hiddenSelectors = {".replit-badge", "script[src*=\"replit-badge\"]"};
            for (auto& selector : commonSelectors("replit", {"replit.com"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"replit-badge"};
            p.badgeAttributes = {"data-replit-badge"};
            p.linkDomains = {"replit.com"};
            p.linkKeywords = {"replit", "made", "run"};
            p.scriptSrcMarkers = {"replit-badge"};
            break;

        case Platform::SQUARESPACE:
            p.hiddenSelectors = {
                ".squarespace-badge",
                ".powered-by-link",
                ".sqs-svg-logo--wordmark",
                ".sqs-svg-logo--glyph",
            };
            for (auto& selector : commonSelectors("squarespace", {"squarespace.com"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"squarespace-badge", "powered-by-link"};
            p.linkDomains = {"squarespace.com"};
            p.linkKeywords = {"powered", "squarespace", "made"};
            break;

        case Platform::NOTION:
            p.hiddenSelectors = {".notion-badge", ".made-with-notion"};
            for (auto& selector : commonSelectors("notion", {"notion.so", "notion.site"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"notion-badge", "made-with-notion"};
            p.linkDomains = {"notion.so", "notion.site"};
            p.linkKeywords = {"notion", "made", "powered"};
            break;

        case Platform::ROCKET:
            p.hiddenSelectors = {".rocket-badge", ".made-in-rocket"};
            for (auto& selector : commonSelectors("rocket", {"rocket.new"})) {
                p.hiddenSelectors.push_back(selector);
            }
            p.badgeClasses = {"rocket-badge", "made-in-rocket"};
            p.linkDomains = {"rocket.new"};
            p.linkKeywords = {"rocket", "made", "built"};
            break;

        case Platform::GENERAL:
        default:
            break;
    }
    return p;
}

std::unique_ptr<PlatformStripper> makeStripper(Platform platform) {
    if (platform == Platform::GENERAL) {
        return std::make_unique<NoopStripper>();
    }
    return std::make_unique<BadgeStripper>(badgeProfileFor(platform));
}

BadgeStripper::BadgeStripper(BadgeProfile profile)
    : profile(std::move(profile)) {
}

std::string BadgeStripper::styleBlock() const {
    std::string css = "\n<style>\n";
    for (const auto& selector : profile.hiddenSelectors) {
        css += selector + " { display: none !important; }\n";
    }
    if (!profile.extraCss.empty()) {
        css += profile.extraCss + "\n";
    }
    css += "</style>\n";
    return css;
}

size_t BadgeStripper::styleInsertionOffset(const HtmlDocument& document) const {
    for (const GumboNode* head : document.elementsByTag(GUMBO_TAG_HEAD)) {
        if (auto endTag = document.endTagBegin(head)) {
            return *endTag;
        }
        if (auto startEnd = document.startTagEnd(head)) {
            return *startEnd;
        }
    }
    for (const GumboNode* body : document.elementsByTag(GUMBO_TAG_BODY)) {
        if (auto startEnd = document.startTagEnd(body)) {
            return *startEnd;
        }
    }
    return 0;
}

std::string BadgeStripper::stripBadge(const std::string& html) const {
    HtmlDocument document(html);
    HtmlEditor editor(document.source());

    editor.insert(styleInsertionOffset(document), styleBlock());

    size_t removed = 0;
    for (const GumboNode* node : document.elements()) {
        GumboTag tag = node->v.element.tag;
        if (tag == GUMBO_TAG_HTML || tag == GUMBO_TAG_HEAD || tag == GUMBO_TAG_BODY) {
            continue;
        }
        if (!isBadgeElement(node) && !isPromotionalLink(node) &&
            !isShortPromotionalText(node) && !isCreditLink(node)) {
            continue;
        }
        if (auto span = document.elementSpan(node)) {
            LOG_TRACE("Removing <" + HtmlDocument::tagName(node) + "> badge element");
            editor.remove(*span);
            removed++;
        }
    }

    LOG_DEBUG(platformName(profile.platform) + " stripper removed " + std::to_string(removed) + " elements");
    return editor.apply();
}

bool BadgeStripper::isBadgeElement(const GumboNode* node) const {
    GumboTag tag = node->v.element.tag;

    if (tag == GUMBO_TAG_SCRIPT && !profile.scriptSrcMarkers.empty()) {
        auto src = HtmlDocument::attribute(node, "src");
        if (src && containsAny(*src, profile.scriptSrcMarkers)) {
            return true;
        }
    }

    if (tag == GUMBO_TAG_META && !profile.generatorKeyword.empty()) {
        auto name = HtmlDocument::attribute(node, "name");
        auto content = HtmlDocument::attribute(node, "content");
        if (name && toLower(*name) == "generator" && content &&
            toLower(*content).find(profile.generatorKeyword) != std::string::npos) {
            return true;
        }
    }

    for (const auto& cls : HtmlDocument::classList(node)) {
        if (std::find(profile.badgeClasses.begin(), profile.badgeClasses.end(), cls) != profile.badgeClasses.end()) {
            return true;
        }
    }

    auto id = HtmlDocument::attribute(node, "id");
    if (id && std::find(profile.badgeIds.begin(), profile.badgeIds.end(), *id) != profile.badgeIds.end()) {
        return true;
    }

    for (const auto& attribute : profile.badgeAttributes) {
        if (HtmlDocument::findAttribute(node, attribute.c_str())) {
            return true;
        }
    }

    for (const auto& [attribute, value] : profile.badgeAttributeValues) {
        auto actual = HtmlDocument::attribute(node, attribute.c_str());
        if (actual && *actual == value) {
            return true;
        }
    }
    return false;
}

bool BadgeStripper::isPromotionalLink(const GumboNode* node) const {
    if (profile.linkDomains.empty()) {
        return false;
    }

    std::string target;
    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_A) {
        target = HtmlDocument::attribute(node, "href").value_or("");
    } else if (tag == GUMBO_TAG_BUTTON) {
        target = HtmlDocument::attribute(node, "formaction").value_or("") + " " +
                 HtmlDocument::attribute(node, "onclick").value_or("");
    } else {
        return false;
    }

    if (!containsAny(toLower(target), profile.linkDomains)) {
        return false;
    }
    return containsAny(toLower(HtmlDocument::visibleText(node)), profile.linkKeywords);
}

bool BadgeStripper::isShortPromotionalText(const GumboNode* node) const {
    if (profile.shortTextPhrases.empty()) {
        return false;
    }
    switch (node->v.element.tag) {
        case GUMBO_TAG_A:
        case GUMBO_TAG_BUTTON:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_SPAN:
        case GUMBO_TAG_P:
            break;
        default:
            return false;
    }
    std::string text = toLower(HtmlDocument::visibleText(node));
    return !text.empty() && text.size() < kShortTextLimit && containsAny(text, profile.shortTextPhrases);
}

bool BadgeStripper::isCreditLink(const GumboNode* node) const {
    if (profile.creditLinkPhrases.empty() || node->v.element.tag != GUMBO_TAG_A) {
        return false;
    }
    std::string text = toLower(HtmlDocument::visibleText(node));
    return std::all_of(profile.creditLinkPhrases.begin(), profile.creditLinkPhrases.end(),
                       [&text](const std::string& phrase) { return text.find(phrase) != std::string::npos; });
}

} // namespace site_mirror::crawler
