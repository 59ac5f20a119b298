#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <gumbo.h>
#include "../../include/site_mirror/crawler/models/Platform.h"

namespace site_mirror::crawler {

class HtmlDocument;

// What identifies the promotional badge of one site builder.
struct BadgeProfile {
    Platform platform = Platform::GENERAL;

    // Injected as display:none rules
    std::vector<std::string> hiddenSelectors;
    std::string extraCss;

    // Elements removed outright
    std::vector<std::string> badgeClasses;
    std::vector<std::string> badgeIds;
    std::vector<std::string> badgeAttributes;
    std::vector<std::pair<std::string, std::string>> badgeAttributeValues;

    // Anchors and buttons pointing at one of these domains are removed when
    // their text contains one of the keywords
    std::vector<std::string> linkDomains;
    std::vector<std::string> linkKeywords;

    // Short elements (visible text under 50 characters) containing a phrase
    std::vector<std::string> shortTextPhrases;

    // Anchors whose text contains every one of these phrases
    std::vector<std::string> creditLinkPhrases;

    // <meta name="generator"> whose content contains this keyword
    std::string generatorKeyword;

    // <script src> containing one of these markers
    std::vector<std::string> scriptSrcMarkers;
};

// Removes a platform's promotional markup from a page. Stateless; one
// instance serves every page of a job.
class PlatformStripper {
public:
    virtual ~PlatformStripper() = default;

    virtual Platform platform() const = 0;

    virtual std::string stripBadge(const std::string& html) const = 0;
};

// Fallback for sites without a known badge: returns pages unchanged.
class NoopStripper : public PlatformStripper {
public:
    Platform platform() const override { return Platform::GENERAL; }

    std::string stripBadge(const std::string& html) const override { return html; }
};

class BadgeStripper : public PlatformStripper {
public:
    explicit BadgeStripper(BadgeProfile profile);

    Platform platform() const override { return profile.platform; }

    // Injects the badge-hiding <style> block into <head> (else at the start
    // of <body>, else in front of the document) and removes badge elements
    std::string stripBadge(const std::string& html) const override;

    std::string styleBlock() const;

    const BadgeProfile& badgeProfile() const { return profile; }

private:
    size_t styleInsertionOffset(const HtmlDocument& document) const;
    bool isBadgeElement(const GumboNode* node) const;
    bool isPromotionalLink(const GumboNode* node) const;
    bool isShortPromotionalText(const GumboNode* node) const;
    bool isCreditLink(const GumboNode* node) const;

    BadgeProfile profile;
};

// Badge description of a platform; GENERAL has an empty profile
BadgeProfile badgeProfileFor(Platform platform);

std::unique_ptr<PlatformStripper> makeStripper(Platform platform);

} // namespace site_mirror::crawler
