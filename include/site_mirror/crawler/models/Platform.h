#pragma once

#include <optional>
#include <string>
#include <vector>

namespace site_mirror::crawler {

// Site builder a mirrored page was generated by. GENERAL covers any host
// without a known badge.
enum class Platform {
    FRAMER,
    WEBFLOW,
    WORDPRESS,
    WIX,
    SHOPIFY,
    BOLT,
    LOVABLE,
    GUMROAD,
    REPLIT,
    SQUARESPACE,
    NOTION,
    ROCKET,
    GENERAL
};

// Case-insensitive lookup of a platform selector ("framer", "general", ...).
// Returns nullopt for unsupported values.
std::optional<Platform> parsePlatform(const std::string& name);

std::string platformName(Platform platform);

std::vector<Platform> allPlatforms();

} // namespace site_mirror::crawler
