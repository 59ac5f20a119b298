#include "../../include/site_mirror/crawler/PathMapper.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>

namespace site_mirror::crawler {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool startsWithIgnoreCase(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    return toLower(value.substr(0, prefix.size())) == prefix;
}

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t next = path.find('/', start);
        if (next == std::string::npos) {
            next = path.size();
        }
        if (next > start) {
            segments.push_back(path.substr(start, next - start));
        }
        start = next + 1;
    }
    return segments;
}

std::string joinSegments(const std::vector<std::string>& segments) {
    std::string joined;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segments[i];
    }
    return joined;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
    std::string input = path;
    std::string output;

    auto popLastSegment = [&output]() {
        size_t pos = output.rfind('/');
        if (pos == std::string::npos) {
            output.clear();
        } else {
            output.erase(pos);
        }
    };

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        } else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        } else if (input.rfind("/./", 0) == 0) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.rfind("/../", 0) == 0) {
            input.replace(0, 4, "/");
            popLastSegment();
        } else if (input == "/..") {
            input = "/";
            popLastSegment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t begin = input[0] == '/' ? 1 : 0;
            size_t next = input.find('/', begin);
            if (next == std::string::npos) {
                next = input.size();
            }
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }
    return output;
}

std::string mergePaths(const UrlParts& base, const std::string& refPath) {
    if (base.hasAuthority && base.path.empty()) {
        return "/" + refPath;
    }
    size_t slash = base.path.rfind('/');
    if (slash == std::string::npos) {
        return refPath;
    }
    return base.path.substr(0, slash + 1) + refPath;
}

std::string hostFromAuthority(const std::string& authority) {
    if (authority.empty()) {
        return "";
    }
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        return toLower(close == std::string::npos ? authority : authority.substr(0, close + 1));
    }
    return toLower(authority.substr(0, authority.find(':')));
}

// FNV-1a, used to keep assets that differ only by query string apart
std::string shortHash(const std::string& value) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : value) {
        hash ^= c;
        hash *= 16777619u;
    }
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", hash);
    return buffer;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// File name for one URL path segment. Escapes that would decode to a
// separator, a NUL byte or a dot segment stay encoded.
std::string decodeSegment(const std::string& segment) {
    std::string decoded;
    decoded.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            int high = hexValue(segment[i + 1]);
            int low = hexValue(segment[i + 2]);
            if (high >= 0 && low >= 0) {
                char c = static_cast<char>(high * 16 + low);
                if (c != '/' && c != '\\' && c != '\0') {
                    decoded += c;
                    i += 2;
                    continue;
                }
            }
        }
        decoded += segment[i];
    }
    if (decoded == "." || decoded == "..") {
        return segment;
    }
    return decoded;
}

void decodeSegments(std::vector<std::string>& segments) {
    for (auto& segment : segments) {
        segment = decodeSegment(segment);
    }
}

// Bytes a browser would not take literally in a path segment
bool needsEscape(unsigned char c) {
    return c <= 0x20 || c >= 0x7F || c == '%' || c == '?' || c == '#' || c == '"' ||
           c == '<' || c == '>' || c == '\\' || c == '^' || c == '`' || c == '{' ||
           c == '|' || c == '}';
}

std::string escapeSegment(const std::string& segment) {
    static const char* digits = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(segment.size());
    for (char c : segment) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (needsEscape(uc)) {
            escaped += '%';
            escaped += digits[uc >> 4];
            escaped += digits[uc & 0x0F];
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string titleCase(const std::string& words) {
    std::string result;
    bool startOfWord = true;
    for (char c : words) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            result += static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
            startOfWord = false;
        } else {
            result += c;
            startOfWord = true;
        }
    }
    return result;
}

} // namespace

UrlParts splitUrl(const std::string& url) {
    UrlParts parts;
    size_t pos = 0;

    size_t colon = url.find(':');
    size_t firstDelimiter = url.find_first_of("/?#");
    if (colon != std::string::npos && colon > 0 &&
        (firstDelimiter == std::string::npos || colon < firstDelimiter) &&
        std::isalpha(static_cast<unsigned char>(url[0])) &&
        std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon), isSchemeChar)) {
        parts.scheme = toLower(url.substr(0, colon));
        pos = colon + 1;
    }

    if (url.compare(pos, 2, "//") == 0) {
        parts.hasAuthority = true;
        size_t end = url.find_first_of("/?#", pos + 2);
        if (end == std::string::npos) {
            end = url.size();
        }
        std::string authority = url.substr(pos + 2, end - pos - 2);
        size_t at = authority.rfind('@');
        if (at != std::string::npos) {
            authority.erase(0, at + 1);
        }
        parts.authority = authority;
        pos = end;
    }

    size_t pathEnd = url.find_first_of("?#", pos);
    if (pathEnd == std::string::npos) {
        pathEnd = url.size();
    }
    parts.path = url.substr(pos, pathEnd - pos);
    pos = pathEnd;

    if (pos < url.size() && url[pos] == '?') {
        size_t queryEnd = url.find('#', pos);
        if (queryEnd == std::string::npos) {
            queryEnd = url.size();
        }
        parts.hasQuery = true;
        parts.query = url.substr(pos + 1, queryEnd - pos - 1);
        pos = queryEnd;
    }

    if (pos < url.size() && url[pos] == '#') {
        parts.hasFragment = true;
        parts.fragment = url.substr(pos + 1);
    }
    return parts;
}

std::string joinUrl(const UrlParts& parts) {
    std::string url;
    if (!parts.scheme.empty()) {
        url += parts.scheme + ":";
    }
    if (parts.hasAuthority) {
        url += "//" + parts.authority;
    }
    url += parts.path;
    if (parts.hasQuery) {
        url += "?" + parts.query;
    }
    if (parts.hasFragment) {
        url += "#" + parts.fragment;
    }
    return url;
}

std::string sanitizeUrl(const std::string& input) {
    auto isSpace = [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f'; };

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end;) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x20 || c == 0x7F) {
            i++;
            continue;
        }
        // U+200B..U+200D, U+2060 and the byte order mark
        if (c == 0xE2 && i + 2 < end) {
            unsigned char b1 = static_cast<unsigned char>(input[i + 1]);
            unsigned char b2 = static_cast<unsigned char>(input[i + 2]);
            if ((b1 == 0x80 && b2 >= 0x8B && b2 <= 0x8D) || (b1 == 0x81 && b2 == 0xA0)) {
                i += 3;
                continue;
            }
        }
        if (c == 0xEF && i + 2 < end &&
            static_cast<unsigned char>(input[i + 1]) == 0xBB &&
            static_cast<unsigned char>(input[i + 2]) == 0xBF) {
            i += 3;
            continue;
        }
        out.push_back(static_cast<char>(c));
        i++;
    }
    return out;
}

std::string resolveUrl(const std::string& base, const std::string& ref) {
    UrlParts reference = splitUrl(sanitizeUrl(ref));
    UrlParts baseParts = splitUrl(base);
    UrlParts target;

    if (!reference.scheme.empty()) {
        target = reference;
        target.path = removeDotSegments(reference.path);
    } else {
        if (reference.hasAuthority) {
            target.hasAuthority = true;
            target.authority = reference.authority;
            target.path = removeDotSegments(reference.path);
            target.hasQuery = reference.hasQuery;
            target.query = reference.query;
        } else {
            if (reference.path.empty()) {
                target.path = baseParts.path;
                target.hasQuery = reference.hasQuery || baseParts.hasQuery;
                target.query = reference.hasQuery ? reference.query : baseParts.query;
            } else {
                if (reference.path[0] == '/') {
                    target.path = removeDotSegments(reference.path);
                } else {
                    target.path = removeDotSegments(mergePaths(baseParts, reference.path));
                }
                target.hasQuery = reference.hasQuery;
                target.query = reference.query;
            }
            target.hasAuthority = baseParts.hasAuthority;
            target.authority = baseParts.authority;
        }
        target.scheme = baseParts.scheme;
    }

    target.hasFragment = reference.hasFragment;
    target.fragment = reference.fragment;
    return joinUrl(target);
}

std::string stripQueryAndFragment(const std::string& url) {
    size_t cut = url.find_first_of("?#");
    return cut == std::string::npos ? url : url.substr(0, cut);
}

std::string extractHost(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    if (!parts.hasAuthority) {
        return "";
    }
    return hostFromAuthority(parts.authority);
}

std::string extractOrigin(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    if (parts.scheme.empty() || !parts.hasAuthority) {
        return "";
    }
    return parts.scheme + "://" + toLower(parts.authority);
}

bool isHttpUrl(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    return (parts.scheme == "http" || parts.scheme == "https") &&
           parts.hasAuthority && !hostFromAuthority(parts.authority).empty();
}

std::string canonicalPageUrl(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    parts.hasQuery = false;
    parts.query.clear();
    parts.hasFragment = false;
    parts.fragment.clear();
    parts.authority = toLower(parts.authority);
    parts.path = removeDotSegments(parts.path);
    if (parts.path.empty()) {
        parts.path = "/";
    }
    while (parts.path.size() > 1 && parts.path.back() == '/') {
        parts.path.pop_back();
    }
    return joinUrl(parts);
}

std::string cleanPath(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    std::string path = parts.path;
    if (!path.empty() && path[0] != '/') {
        path = "/" + path;
    }
    std::vector<std::string> segments = splitSegments(removeDotSegments(path));
    if (segments.empty()) {
        return "index.html";
    }
    decodeSegments(segments);

    std::string& last = segments.back();
    size_t dot = last.find('.');
    if (dot != std::string::npos) {
        last.erase(dot);
    }
    if (last.empty()) {
        last = "index";
    }
    last += ".html";
    return joinSegments(segments);
}

std::string relativeLink(const std::string& fromCleanPath, const std::string& toCleanPath) {
    std::vector<std::string> from = splitSegments(fromCleanPath);
    std::vector<std::string> to = splitSegments(toCleanPath);
    if (to.empty()) {
        return "";
    }

    size_t fromDirs = from.empty() ? 0 : from.size() - 1;
    size_t toDirs = to.size() - 1;
    size_t common = 0;
    while (common < fromDirs && common < toDirs && from[common] == to[common]) {
        common++;
    }

    std::string link;
    for (size_t i = common; i < fromDirs; ++i) {
        link += "../";
    }
    for (size_t i = common; i < to.size(); ++i) {
        std::string segment = escapeSegment(to[i]);
        // A colon in the first segment would read as a scheme
        if (link.empty() && segment.find(':') != std::string::npos) {
            link = "./";
        }
        link += segment;
        if (i + 1 < to.size()) {
            link += '/';
        }
    }
    return link;
}

const std::vector<std::string>& externalDomainDenylist() {
    static const std::vector<std::string> denylist = {
        "facebook.com", "twitter.com", "instagram.com", "linkedin.com",
        "youtube.com", "google.com", "maps.google.com"
    };
    return denylist;
}

bool isDenylistedHost(const std::string& host) {
    std::string lowered = toLower(host);
    for (const auto& domain : externalDomainDenylist()) {
        if (lowered == domain) {
            return true;
        }
        if (lowered.size() > domain.size() &&
            lowered.compare(lowered.size() - domain.size(), domain.size(), domain) == 0 &&
            lowered[lowered.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

bool isInternalLink(const std::string& link, const std::string& currentUrl) {
    return isInternalLink(link, currentUrl, currentUrl);
}

bool isInternalLink(const std::string& link, const std::string& currentUrl, const std::string& baseUrl) {
    std::string cleaned = sanitizeUrl(link);
    if (cleaned.empty() || cleaned[0] == '#') {
        return false;
    }
    if (startsWithIgnoreCase(cleaned, "mailto:") || startsWithIgnoreCase(cleaned, "tel:") ||
        startsWithIgnoreCase(cleaned, "javascript:")) {
        return false;
    }

    std::string resolved = resolveUrl(baseUrl, cleaned);
    if (!isHttpUrl(resolved)) {
        return false;
    }

    std::string host = extractHost(resolved);
    if (isDenylistedHost(host)) {
        return false;
    }
    return host == extractHost(currentUrl);
}

std::string pageNameFromUrl(const std::string& url) {
    UrlParts parts = splitUrl(sanitizeUrl(url));
    std::vector<std::string> segments = splitSegments(parts.path);
    if (segments.empty()) {
        return "Home";
    }

    std::string name = segments.back();
    size_t dot = name.find('.');
    if (dot != std::string::npos && dot > 0) {
        name.erase(dot);
    }
    std::replace(name.begin(), name.end(), '-', ' ');
    std::replace(name.begin(), name.end(), '_', ' ');
    return titleCase(name);
}

std::string assetLocalPath(const std::string& absoluteUrl, const std::string& pageHost) {
    UrlParts parts = splitUrl(sanitizeUrl(absoluteUrl));
    std::string path = parts.path;
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }
    path = removeDotSegments(path);

    std::vector<std::string> segments = splitSegments(path);
    decodeSegments(segments);
    if (segments.empty() || path.back() == '/') {
        segments.push_back("index");
    }

    if (parts.hasQuery && !parts.query.empty()) {
        std::string& last = segments.back();
        size_t dot = last.rfind('.');
        std::string suffix = "_" + shortHash(parts.query);
        if (dot == std::string::npos || dot == 0) {
            last += suffix;
        } else {
            last.insert(dot, suffix);
        }
    }

    std::string host = hostFromAuthority(parts.authority);
    if (!host.empty() && host != toLower(pageHost)) {
        std::string directory = toLower(parts.authority);
        std::replace(directory.begin(), directory.end(), ':', '_');
        segments.insert(segments.begin(), directory);
    }
    return joinSegments(segments);
}

} // namespace site_mirror::crawler
