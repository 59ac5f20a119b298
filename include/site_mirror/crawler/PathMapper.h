#pragma once

#include <string>
#include <vector>

namespace site_mirror::crawler {

// Components of an absolute or relative URL reference (RFC 3986 section 3).
struct UrlParts {
    std::string scheme;      // lower-cased, empty for relative references
    bool hasAuthority = false;
    std::string authority;   // host[:port], user info dropped
    std::string path;
    bool hasQuery = false;
    std::string query;
    bool hasFragment = false;
    std::string fragment;
};

UrlParts splitUrl(const std::string& url);

std::string joinUrl(const UrlParts& parts);

// Trims surrounding whitespace and drops control and zero-width characters
// that show up in copy/pasted URLs.
std::string sanitizeUrl(const std::string& input);

// Resolves a reference against an absolute base URL. Handles absolute,
// protocol-relative, root-relative and document-relative forms, including
// "." and ".." segments.
std::string resolveUrl(const std::string& base, const std::string& ref);

std::string stripQueryAndFragment(const std::string& url);

// Lower-cased host without port or user info; empty when the URL has none.
std::string extractHost(const std::string& url);

// scheme://host[:port] of an absolute URL.
std::string extractOrigin(const std::string& url);

bool isHttpUrl(const std::string& url);

// Key under which a page URL is tracked during a crawl: query and fragment
// dropped, scheme and host lower-cased, "/" for an empty path and no
// trailing slash otherwise.
std::string canonicalPageUrl(const std::string& url);

// Local file path of a page, relative to the output root. Path segments
// are percent-decoded, so the stored names are what a browser asks for.
//   https://example.com/                   -> index.html
//   https://example.com/blog/post-1?utm=x  -> blog/post-1.html
//   https://example.com/docs/guide.php     -> docs/guide.html
std::string cleanPath(const std::string& url);

// Relative reference from the page stored at fromCleanPath to the file at
// toCleanPath. Both paths are relative to the output root. Characters that
// a browser would decode or cut at are percent-encoded in the result.
std::string relativeLink(const std::string& fromCleanPath, const std::string& toCleanPath);

// Whether a link found on currentUrl points at another page of the same site.
bool isInternalLink(const std::string& link, const std::string& currentUrl);

// Same, for a page whose <base href> is baseUrl: the link resolves against
// baseUrl but must stay on the host of currentUrl.
bool isInternalLink(const std::string& link, const std::string& currentUrl, const std::string& baseUrl);

// Hosts never treated as part of a mirrored site.
const std::vector<std::string>& externalDomainDenylist();

bool isDenylistedHost(const std::string& host);

// Readable page name used when a page has no <title>.
std::string pageNameFromUrl(const std::string& url);

// Storage path of a downloaded asset, relative to the output root. Assets
// of the page's own host keep their URL path, others are nested under
// their host name.
std::string assetLocalPath(const std::string& absoluteUrl, const std::string& pageHost);

} // namespace site_mirror::crawler
