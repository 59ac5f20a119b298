#include <catch2/catch_test_macros.hpp>
#include "../../include/site_mirror/crawler/PathMapper.h"

using namespace site_mirror::crawler;

TEST_CASE("cleanPath maps page URLs to local files", "[PathMapper]") {
    SECTION("Root becomes index.html") {
        REQUIRE(cleanPath("https://example.com/") == "index.html");
        REQUIRE(cleanPath("https://example.com") == "index.html");
    }

    SECTION("Query and fragment are dropped") {
        REQUIRE(cleanPath("https://example.com/blog/post-1?utm=x") == "blog/post-1.html");
        REQUIRE(cleanPath("https://example.com/about#team") == "about.html");
    }

    SECTION("Extension of the last segment is replaced") {
        REQUIRE(cleanPath("https://example.com/docs/guide.php") == "docs/guide.html");
        REQUIRE(cleanPath("https://example.com/page.html") == "page.html");
        REQUIRE(cleanPath("https://example.com/archive.tar.gz") == "archive.html");
    }

    SECTION("Trailing slash maps like the bare path") {
        REQUIRE(cleanPath("https://example.com/blog/") == "blog.html");
        REQUIRE(cleanPath("https://example.com/blog") == "blog.html");
    }

    SECTION("Segment made of an extension only becomes index") {
        REQUIRE(cleanPath("https://example.com/.hidden") == "index.html");
    }
}

TEST_CASE("relativeLink builds links between stored pages", "[PathMapper]") {
    SECTION("Same directory") {
        REQUIRE(relativeLink("index.html", "about.html") == "about.html");
        REQUIRE(relativeLink("blog/a.html", "blog/b.html") == "b.html");
    }

    SECTION("Down into a directory") {
        REQUIRE(relativeLink("index.html", "blog/post.html") == "blog/post.html");
    }

    SECTION("Up out of a directory") {
        REQUIRE(relativeLink("blog/post.html", "index.html") == "../index.html");
        REQUIRE(relativeLink("a/b/c.html", "css/site.css") == "../../css/site.css");
    }

    SECTION("Sibling directories") {
        REQUIRE(relativeLink("docs/guide.html", "blog/post.html") == "../blog/post.html");
    }

    SECTION("Result resolves back to the target") {
        const std::vector<std::pair<std::string, std::string>> pairs = {
            {"index.html", "about.html"},
            {"blog/post.html", "index.html"},
            {"a/b/c.html", "a/d/e.html"},
            {"a/b/c.html", "x.png"},
            {"docs/guide.html", "docs/api/ref.html"},
        };
        for (const auto& [from, to] : pairs) {
            std::string link = relativeLink(from, to);
            REQUIRE(resolveUrl("https://x.test/" + from, link) == "https://x.test/" + to);
        }
    }
}

TEST_CASE("resolveUrl follows RFC 3986 reference resolution", "[PathMapper]") {
    const std::string base = "http://a/b/c/d;p?q";

    SECTION("Normal examples") {
        REQUIRE(resolveUrl(base, "g") == "http://a/b/c/g");
        REQUIRE(resolveUrl(base, "./g") == "http://a/b/c/g");
        REQUIRE(resolveUrl(base, "g/") == "http://a/b/c/g/");
        REQUIRE(resolveUrl(base, "/g") == "http://a/g");
        REQUIRE(resolveUrl(base, "//g") == "http://g");
        REQUIRE(resolveUrl(base, "?y") == "http://a/b/c/d;p?y");
        REQUIRE(resolveUrl(base, "g?y") == "http://a/b/c/g?y");
        REQUIRE(resolveUrl(base, "#s") == "http://a/b/c/d;p?q#s");
        REQUIRE(resolveUrl(base, "") == "http://a/b/c/d;p?q");
        REQUIRE(resolveUrl(base, "..") == "http://a/b/");
        REQUIRE(resolveUrl(base, "../g") == "http://a/b/g");
        REQUIRE(resolveUrl(base, "../../g") == "http://a/g");
    }

    SECTION("Abnormal examples") {
        REQUIRE(resolveUrl(base, "../../../g") == "http://a/g");
        REQUIRE(resolveUrl(base, "/./g") == "http://a/g");
        REQUIRE(resolveUrl(base, "g.") == "http://a/b/c/g.");
        REQUIRE(resolveUrl(base, "./g/.") == "http://a/b/c/g/");
    }

    SECTION("Absolute references replace the base") {
        REQUIRE(resolveUrl(base, "https://other.test/x") == "https://other.test/x");
        REQUIRE(resolveUrl("https://example.com/a/", "//cdn.test/lib.js") == "https://cdn.test/lib.js");
    }
}

TEST_CASE("isInternalLink classifies hyperlinks", "[PathMapper]") {
    const std::string page = "https://example.com/blog/post";

    SECTION("Same host links are internal") {
        REQUIRE(isInternalLink("/about", page));
        REQUIRE(isInternalLink("other-post", page));
        REQUIRE(isInternalLink("https://example.com/contact", page));
        REQUIRE(isInternalLink("https://EXAMPLE.com/contact", page));
    }

    SECTION("Non-navigational links are not") {
        REQUIRE_FALSE(isInternalLink("", page));
        REQUIRE_FALSE(isInternalLink("#top", page));
        REQUIRE_FALSE(isInternalLink("mailto:hi@example.com", page));
        REQUIRE_FALSE(isInternalLink("tel:+15550100", page));
        REQUIRE_FALSE(isInternalLink("javascript:void(0)", page));
    }

    SECTION("Other hosts are external") {
        REQUIRE_FALSE(isInternalLink("https://other.test/", page));
        REQUIRE_FALSE(isInternalLink("https://blog.example.com/", page));
        REQUIRE_FALSE(isInternalLink("ftp://example.com/file", page));
    }

    SECTION("Links resolve against the base but stay on the page host") {
        const std::string foreignBase = "https://cdn.example.net/";
        REQUIRE_FALSE(isInternalLink("/about", "https://example.com/", foreignBase));
        REQUIRE(isInternalLink("https://example.com/contact", "https://example.com/", foreignBase));
        REQUIRE(isInternalLink("pricing", "https://example.com/", "https://example.com/static/"));
    }

    SECTION("Denylisted social hosts are never internal") {
        REQUIRE(isDenylistedHost("facebook.com"));
        REQUIRE(isDenylistedHost("www.youtube.com"));
        REQUIRE_FALSE(isDenylistedHost("notfacebook.com"));
        REQUIRE_FALSE(isInternalLink("https://www.facebook.com/page", "https://www.facebook.com/"));
    }
}

TEST_CASE("canonicalPageUrl normalizes crawl keys", "[PathMapper]") {
    REQUIRE(canonicalPageUrl("https://Example.COM") == "https://example.com/");
    REQUIRE(canonicalPageUrl("https://example.com/about/") == "https://example.com/about");
    REQUIRE(canonicalPageUrl("https://example.com/about?x=1#y") == "https://example.com/about");
    REQUIRE(canonicalPageUrl("https://example.com/a/../b") == "https://example.com/b");
}

TEST_CASE("assetLocalPath mirrors asset URLs", "[PathMapper]") {
    SECTION("Same host keeps its path") {
        REQUIRE(assetLocalPath("https://example.com/css/site.css", "example.com") == "css/site.css");
    }

    SECTION("Other hosts are nested under the authority") {
        REQUIRE(assetLocalPath("https://cdn.test/lib/app.js", "example.com") == "cdn.test/lib/app.js");
        REQUIRE(assetLocalPath("http://cdn.test:8080/a.png", "example.com") == "cdn.test_8080/a.png");
    }

    SECTION("Directory paths get an index file") {
        REQUIRE(assetLocalPath("https://example.com/", "example.com") == "index");
        REQUIRE(assetLocalPath("https://fonts.test/css/", "example.com") == "fonts.test/css/index");
    }

    SECTION("Queries produce distinct names") {
        std::string first = assetLocalPath("https://example.com/img.png?w=100", "example.com");
        std::string second = assetLocalPath("https://example.com/img.png?w=200", "example.com");
        REQUIRE(first != second);
        REQUIRE(first.rfind("img_", 0) == 0);
        REQUIRE(first.size() > 4);
        REQUIRE(first.substr(first.size() - 4) == ".png");
    }
}

TEST_CASE("pageNameFromUrl derives readable names", "[PathMapper]") {
    REQUIRE(pageNameFromUrl("https://example.com/") == "Home");
    REQUIRE(pageNameFromUrl("https://example.com/about-us") == "About Us");
    REQUIRE(pageNameFromUrl("https://example.com/blog/my_first_post.html") == "My First Post");
}

TEST_CASE("Host helpers", "[PathMapper]") {
    REQUIRE(extractHost("https://User@Example.com:8443/x") == "example.com");
    REQUIRE(extractOrigin("https://example.com:8443/x?y") == "https://example.com:8443");
    REQUIRE(isHttpUrl("HTTPS://example.com"));
    REQUIRE_FALSE(isHttpUrl("ftp://example.com"));
    REQUIRE(stripQueryAndFragment("https://example.com/a?b#c") == "https://example.com/a");
}

TEST_CASE("Percent-encoded URLs map to the names browsers request", "[PathMapper]") {
    SECTION("Stored names are decoded") {
        REQUIRE(cleanPath("https://example.com/caf%C3%A9") == "caf\xC3\xA9.html");
        REQUIRE(cleanPath("https://example.com/our%20team/") == "our team.html");
        REQUIRE(assetLocalPath("https://cdn.prod.website-files.com/abc/Hero%20Image.png", "example.com") ==
                "cdn.prod.website-files.com/abc/Hero Image.png");
    }

    SECTION("Escapes that would change the directory layout stay encoded") {
        REQUIRE(assetLocalPath("https://example.com/a%2Fb.png", "example.com") == "a%2Fb.png");
        REQUIRE(assetLocalPath("https://example.com/x/%2E%2E/y.png", "example.com") == "x/%2E%2E/y.png");
        REQUIRE(assetLocalPath("https://example.com/bad%zz.png", "example.com") == "bad%zz.png");
    }

    SECTION("Links escape what a browser would decode") {
        REQUIRE(relativeLink("blog/post.html", "img/Hero Image.png") == "../img/Hero%20Image.png");
        REQUIRE(relativeLink("index.html", "caf\xC3\xA9.html") == "caf%C3%A9.html");
        REQUIRE(relativeLink("index.html", "a%2Fb.png") == "a%252Fb.png");
        REQUIRE(relativeLink("index.html", "what?#.html") == "what%3F%23.html");
    }

    SECTION("A colon in the first segment is not read as a scheme") {
        REQUIRE(relativeLink("index.html", "note:1.html") == "./note:1.html");
        REQUIRE(relativeLink("blog/post.html", "note:1.html") == "../note:1.html");
    }
}
