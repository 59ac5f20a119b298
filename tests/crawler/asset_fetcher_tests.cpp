#include <catch2/catch_test_macros.hpp>
#include "AssetFetcher.h"
#include "TestSupport.h"

using namespace site_mirror::crawler;
using namespace site_mirror::test;

TEST_CASE("AssetFetcher stores assets under mirrored paths", "[AssetFetcher]") {
    FakeHttpClient client;
    TempDir out;
    CrawlConfig config;
    AssetFetcher assets(client, out.path(), "example.com", config);

    client.addAsset("https://example.com/img/logo.png", "PNGDATA", "image/png");
    client.addAsset("https://cdn.test/lib/app.js", "console.log(1);", "application/javascript");

    SECTION("Same host asset keeps its path") {
        REQUIRE(assets.fetchAsset("/img/logo.png", "https://example.com/about") == "img/logo.png");
        REQUIRE(readFile(out.path() / "img/logo.png") == "PNGDATA");
        REQUIRE(assets.storedCount() == 1);
    }

    SECTION("Other host asset is nested under its host") {
        REQUIRE(assets.fetchAsset("https://cdn.test/lib/app.js", "https://example.com/") == "cdn.test/lib/app.js");
        REQUIRE(readFile(out.path() / "cdn.test/lib/app.js") == "console.log(1);");
    }

    SECTION("Repeated references are downloaded once") {
        assets.fetchAsset("/img/logo.png", "https://example.com/");
        assets.fetchAsset("img/logo.png", "https://example.com/index.html");
        assets.fetchAsset("https://example.com/img/logo.png#frag", "https://example.com/");
        REQUIRE(client.requestCount("https://example.com/img/logo.png") == 1);
        REQUIRE(assets.storedCount() == 1);
    }

    SECTION("Failed downloads keep the original reference") {
        REQUIRE(assets.fetchAsset("/missing.png", "https://example.com/") == "/missing.png");
        REQUIRE(assets.storedCount() == 0);
        REQUIRE(countFiles(out.path()) == 0);
    }

    SECTION("Inline and non-http references are left alone") {
        REQUIRE(assets.fetchAsset("data:image/png;base64,AAAA", "https://example.com/") == "data:image/png;base64,AAAA");
        REQUIRE(assets.fetchAsset("javascript:void(0)", "https://example.com/") == "javascript:void(0)");
        REQUIRE(assets.fetchAsset("#icon", "https://example.com/") == "#icon");
        REQUIRE(client.totalRequests() == 0);
    }
}

TEST_CASE("AssetFetcher rewrites stylesheet references", "[AssetFetcher]") {
    FakeHttpClient client;
    TempDir out;
    CrawlConfig config;
    AssetFetcher assets(client, out.path(), "example.com", config);

    client.addAsset("https://example.com/css/site.css",
                    "@font-face { src: url('../fonts/a.woff2'); }\n"
                    "body { background: url(img/bg.png); }\n"
                    ".x { background: url(\"data:image/png;base64,AAAA\"); }\n",
                    "text/css");
    client.addAsset("https://example.com/fonts/a.woff2", "WOFF", "font/woff2");
    client.addAsset("https://example.com/css/img/bg.png", "BG", "image/png");

    REQUIRE(assets.fetchAsset("/css/site.css", "https://example.com/") == "css/site.css");

    std::string css = readFile(out.path() / "css/site.css");
    REQUIRE(contains(css, "url(\"../fonts/a.woff2\")"));
    REQUIRE(contains(css, "url(\"img/bg.png\")"));
    REQUIRE(contains(css, "data:image/png;base64,AAAA"));
    REQUIRE(readFile(out.path() / "fonts/a.woff2") == "WOFF");
    REQUIRE(readFile(out.path() / "css/img/bg.png") == "BG");
    REQUIRE(assets.storedCount() == 3);
}

TEST_CASE("AssetFetcher scans url() forms in one pass", "[AssetFetcher]") {
    FakeHttpClient client;
    TempDir out;
    CrawlConfig config;
    AssetFetcher assets(client, out.path(), "example.com", config);

    client.addAsset("https://example.com/a.png", "A", "image/png");
    client.addAsset("https://example.com/b.png", "B", "image/png");
    client.addAsset("https://example.com/c (1).png", "C", "image/png");

    SECTION("Spacing, case and quotes") {
        std::string css = "a{background:URL( a.png )} b{background:url(  \"b.png\"  )} c{background:url('c (1).png')}";
        std::string rewritten = assets.rewriteCssUrls(css, "https://example.com/", "index.html");
        REQUIRE(rewritten == "a{background:url(\"a.png\")} b{background:url(\"b.png\")} "
                             "c{background:url(\"c%20(1).png\")}");
    }

    SECTION("Functions merely ending in url are not references") {
        std::string css = "a{background:myurl(a.png)}";
        REQUIRE(assets.rewriteCssUrls(css, "https://example.com/", "index.html") == css);
        REQUIRE(client.totalRequests() == 0);
    }

    SECTION("Unterminated references are kept") {
        std::string css = "a{background:url(a.png} b{background:url('b.png)}";
        std::string rewritten = assets.rewriteCssUrls(css, "https://example.com/", "index.html");
        REQUIRE(client.requestCount("https://example.com/b.png") == 0);
        REQUIRE(contains(rewritten, "url('b.png)}"));
    }
}

TEST_CASE("AssetFetcher rewrites stylesheets with large inline data", "[AssetFetcher]") {
    FakeHttpClient client;
    TempDir out;
    CrawlConfig config;
    AssetFetcher assets(client, out.path(), "example.com", config);

    const std::string payload(256 * 1024, 'A');
    const std::string css =
        "@font-face { src: url(\"data:font/woff2;base64," + payload + "\"); }\n"
        "@font-face { src: url(data:font/woff2;base64," + payload + "); }\n"
        "body { background: url(bg.png); }\n";
    client.addAsset("https://example.com/css/fonts.css", css, "text/css");
    client.addAsset("https://example.com/css/bg.png", "BG", "image/png");

    REQUIRE(assets.fetchAsset("/css/fonts.css", "https://example.com/") == "css/fonts.css");

    std::string stored = readFile(out.path() / "css/fonts.css");
    REQUIRE(contains(stored, "url(\"bg.png\")"));
    REQUIRE(contains(stored, "url(data:font/woff2;base64," + payload + ")"));
    REQUIRE(stored.size() == css.size() - std::string("url(bg.png)").size() + std::string("url(\"bg.png\")").size());
    REQUIRE(client.totalRequests() == 2);
}

TEST_CASE("AssetFetcher handles stylesheets importing each other", "[AssetFetcher]") {
    FakeHttpClient client;
    TempDir out;
    CrawlConfig config;
    AssetFetcher assets(client, out.path(), "example.com", config);

    client.addAsset("https://example.com/a.css", "@import url(b.css);", "text/css");
    client.addAsset("https://example.com/b.css", "@import url(a.css);", "text/css");

    REQUIRE(assets.fetchAsset("/a.css", "https://example.com/") == "a.css");
    REQUIRE(client.requestCount("https://example.com/a.css") == 1);
    REQUIRE(client.requestCount("https://example.com/b.css") == 1);
    REQUIRE(contains(readFile(out.path() / "a.css"), "url(\"b.css\")"));
}

TEST_CASE("AssetFetcher fetches in parallel without duplicates", "[AssetFetcher]") {
    FakeHttpClient client;
    client.setLatency(std::chrono::milliseconds(20));
    TempDir out;
    CrawlConfig config;
    config.maxConcurrentAssetDownloads = 4;
    AssetFetcher assets(client, out.path(), "example.com", config);

    std::vector<std::string> refs;
    for (int i = 0; i < 8; ++i) {
        std::string path = "/img/" + std::to_string(i) + ".png";
        client.addAsset("https://example.com" + path, "IMG", "image/png");
        refs.push_back(path);
        refs.push_back(path);
    }
    refs.push_back("/missing.png");

    auto mapping = assets.fetchAll(refs, "https://example.com/");
    REQUIRE(mapping.size() == 9);
    REQUIRE(mapping["/img/3.png"] == "img/3.png");
    REQUIRE(mapping["/missing.png"] == "/missing.png");
    REQUIRE(client.totalRequests() == 9);
    REQUIRE(assets.storedCount() == 8);
}
