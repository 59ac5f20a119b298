#include <catch2/catch_test_macros.hpp>
#include "URLFrontier.h"
#include <thread>
#include <vector>

using namespace site_mirror::crawler;

TEST_CASE("URLFrontier handles basic URL operations", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Hands out URLs last in first out") {
        frontier.addURL("https://example.com/page1");
        frontier.addURL("https://example.com/page2", 1);

        REQUIRE(frontier.size() == 2);
        REQUIRE_FALSE(frontier.isEmpty());

        auto first = frontier.claimNextURL();
        REQUIRE(first.has_value());
        REQUIRE(first->url == "https://example.com/page2");
        REQUIRE(first->depth == 1);
        REQUIRE(frontier.claimNextURL()->url == "https://example.com/page1");
        REQUIRE(frontier.isEmpty());
    }

    SECTION("Handles empty frontier") {
        REQUIRE(frontier.isEmpty());
        REQUIRE(frontier.size() == 0);
        REQUIRE_FALSE(frontier.claimNextURL().has_value());
    }

    SECTION("Batches keep document order") {
        size_t added = frontier.addURLs({"https://example.com/a", "https://example.com/b", "https://example.com/c"}, 2);
        REQUIRE(added == 3);
        REQUIRE(frontier.claimNextURL()->url == "https://example.com/a");
        REQUIRE(frontier.claimNextURL()->url == "https://example.com/b");
        REQUIRE(frontier.claimNextURL()->url == "https://example.com/c");
    }
}

TEST_CASE("URLFrontier handles URL normalization", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Variants of one page are claimed once") {
        frontier.addURL("https://example.com/page1");
        frontier.addURL("https://example.com/page1/");
        frontier.addURL("https://example.com/page1#section");
        frontier.addURL("https://EXAMPLE.com/page1?utm=x");

        auto claimed = frontier.claimNextURL();
        REQUIRE(claimed->url == "https://example.com/page1");
        REQUIRE_FALSE(frontier.claimNextURL().has_value());
        REQUIRE(frontier.visitedCount() == 1);
    }

    SECTION("Schemes are kept apart") {
        frontier.addURL("http://example.com");
        frontier.addURL("https://example.com");

        REQUIRE(frontier.claimNextURL()->url == "https://example.com/");
        REQUIRE(frontier.claimNextURL()->url == "http://example.com/");
    }
}

TEST_CASE("URLFrontier handles visited URLs", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Claiming marks a URL visited") {
        std::string url = "https://example.com/page1";
        frontier.addURL(url);

        REQUIRE_FALSE(frontier.isVisited(url));
        frontier.claimNextURL();
        REQUIRE(frontier.isVisited(url));
        REQUIRE(frontier.isVisited(url + "/"));
    }

    SECTION("Doesn't add already visited URLs") {
        std::string url = "https://example.com/page1";
        REQUIRE(frontier.markVisited(url));
        REQUIRE_FALSE(frontier.markVisited(url));
        REQUIRE_FALSE(frontier.addURL(url));
        REQUIRE(frontier.size() == 0);
    }
}

TEST_CASE("URLFrontier is safe to share between threads", "[URLFrontier]") {
    URLFrontier frontier;
    for (int i = 0; i < 200; ++i) {
        frontier.addURL("https://example.com/p" + std::to_string(i % 100));
    }

    std::vector<std::thread> threads;
    std::vector<size_t> claimed(4, 0);
    for (size_t t = 0; t < claimed.size(); ++t) {
        threads.emplace_back([&frontier, &claimed, t]() {
            while (frontier.claimNextURL()) {
                claimed[t]++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    size_t total = 0;
    for (size_t count : claimed) {
        total += count;
    }
    REQUIRE(total == 100);
    REQUIRE(frontier.visitedCount() == 100);
}
