#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/Logger.h"
#include "../include/site_mirror/SiteMirror.h"
#include "../include/site_mirror/crawler/models/ResultJson.h"

using site_mirror::SiteMirror;
using namespace site_mirror::crawler;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailedJob = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::string command;
    std::string url;
    std::string platform = "general";
    std::string mode = "multi_page";
    std::string outputRoot;
    std::vector<std::string> pages;
    std::optional<std::string> logLevel;
};

void printUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  site_mirror discover <url> [--platform NAME] [--log-level LEVEL]\n"
        << "  site_mirror crawl <url> --out DIR [--platform NAME] [--mode single_page|multi_page]\n"
        << "                    [--page URL]... [--log-level LEVEL]\n"
        << "\n"
        << "Environment: SITE_MIRROR_LOG_LEVEL, SITE_MIRROR_LOG_FILE, SITE_MIRROR_USER_AGENT,\n"
        << "             SITE_MIRROR_TIMEOUT_MS, SITE_MIRROR_ASSET_CONCURRENCY, SITE_MIRROR_VERIFY_SSL\n";
}

// Returns nullopt after printing a diagnostic when the arguments are invalid
std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    if (argc < 3) {
        return std::nullopt;
    }

    CommandLine cli;
    cli.command = argv[1];
    cli.url = argv[2];
    if (cli.command != "discover" && cli.command != "crawl") {
        std::cerr << "Unknown command: " << cli.command << "\n";
        return std::nullopt;
    }

    for (int i = 3; i < argc; ++i) {
        std::string option = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << option << "\n";
            return std::nullopt;
        }
        std::string value = argv[++i];
        if (option == "--platform") {
            cli.platform = value;
        } else if (option == "--log-level") {
            cli.logLevel = value;
        } else if (cli.command == "crawl" && option == "--out") {
            cli.outputRoot = value;
        } else if (cli.command == "crawl" && option == "--mode") {
            cli.mode = value;
        } else if (cli.command == "crawl" && option == "--page") {
            cli.pages.push_back(value);
        } else {
            std::cerr << "Unknown option for " << cli.command << ": " << option << "\n";
            return std::nullopt;
        }
    }
    return cli;
}

std::optional<std::string> envValue(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<size_t> envNumber(const char* name) {
    auto value = envValue(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoul(*value));
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Ignoring invalid ") + name + "=" + *value + ": " + e.what());
        return std::nullopt;
    }
}

CrawlConfig loadConfig() {
    CrawlConfig config;
    if (auto userAgent = envValue("SITE_MIRROR_USER_AGENT")) {
        config.userAgent = *userAgent;
    }
    if (auto timeoutMs = envNumber("SITE_MIRROR_TIMEOUT_MS")) {
        config.requestTimeout = std::chrono::milliseconds(*timeoutMs);
    }
    if (auto concurrency = envNumber("SITE_MIRROR_ASSET_CONCURRENCY")) {
        config.maxConcurrentAssetDownloads = *concurrency;
    }
    if (auto verify = envValue("SITE_MIRROR_VERIFY_SSL")) {
        config.verifySSL = !(*verify == "0" || *verify == "false" || *verify == "no");
    }
    LOG_DEBUG("Request timeout: " + std::to_string(config.requestTimeout.count()) + "ms, asset concurrency: " +
              std::to_string(config.maxConcurrentAssetDownloads));
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(std::cout);
        return kExitSuccess;
    }

    auto cli = parseCommandLine(argc, argv);
    if (!cli) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    std::string levelName = cli->logLevel.value_or(envValue("SITE_MIRROR_LOG_LEVEL").value_or("info"));
    Logger::getInstance().init(Logger::parseLevel(levelName), true, envValue("SITE_MIRROR_LOG_FILE").value_or(""));

    nlohmann::json output;
    bool success = false;
    try {
        SiteMirror mirror(loadConfig());

        if (cli->command == "discover") {
            DiscoveryResult result = mirror.discover(cli->url, cli->platform);
            output = toJson(result);
            success = result.success;
        } else {
            auto mode = parseCrawlMode(cli->mode);
            if (!mode) {
                std::cerr << "Unknown mode: " << cli->mode << "\n";
                printUsage(std::cerr);
                return kExitUsage;
            }
            if (cli->outputRoot.empty()) {
                std::cerr << "crawl requires --out DIR\n";
                printUsage(std::cerr);
                return kExitUsage;
            }

            CrawlJob job;
            job.startUrl = cli->url;
            job.platform = cli->platform;
            job.mode = *mode;
            job.outputRoot = cli->outputRoot;
            if (!cli->pages.empty()) {
                job.selectedPages = cli->pages;
            }

            CrawlResult result = mirror.crawl(job);
            output = toJson(result);
            success = result.success;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal error: ") + e.what());
        output = nlohmann::json::object();
        output["success"] = false;
        output["message"] = e.what();
    }

    std::cout << dumpJson(output) << std::endl;
    Logger::getInstance().close();
    return success ? kExitSuccess : kExitFailedJob;
}
