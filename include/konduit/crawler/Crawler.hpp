#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "konduit/ArtifactStore.hpp"
#include "konduit/Types.hpp"
#include "konduit/crawler/Fetcher.hpp"
#include "konduit/crawler/PolicyGate.hpp"
#include "konduit/net/HttpClient.hpp"

namespace konduit::crawler {

struct CrawlOptions {
    size_t maxPages = 50;
    int maxDepth = 2;
    std::string query;
    std::chrono::milliseconds politeDelay{200};
    // Distinct query terms that end the crawl once present in a page.
    size_t earlyExitHits = 2;
    // Prefix of the reference page tried when nothing was collected.
    std::string fallbackBase = "https://en.wikipedia.org/wiki/";
};

struct CrawlResult {
    std::vector<Page> pages;
    std::vector<std::string> blocked;
    size_t visited = 0;
    bool earlyExit = false;
    bool fallbackAttempted = false;
    std::string artifactPath;
};

// Keeps sentence-like segments with more than 6 tokens, orders them by query
// token overlap and joins the top 6. Returns text unchanged for an empty query.
std::string rankTextByQuery(const std::string& text, const std::string& query);

// Number of distinct query terms occurring (case-insensitively) in text.
size_t relevanceHits(const std::string& text, const std::string& query);

// https://en.wikipedia.org/wiki/Example for "www.example.com".
std::string brandFallbackUrl(const std::string& netloc, const std::string& fallbackBase);

// Breadth-first, policy-aware crawler bounded by page count and depth.
// Each crawl() call owns its own queue and visited set.
class Crawler {
public:
    Crawler(net::HttpClient& client,
            AuditLog* audit,
            const ArtifactStore* store,
            FetchOptions fetchOptions = {},
            bool cacheRobots = false);

    CrawlResult crawl(const std::string& startUrl, const CrawlOptions& options);

private:
    PolicyGate gate_;
    Fetcher fetcher_;
    const ArtifactStore* store_;

    struct Task {
        std::string url;
        int depth;
    };
};

} // namespace konduit::crawler
