#include "konduit/crawler/Crawler.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <iostream>
#include <thread>
#include <unordered_set>
#include "konduit/Analyzer.hpp"
#include "konduit/crawler/ContentExtractor.hpp"
#include "konduit/net/Url.hpp"

namespace konduit::crawler {

namespace {

constexpr size_t kMinSegmentTokens = 7;
constexpr size_t kKeptSegments = 6;

std::unordered_set<std::string> queryTermSet(const std::string& query) {
    auto terms = Analyzer::splitWhitespace(Analyzer::toLower(query));
    return std::unordered_set<std::string>(terms.begin(), terms.end());
}

} // namespace

std::string rankTextByQuery(const std::string& text, const std::string& query) {
    if (Analyzer::trim(query).empty()) return text;

    struct Segment {
        std::string text;
        size_t overlap;
    };
    const auto queryTerms = queryTermSet(query);

    std::vector<Segment> segments;
    size_t start = 0;
    while (start <= text.size()) {
        size_t dot = text.find('.', start);
        if (dot == std::string::npos) dot = text.size();
        std::string seg = Analyzer::trim(text.substr(start, dot - start));
        start = dot + 1;

        auto tokens = Analyzer::splitWhitespace(seg);
        if (tokens.size() < kMinSegmentTokens) continue;

        std::unordered_set<std::string> distinct;
        for (const auto& t : tokens) distinct.insert(Analyzer::toLower(t));
        size_t overlap = 0;
        for (const auto& t : distinct) overlap += queryTerms.count(t);
        segments.push_back({std::move(seg), overlap});
    }

    std::stable_sort(segments.begin(), segments.end(), [](const Segment& a, const Segment& b) {
        return a.overlap > b.overlap;
    });

    std::string out;
    for (size_t i = 0; i < segments.size() && i < kKeptSegments; ++i) {
        if (!out.empty()) out += ". ";
        out += segments[i].text;
    }
    return out;
}

size_t relevanceHits(const std::string& text, const std::string& query) {
    const std::string haystack = Analyzer::toLower(text);
    size_t hits = 0;
    for (const auto& term : queryTermSet(query)) {
        if (haystack.find(term) != std::string::npos) ++hits;
    }
    return hits;
}

std::string brandFallbackUrl(const std::string& netloc, const std::string& fallbackBase) {
    std::string host = Analyzer::toLower(netloc);
    if (host.rfind("www.", 0) == 0) host = host.substr(4);
    std::string brand = host.substr(0, host.find('.'));
    brand = brand.substr(0, brand.find(':'));
    if (!brand.empty()) brand[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(brand[0])));
    return fallbackBase + brand;
}

Crawler::Crawler(net::HttpClient& client,
                 AuditLog* audit,
                 const ArtifactStore* store,
                 FetchOptions fetchOptions,
                 bool cacheRobots)
    : gate_(client, audit, fetchOptions.timeout, cacheRobots),
      fetcher_(client, fetchOptions),
      store_(store) {}

CrawlResult Crawler::crawl(const std::string& startUrl, const CrawlOptions& options) {
    CrawlResult result;
    auto seed = net::parseUrl(startUrl);
    if (!seed || !net::isHttpScheme(seed->scheme)) {
        std::cerr << "Crawler: invalid start url " << startUrl << "\n";
        return result;
    }
    const std::string domain = seed->host;
    const std::string netloc = seed->netloc();

    std::cerr << "Crawler: starting crawl from " << startUrl << " (domain " << domain
              << ", maxPages=" << options.maxPages << ", maxDepth=" << options.maxDepth << ")\n";

    std::deque<Task> queue;
    queue.push_back({seed->toString(), 0});
    std::unordered_set<std::string> visited;

    while (!queue.empty() && result.pages.size() < options.maxPages) {
        Task task = std::move(queue.front());
        queue.pop_front();
        if (visited.count(task.url) || task.depth > options.maxDepth) continue;

        if (!gate_.allowed(task.url)) {
            result.blocked.push_back(task.url);
            continue;
        }

        auto html = fetcher_.fetch(task.url);
        visited.insert(task.url);

        if (html) {
            std::string text = ContentExtractor::extract(*html);
            if (!text.empty()) {
                std::string ranked = rankTextByQuery(text, options.query);
                std::cerr << "Crawler: crawled " << task.url << " (" << ranked.size() << " chars)\n";
                result.pages.push_back({task.url, ranked});

                if (relevanceHits(ranked, options.query) >= options.earlyExitHits) {
                    std::cerr << "Crawler: early stop, sufficient relevant hits in " << task.url << "\n";
                    result.earlyExit = true;
                    break;
                }

                if (task.depth < options.maxDepth) {
                    for (const auto& link : ContentExtractor::links(*html, task.url, domain)) {
                        if (queue.size() >= options.maxPages) break;
                        if (visited.count(link)) continue;
                        queue.push_back({link, task.depth + 1});
                    }
                }
            }
        }

        if (options.politeDelay.count() > 0 && !queue.empty() && result.pages.size() < options.maxPages) {
            std::this_thread::sleep_for(options.politeDelay);
        }
    }
    result.visited = visited.size();

    if (result.pages.empty()) {
        std::string fallback = brandFallbackUrl(netloc, options.fallbackBase);
        std::cerr << "Crawler: no crawlable data found, trying fallback " << fallback << "\n";
        result.fallbackAttempted = true;
        if (auto html = fetcher_.fetch(fallback)) {
            std::string text = ContentExtractor::extract(*html);
            if (!text.empty()) {
                result.pages.push_back({fallback, rankTextByQuery(text, options.query)});
            }
        }
    }

    std::cerr << "Crawler: crawl complete, collected " << result.pages.size()
              << " pages, blocked " << result.blocked.size() << " urls\n";

    if (store_ && store_->enabled()) {
        result.artifactPath = store_->writeCrawl(netloc, result.pages);
        if (!result.artifactPath.empty()) {
            std::cerr << "Crawler: data saved to " << result.artifactPath << "\n";
        }
    }
    return result;
}

} // namespace konduit::crawler
