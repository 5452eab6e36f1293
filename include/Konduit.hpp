//Konduit.hpp
#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "konduit/ArtifactStore.hpp"
#include "konduit/AuditLog.hpp"
#include "konduit/Config.hpp"
#include "konduit/Errors.hpp"
#include "konduit/Types.hpp"
#include "konduit/crawler/Crawler.hpp"
#include "konduit/net/HttpClient.hpp"
#include "konduit/retrieval/Embedder.hpp"
#include "konduit/retrieval/HybridScorer.hpp"
#include "konduit/retrieval/Index.hpp"
#include "konduit/retrieval/Reranker.hpp"
#include "konduit/retrieval/Summarizer.hpp"

namespace konduit {

struct CrawlSummary {
    std::vector<Page> pages;
    std::vector<std::string> blocked;
    std::vector<std::string> artifacts;
};

struct QueryRequest {
    std::string query;
    std::string url;
    std::string url2;
    bool smart = false;
};

struct QueryResponse {
    bool success = true;
    std::string message;
    // Unset unless smart mode was requested or nothing relevant was found.
    std::optional<std::string> summary;
    std::vector<SearchResult> results;
    std::vector<std::string> blocked;
    bool degraded = false;
};

void to_json(nlohmann::json& j, const QueryResponse& r);
// Reads query/url/url2/smart with trimmed strings. Missing keys keep their
// defaults; a non-object body or a key of the wrong type throws
// nlohmann::json::type_error.
void from_json(const nlohmann::json& j, QueryRequest& r);

class Konduit {
public:
    static constexpr const char* kNothingFound = "No relevant information found.";

    explicit Konduit(Config config = Config::fromEnvironment());
    // Uses the given transport for crawling and remote capabilities.
    Konduit(Config config, std::shared_ptr<net::HttpClient> client);
    ~Konduit();

    Konduit(const Konduit&) = delete;
    Konduit& operator=(const Konduit&) = delete;

    // One independent crawler per non-empty seed, run concurrently.
    // maxPages == 0 uses the configured cap.
    CrawlSummary crawlSites(const std::vector<std::string>& seeds,
                            const std::string& query,
                            size_t maxPages = 0);

    // Crawls without a query and, when pages were found, starts a background
    // rebuild. The returned future is also tracked by indexStatus().
    CrawlSummary crawlAndIndex(const std::string& url,
                               const std::string& url2,
                               std::shared_future<retrieval::BuildReport>* build = nullptr);

    // Crawl, rebuild, search and optionally summarize. Requests are serialized.
    QueryResponse answer(const QueryRequest& request);

    // Hybrid search on the current index. Throws IndexNotBuilt.
    std::vector<SearchResult> search(const std::string& query, size_t topK, bool* degraded = nullptr);

    nlohmann::json indexStatus();

    const Config& config() const { return config_; }
    retrieval::Index& index() { return *index_; }

private:
    Config config_;
    std::shared_ptr<net::HttpClient> client_;
    std::unique_ptr<AuditLog> audit_;
    ArtifactStore store_;
    std::unique_ptr<retrieval::Embedder> embedder_;
    std::unique_ptr<retrieval::PairScorer> pairScorer_;
    std::unique_ptr<retrieval::Index> index_;
    std::unique_ptr<retrieval::Reranker> reranker_;
    std::unique_ptr<retrieval::HybridScorer> scorer_;
    retrieval::Summarizer summarizer_;

    std::mutex queryMutex_;

    std::mutex buildMutex_;
    std::shared_future<retrieval::BuildReport> pendingBuild_;
    std::optional<retrieval::BuildReport> lastBuild_;

    crawler::CrawlResult crawlOne(const std::string& seed, const std::string& query, size_t maxPages);
    void recordBuild(const retrieval::BuildReport& report);
    retrieval::SearchOptions searchOptions(size_t topK) const;
};

} // namespace konduit
