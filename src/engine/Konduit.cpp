#include "Konduit.hpp"

#include <chrono>
#include <iostream>
#include "konduit/Analyzer.hpp"

namespace konduit {

void to_json(nlohmann::json& j, const QueryResponse& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"summary", r.summary ? nlohmann::json(*r.summary) : nlohmann::json(nullptr)},
        {"results", r.results},
        {"blocked", r.blocked},
        {"degraded", r.degraded}
    };
    if (!r.message.empty()) j["message"] = r.message;
}

void from_json(const nlohmann::json& j, QueryRequest& r) {
    r.query = Analyzer::trim(j.value("query", ""));
    r.url = Analyzer::trim(j.value("url", ""));
    r.url2 = Analyzer::trim(j.value("url2", ""));
    r.smart = j.value("smart", false);
}

Konduit::Konduit(Config config)
    : Konduit(config, std::make_shared<net::HttplibClient>(config.maxDownloadBytes)) {}

Konduit::Konduit(Config config, std::shared_ptr<net::HttpClient> client)
    : config_(std::move(config)),
      client_(std::move(client)),
      audit_(std::make_unique<AuditLog>(config_.logDir)),
      store_(config_.dataDir, config_.compressArtifacts) {
    if (config_.embedUrl.empty()) {
        embedder_ = std::make_unique<retrieval::HashingEmbedder>(config_.embedDim);
    } else {
        embedder_ = std::make_unique<retrieval::RemoteEmbedder>(*client_, config_.embedUrl, config_.modelName);
    }
    if (config_.rerankUrl.empty()) {
        pairScorer_ = std::make_unique<retrieval::LexicalPairScorer>();
    } else {
        pairScorer_ = std::make_unique<retrieval::RemotePairScorer>(*client_, config_.rerankUrl);
    }
    index_ = std::make_unique<retrieval::Index>(*embedder_, &store_);
    reranker_ = std::make_unique<retrieval::Reranker>(*pairScorer_);
    scorer_ = std::make_unique<retrieval::HybridScorer>(*index_, *reranker_);

    std::cerr << "Konduit: embedder " << embedder_->name() << ", pair scorer " << pairScorer_->name() << "\n";
}

Konduit::~Konduit() {
    std::lock_guard<std::mutex> lock(buildMutex_);
    if (pendingBuild_.valid()) pendingBuild_.wait();
}

crawler::CrawlResult Konduit::crawlOne(const std::string& seed, const std::string& query, size_t maxPages) {
    crawler::FetchOptions fetchOptions;
    fetchOptions.timeout = std::chrono::seconds(config_.fetchTimeoutSec);
    fetchOptions.concurrency = config_.fetchConcurrency;

    crawler::CrawlOptions options;
    options.maxPages = maxPages;
    options.maxDepth = config_.maxDepth;
    options.query = query;
    options.politeDelay = std::chrono::milliseconds(config_.crawlDelayMs);
    options.fallbackBase = config_.fallbackBase;

    crawler::Crawler crawler(*client_, audit_.get(), &store_, fetchOptions, config_.cacheRobots);
    return crawler.crawl(seed, options);
}

CrawlSummary Konduit::crawlSites(const std::vector<std::string>& seeds, const std::string& query, size_t maxPages) {
    if (maxPages == 0) maxPages = config_.maxPages;

    std::vector<std::future<crawler::CrawlResult>> jobs;
    for (const auto& seed : seeds) {
        if (seed.empty()) continue;
        jobs.push_back(std::async(std::launch::async, [this, seed, query, maxPages]() {
            return crawlOne(seed, query, maxPages);
        }));
    }

    CrawlSummary summary;
    for (auto& job : jobs) {
        auto result = job.get();
        for (auto& p : result.pages) summary.pages.push_back(std::move(p));
        for (auto& b : result.blocked) summary.blocked.push_back(std::move(b));
        if (!result.artifactPath.empty()) summary.artifacts.push_back(std::move(result.artifactPath));
    }
    return summary;
}

void Konduit::recordBuild(const retrieval::BuildReport& report) {
    std::lock_guard<std::mutex> lock(buildMutex_);
    lastBuild_ = report;
}

CrawlSummary Konduit::crawlAndIndex(const std::string& url,
                                    const std::string& url2,
                                    std::shared_future<retrieval::BuildReport>* build) {
    std::cerr << "Konduit: crawl initiated for " << (url.empty() ? url2 : url) << "\n";
    auto summary = crawlSites({url, url2}, "");
    std::cerr << "Konduit: crawl completed, " << summary.pages.size() << " pages, "
              << summary.blocked.size() << " blocked\n";
    if (summary.pages.empty()) return summary;

    auto future = index_->buildAsync(summary.pages);
    {
        std::lock_guard<std::mutex> lock(buildMutex_);
        pendingBuild_ = future;
    }
    if (build) *build = future;
    return summary;
}

retrieval::SearchOptions Konduit::searchOptions(size_t topK) const {
    retrieval::SearchOptions options;
    options.topK = topK;
    options.weight = config_.hybridWeight;
    options.minScore = config_.minScore;
    return options;
}

std::vector<SearchResult> Konduit::search(const std::string& query, size_t topK, bool* degraded) {
    return scorer_->search(query, searchOptions(topK), degraded);
}

QueryResponse Konduit::answer(const QueryRequest& request) {
    std::lock_guard<std::mutex> lock(queryMutex_);
    QueryResponse response;

    if (request.query.empty()) {
        response.success = false;
        response.message = "Query is required.";
        return response;
    }
    std::cerr << "Konduit: searching for '" << request.query << "' across "
              << (request.url.empty() ? "N/A" : request.url) << " " << request.url2 << "\n";

    auto crawl = crawlSites({request.url, request.url2}, request.query);
    if (crawl.pages.empty()) {
        std::cerr << "Konduit: no data from domains, crawling " << config_.fallbackSeed << "\n";
        auto fallback = crawlSites({config_.fallbackSeed}, "", 2);
        for (auto& p : fallback.pages) crawl.pages.push_back(std::move(p));
        for (auto& b : fallback.blocked) crawl.blocked.push_back(std::move(b));
    }
    response.blocked = crawl.blocked;

    // A background rebuild may publish right after ours; answer from our own snapshot.
    std::shared_ptr<const retrieval::Index::Snapshot> snapshot;
    auto report = index_->build(crawl.pages, &snapshot);
    recordBuild(report);
    if (!report.built) {
        response.summary = kNothingFound;
        response.message = "No readable content found.";
        return response;
    }

    try {
        response.results = scorer_->search(snapshot, request.query, searchOptions(config_.topK), &response.degraded);
    } catch (const IndexNotBuilt&) {
        response.summary = kNothingFound;
        return response;
    }
    if (response.results.empty()) {
        response.summary = kNothingFound;
        return response;
    }

    if (request.smart) {
        std::string combined;
        for (const auto& r : response.results) {
            if (!combined.empty()) combined += ' ';
            combined += r.content;
        }
        response.summary = summarizer_.summarize(combined, request.query);
    }
    std::cerr << "Konduit: search complete for '" << request.query << "', "
              << response.results.size() << " results\n";
    return response;
}

nlohmann::json Konduit::indexStatus() {
    nlohmann::json status = {
        {"built", index_->built()},
        {"chunks", index_->size()},
        {"generation", index_->generation()},
        {"query_cache", index_->queryCacheSize()},
        {"embedder", embedder_->name()},
        {"pair_scorer", pairScorer_->name()}
    };

    std::lock_guard<std::mutex> lock(buildMutex_);
    bool pending = false;
    if (pendingBuild_.valid()) {
        if (pendingBuild_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            lastBuild_ = pendingBuild_.get();
            pendingBuild_ = {};
        } else {
            pending = true;
        }
    }
    status["build_pending"] = pending;
    if (lastBuild_) {
        status["last_build"] = {
            {"built", lastBuild_->built},
            {"pages", lastBuild_->pages},
            {"chunks", lastBuild_->chunks},
            {"generation", lastBuild_->generation},
            {"semantic", lastBuild_->semantic},
            {"artifact", lastBuild_->artifactPath},
            {"message", lastBuild_->message}
        };
    }
    return status;
}

} // namespace konduit
