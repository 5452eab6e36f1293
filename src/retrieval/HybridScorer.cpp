#include "konduit/retrieval/HybridScorer.hpp"

#include <algorithm>
#include <iostream>
#include "konduit/Errors.hpp"
#include "konduit/algorithms/Scoring.hpp"

namespace konduit::retrieval {

namespace {
constexpr size_t kOverFetch = 3;
}

std::vector<SearchResult> HybridScorer::candidates(const std::string& query,
                                                   const SearchOptions& options,
                                                   bool* degraded) {
    return candidates(index_.snapshot(), query, options, degraded);
}

std::vector<SearchResult> HybridScorer::candidates(const std::shared_ptr<const Index::Snapshot>& snap,
                                                   const std::string& query,
                                                   const SearchOptions& options,
                                                   bool* degraded) {
    if (!snap || snap->chunks.empty()) throw IndexNotBuilt();
    if (degraded) *degraded = false;

    const size_t n = snap->chunks.size();
    std::vector<double> semantic(n, 0.0);
    bool haveSemantic = false;
    if (!snap->embeddings.empty()) {
        if (auto qv = index_.queryVector(query)) {
            semantic = cosineSimilarity(*qv, snap->embeddings);
            haveSemantic = true;
        }
    }
    if (!haveSemantic && degraded) *degraded = true;

    std::vector<double> keyword(n, 0.0);
    std::vector<double> fused(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        keyword[i] = algo::keywordOverlap(query, snap->chunks[i]);
        fused[i] = algo::hybridScore(semantic[i], keyword[i], options.weight);
    }

    std::vector<SearchResult> out;
    for (const auto& hit : algo::topCandidates(fused, std::min(options.topK * kOverFetch, n))) {
        if (hit.score < options.minScore) continue;
        SearchResult r;
        r.url = snap->urls[hit.id];
        r.content = snap->chunks[hit.id];
        r.semanticScore = semantic[hit.id];
        r.keywordScore = keyword[hit.id];
        r.finalScore = hit.score;
        out.push_back(std::move(r));
    }
    std::cerr << "HybridScorer: retrieved " << out.size() << " candidate chunks for '" << query << "'\n";
    return out;
}

std::vector<SearchResult> HybridScorer::search(const std::string& query,
                                               const SearchOptions& options,
                                               bool* degraded) {
    return search(index_.snapshot(), query, options, degraded);
}

std::vector<SearchResult> HybridScorer::search(const std::shared_ptr<const Index::Snapshot>& snapshot,
                                               const std::string& query,
                                               const SearchOptions& options,
                                               bool* degraded) {
    bool semanticDegraded = false;
    auto pool = candidates(snapshot, query, options, &semanticDegraded);
    bool rerankDegraded = false;
    auto results = reranker_.rerank(query, std::move(pool), options.topK, &rerankDegraded);
    if (degraded) *degraded = semanticDegraded || rerankDegraded;
    return results;
}

} // namespace konduit::retrieval
