#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "konduit/Types.hpp"
#include "konduit/retrieval/Index.hpp"
#include "konduit/retrieval/Reranker.hpp"

namespace konduit::retrieval {

struct SearchOptions {
    size_t topK = 5;
    double weight = 0.7;
    double minScore = 0.15;
};

// Fuses cosine similarity with keyword overlap, over-fetches 3 * topK
// candidates above minScore and hands them to the reranker.
class HybridScorer {
public:
    HybridScorer(Index& index, Reranker& reranker) : index_(index), reranker_(reranker) {}

    // Throws IndexNotBuilt. *degraded is set when an external capability failed.
    std::vector<SearchResult> search(const std::string& query,
                                     const SearchOptions& options = {},
                                     bool* degraded = nullptr);

    // The pre-rerank candidate pool.
    std::vector<SearchResult> candidates(const std::string& query,
                                         const SearchOptions& options = {},
                                         bool* degraded = nullptr);

    // Same as above, against a pinned snapshot instead of the current one.
    std::vector<SearchResult> search(const std::shared_ptr<const Index::Snapshot>& snapshot,
                                     const std::string& query,
                                     const SearchOptions& options = {},
                                     bool* degraded = nullptr);
    std::vector<SearchResult> candidates(const std::shared_ptr<const Index::Snapshot>& snapshot,
                                         const std::string& query,
                                         const SearchOptions& options = {},
                                         bool* degraded = nullptr);

private:
    Index& index_;
    Reranker& reranker_;
};

} // namespace konduit::retrieval
