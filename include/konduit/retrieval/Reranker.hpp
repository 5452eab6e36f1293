#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "konduit/Errors.hpp"
#include "konduit/Types.hpp"
#include "konduit/net/HttpClient.hpp"

namespace konduit::retrieval {

// Scores (query, text) pairs jointly; one score per text, higher is more relevant.
class PairScorer {
public:
    virtual ~PairScorer() = default;

    virtual std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) = 0;
    virtual std::string name() const = 0;
};

// BM25 of the query against the candidate pool.
class LexicalPairScorer : public PairScorer {
public:
    std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) override;
    std::string name() const override { return "bm25"; }
};

// text-embeddings-inference cross-encoder: POST {"query", "texts"} to <baseUrl>/rerank.
class RemotePairScorer : public PairScorer {
public:
    RemotePairScorer(net::HttpClient& client,
                     std::string baseUrl,
                     std::chrono::seconds timeout = std::chrono::seconds(30));

    std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) override;
    std::string name() const override { return endpoint_; }

private:
    net::HttpClient& client_;
    std::string endpoint_;
    std::chrono::seconds timeout_;
};

class Reranker {
public:
    explicit Reranker(PairScorer& scorer) : scorer_(scorer) {}

    // Orders candidates by pair score (descending) and keeps at most topK.
    // When the scorer fails the input order is kept, rerankScore stays unset
    // and *degraded is set.
    std::vector<SearchResult> rerank(const std::string& query,
                                     std::vector<SearchResult> candidates,
                                     size_t topK = 5,
                                     bool* degraded = nullptr);

private:
    PairScorer& scorer_;
};

} // namespace konduit::retrieval
