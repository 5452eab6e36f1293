#include "konduit/retrieval/Reranker.hpp"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include "konduit/algorithms/Scoring.hpp"

namespace konduit::retrieval {

std::vector<double> LexicalPairScorer::score(const std::string& query, const std::vector<std::string>& texts) {
    return algo::bm25Scores(query, texts);
}

RemotePairScorer::RemotePairScorer(net::HttpClient& client, std::string baseUrl, std::chrono::seconds timeout)
    : client_(client), timeout_(timeout) {
    while (!baseUrl.empty() && baseUrl.back() == '/') baseUrl.pop_back();
    endpoint_ = baseUrl + "/rerank";
}

std::vector<double> RemotePairScorer::score(const std::string& query, const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    nlohmann::json body = {{"query", query}, {"texts", texts}, {"truncate", true}};
    auto res = client_.post(endpoint_,
                            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            "application/json", {}, timeout_);
    if (!res) throw CapabilityError("rerank service unreachable: " + endpoint_);
    if (res->status < 200 || res->status >= 300) {
        throw CapabilityError("rerank service returned status " + std::to_string(res->status));
    }

    std::vector<double> scores(texts.size(), 0.0);
    std::vector<bool> seen(texts.size(), false);
    try {
        auto j = nlohmann::json::parse(res->body);
        if (!j.is_array()) throw CapabilityError("rerank response is not an array");
        for (const auto& item : j) {
            auto idx = item.at("index").get<size_t>();
            if (idx >= texts.size()) throw CapabilityError("rerank response index out of range");
            scores[idx] = item.at("score").get<double>();
            seen[idx] = true;
        }
    } catch (const nlohmann::json::exception& e) {
        throw CapabilityError(std::string("malformed rerank response: ") + e.what());
    }
    if (std::find(seen.begin(), seen.end(), false) != seen.end()) {
        throw CapabilityError("rerank response is missing scores");
    }
    return scores;
}

std::vector<SearchResult> Reranker::rerank(const std::string& query,
                                           std::vector<SearchResult> candidates,
                                           size_t topK,
                                           bool* degraded) {
    if (degraded) *degraded = false;
    if (candidates.empty()) return candidates;

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) texts.push_back(c.content);

    try {
        auto scores = scorer_.score(query, texts);
        if (scores.size() != candidates.size()) {
            throw CapabilityError("pair scorer returned " + std::to_string(scores.size()) +
                                  " scores for " + std::to_string(candidates.size()) + " candidates");
        }
        for (size_t i = 0; i < candidates.size(); ++i) candidates[i].rerankScore = scores[i];
        std::stable_sort(candidates.begin(), candidates.end(), [](const SearchResult& a, const SearchResult& b) {
            return *a.rerankScore > *b.rerankScore;
        });
        std::cerr << "Reranker: re-ranked " << candidates.size() << " results with " << scorer_.name() << "\n";
    } catch (const CapabilityError& e) {
        std::cerr << "Reranker: scoring failed, keeping hybrid order: " << e.what() << "\n";
        for (auto& c : candidates) c.rerankScore.reset();
        if (degraded) *degraded = true;
    }

    if (candidates.size() > topK) candidates.resize(topK);
    return candidates;
}

} // namespace konduit::retrieval
