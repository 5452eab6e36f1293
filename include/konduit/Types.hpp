#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace konduit {

// One successfully fetched and parsed page.
struct Page {
    std::string url;
    std::string content;
};

struct SearchResult {
    std::string url;
    std::string content;
    double semanticScore = 0.0;
    double keywordScore = 0.0;
    double finalScore = 0.0;
    // Unset when the reranker could not score the candidates.
    std::optional<double> rerankScore;
};

inline void to_json(nlohmann::json& j, const Page& p) {
    j = nlohmann::json{{"url", p.url}, {"content", p.content}};
}

inline void from_json(const nlohmann::json& j, Page& p) {
    p.url = j.value("url", "unknown");
    p.content = j.value("content", "");
}

inline void to_json(nlohmann::json& j, const SearchResult& r) {
    j = nlohmann::json{
        {"url", r.url},
        {"content", r.content},
        {"semantic_score", r.semanticScore},
        {"keyword_score", r.keywordScore},
        {"final_score", r.finalScore},
        {"rerank_score", r.rerankScore ? nlohmann::json(*r.rerankScore) : nlohmann::json(nullptr)}
    };
}

} // namespace konduit
