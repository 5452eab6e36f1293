#include "konduit/algorithms/Scoring.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include "konduit/Analyzer.hpp"

namespace konduit::algo {

namespace {

constexpr size_t kKeywordMinLength = 3;

struct Posting {
    uint32_t id;
    uint32_t tf;
};

std::unordered_set<std::string> keywordSet(const std::string& text) {
    auto tokens = Analyzer::wordTokens(text, kKeywordMinLength);
    return std::unordered_set<std::string>(tokens.begin(), tokens.end());
}

} // namespace

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double keywordOverlap(const std::string& query, const std::string& text) {
    auto q = keywordSet(query);
    auto t = keywordSet(text);
    if (q.empty() || t.empty()) return 0.0;

    size_t common = 0;
    const auto& smaller = q.size() <= t.size() ? q : t;
    const auto& larger = q.size() <= t.size() ? t : q;
    for (const auto& token : smaller) {
        if (larger.count(token)) ++common;
    }
    const double denom = std::sqrt(static_cast<double>(q.size()) * static_cast<double>(t.size()));
    return roundTo(static_cast<double>(common) / denom, 3);
}

double hybridScore(double semantic, double keyword, double weight) {
    return semantic * weight + keyword * (1.0 - weight);
}

std::vector<ScoredCandidate> topCandidates(const std::vector<double>& scores, size_t maxResults) {
    std::vector<ScoredCandidate> hits;
    hits.reserve(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        hits.push_back({static_cast<uint32_t>(i), scores[i]});
    }
    const size_t keep = std::min(maxResults, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + keep, hits.end(),
                      [](const ScoredCandidate& a, const ScoredCandidate& b) {
                          if (a.score == b.score) return a.id < b.id;
                          return a.score > b.score;
                      });
    hits.resize(keep);
    return hits;
}

std::vector<double> bm25Scores(const std::string& query, const std::vector<std::string>& texts) {
    std::vector<double> scores(texts.size(), 0.0);
    auto terms = Analyzer::tokenize(query);
    if (terms.empty() || texts.empty()) return scores;
    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

    const double k1 = 1.5;
    const double b = 0.75;

    std::unordered_map<std::string, std::vector<Posting>> index;
    std::vector<uint32_t> docLengths(texts.size(), 0);
    double totalLen = 0.0;
    for (size_t i = 0; i < texts.size(); ++i) {
        auto tokens = Analyzer::tokenize(texts[i]);
        docLengths[i] = static_cast<uint32_t>(tokens.size());
        totalLen += static_cast<double>(tokens.size());
        std::unordered_map<std::string, uint32_t> tf;
        for (const auto& tok : tokens) ++tf[tok];
        for (const auto& kv : tf) {
            index[kv.first].push_back({static_cast<uint32_t>(i), kv.second});
        }
    }
    const double N = static_cast<double>(texts.size());
    const double avgLen = totalLen > 0 ? totalLen / N : 1.0;

    for (const auto& term : terms) {
        auto it = index.find(term);
        if (it == index.end()) continue;
        const auto& plist = it->second;
        const double df = static_cast<double>(plist.size());
        const double idf = std::log((N - df + 0.5) / (df + 0.5) + 1.0);
        for (const auto& p : plist) {
            const double tf = static_cast<double>(p.tf);
            const double dl = docLengths[p.id] > 0 ? static_cast<double>(docLengths[p.id]) : 1.0;
            const double denom = tf + k1 * (1.0 - b + b * (dl / avgLen));
            scores[p.id] += idf * (tf * (k1 + 1.0)) / denom;
        }
    }
    return scores;
}

} // namespace konduit::algo
