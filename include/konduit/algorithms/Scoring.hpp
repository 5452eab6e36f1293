#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace konduit::algo {

struct ScoredCandidate {
    uint32_t id;
    double score;
};

// |q ∩ t| / sqrt(|q| * |t|) over distinct tokens of 3+ chars, rounded to 3 decimals.
double keywordOverlap(const std::string& query, const std::string& text);

// semantic * weight + keyword * (1 - weight)
double hybridScore(double semantic, double keyword, double weight);

// Highest scores first; equal scores keep ascending id order.
std::vector<ScoredCandidate> topCandidates(const std::vector<double>& scores, size_t maxResults);

// Okapi BM25 of query against each text, with statistics taken from the texts themselves.
std::vector<double> bm25Scores(const std::string& query, const std::vector<std::string>& texts);

double roundTo(double value, int decimals);

} // namespace konduit::algo
