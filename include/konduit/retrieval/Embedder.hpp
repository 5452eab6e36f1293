#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "konduit/Errors.hpp"
#include "konduit/net/HttpClient.hpp"

namespace konduit::retrieval {

using Vector = std::vector<float>;

// Maps text to a fixed-length vector. Remote implementations throw CapabilityError.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual Vector encode(const std::string& text) = 0;
    virtual std::vector<Vector> encodeBatch(const std::vector<std::string>& texts) = 0;
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

// Cosine similarity of query against every row; 0 where either side has zero norm.
std::vector<double> cosineSimilarity(const Vector& query, const std::vector<Vector>& rows);

// Deterministic local embedder: signed feature hashing of word unigrams and
// bigrams with sublinear term frequency, L2-normalized.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension = 384);

    Vector encode(const std::string& text) override;
    std::vector<Vector> encodeBatch(const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing-" + std::to_string(dimension_); }

private:
    size_t dimension_;
};

// text-embeddings-inference client: POST {"inputs": [...]} to <baseUrl>/embed.
class RemoteEmbedder : public Embedder {
public:
    static constexpr size_t kMaxBatch = 32;

    RemoteEmbedder(net::HttpClient& client,
                   std::string baseUrl,
                   std::string modelName,
                   std::chrono::seconds timeout = std::chrono::seconds(30));

    Vector encode(const std::string& text) override;
    std::vector<Vector> encodeBatch(const std::vector<std::string>& texts) override;
    // 0 until the first successful response.
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return modelName_; }

private:
    net::HttpClient& client_;
    std::string endpoint_;
    std::string modelName_;
    std::chrono::seconds timeout_;
    std::atomic<size_t> dimension_{0};

    std::vector<Vector> request(const std::vector<std::string>& texts);
};

} // namespace konduit::retrieval
