#include "konduit/retrieval/Embedder.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "konduit/Analyzer.hpp"

namespace konduit::retrieval {

namespace {

constexpr float kBigramWeight = 0.5f;

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

double norm(const Vector& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * static_cast<double>(x);
    return std::sqrt(sum);
}

std::string trimSlash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

std::vector<double> cosineSimilarity(const Vector& query, const std::vector<Vector>& rows) {
    std::vector<double> out(rows.size(), 0.0);
    const double qn = norm(query);
    if (qn == 0.0) return out;
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (row.size() != query.size()) continue;
        const double rn = norm(row);
        if (rn == 0.0) continue;
        double dot = 0.0;
        for (size_t k = 0; k < row.size(); ++k) {
            dot += static_cast<double>(query[k]) * static_cast<double>(row[k]);
        }
        out[i] = dot / (qn * rn);
    }
    return out;
}

// ------------------------------------------------------------
// HashingEmbedder
// ------------------------------------------------------------

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension > 0 ? dimension : 384) {}

Vector HashingEmbedder::encode(const std::string& text) {
    Vector v(dimension_, 0.0f);
    auto tokens = Analyzer::tokenize(text);
    if (tokens.empty()) return v;

    std::unordered_map<std::string, float> features;
    for (size_t i = 0; i < tokens.size(); ++i) {
        features[tokens[i]] += 1.0f;
        if (i + 1 < tokens.size()) features[tokens[i] + ' ' + tokens[i + 1]] += kBigramWeight;
    }

    for (const auto& kv : features) {
        const uint64_t h = fnv1a(kv.first);
        const size_t slot = static_cast<size_t>(h % dimension_);
        const float sign = (h >> 63) ? -1.0f : 1.0f;
        v[slot] += sign * (1.0f + std::log(1.0f + kv.second));
    }

    const double n = norm(v);
    if (n > 0.0) {
        for (auto& x : v) x = static_cast<float>(x / n);
    }
    return v;
}

std::vector<Vector> HashingEmbedder::encodeBatch(const std::vector<std::string>& texts) {
    std::vector<Vector> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(encode(t));
    return out;
}

// ------------------------------------------------------------
// RemoteEmbedder
// ------------------------------------------------------------

RemoteEmbedder::RemoteEmbedder(net::HttpClient& client,
                               std::string baseUrl,
                               std::string modelName,
                               std::chrono::seconds timeout)
    : client_(client),
      endpoint_(trimSlash(std::move(baseUrl)) + "/embed"),
      modelName_(std::move(modelName)),
      timeout_(timeout) {}

Vector RemoteEmbedder::encode(const std::string& text) {
    auto rows = request({text});
    return std::move(rows.front());
}

std::vector<Vector> RemoteEmbedder::encodeBatch(const std::vector<std::string>& texts) {
    std::vector<Vector> out;
    out.reserve(texts.size());
    for (size_t start = 0; start < texts.size(); start += kMaxBatch) {
        size_t end = std::min(texts.size(), start + kMaxBatch);
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        for (auto& row : request(batch)) out.push_back(std::move(row));
    }
    return out;
}

std::vector<Vector> RemoteEmbedder::request(const std::vector<std::string>& texts) {
    nlohmann::json body = {{"inputs", texts}, {"truncate", true}};
    auto res = client_.post(endpoint_,
                            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            "application/json", {}, timeout_);
    if (!res) throw CapabilityError("embedding service unreachable: " + endpoint_);
    if (res->status < 200 || res->status >= 300) {
        throw CapabilityError("embedding service returned status " + std::to_string(res->status));
    }

    std::vector<Vector> rows;
    try {
        auto j = nlohmann::json::parse(res->body);
        rows = j.get<std::vector<Vector>>();
    } catch (const nlohmann::json::exception& e) {
        throw CapabilityError(std::string("malformed embedding response: ") + e.what());
    }
    if (rows.size() != texts.size()) {
        throw CapabilityError("embedding service returned " + std::to_string(rows.size()) +
                              " vectors for " + std::to_string(texts.size()) + " inputs");
    }
    for (const auto& row : rows) {
        if (row.empty() || (dimension_ != 0 && row.size() != dimension_)) {
            throw CapabilityError("embedding service returned inconsistent dimensions");
        }
        dimension_ = row.size();
    }
    return rows;
}

} // namespace konduit::retrieval
