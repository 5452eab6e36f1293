#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "konduit/net/HttpClient.hpp"

namespace konduit::crawler {

// Counting limiter bounding simultaneous in-flight fetches.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(size_t capacity);

    class Permit {
    public:
        explicit Permit(ConcurrencyGate& gate) : gate_(&gate) { gate_->acquire(); }
        ~Permit() { if (gate_) gate_->release(); }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        ConcurrencyGate* gate_;
    };

    void acquire();
    void release();

    size_t capacity() const { return capacity_; }
    size_t inFlight() const;

private:
    const size_t capacity_;
    size_t inFlight_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

struct FetchOptions {
    std::chrono::seconds timeout{10};
    size_t concurrency = 5;
};

// Identity strings rotated per request.
const std::vector<std::string>& userAgentPool();
const std::vector<std::string>& acceptLanguagePool();

// Single-page fetcher. Only 2xx responses with an HTML content type yield a body.
class Fetcher {
public:
    Fetcher(net::HttpClient& client, FetchOptions options = {});

    std::optional<std::string> fetch(const std::string& url);

    const ConcurrencyGate& gate() const { return gate_; }

private:
    net::HttpClient& client_;
    FetchOptions options_;
    ConcurrencyGate gate_;
    std::mutex rngMutex_;
    std::mt19937 rng_;

    net::Headers pickHeaders();
};

} // namespace konduit::crawler
