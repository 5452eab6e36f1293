#include "konduit/crawler/Fetcher.hpp"

#include <algorithm>
#include <iostream>
#include "konduit/Analyzer.hpp"

namespace konduit::crawler {

ConcurrencyGate::ConcurrencyGate(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return inFlight_ < capacity_; });
    ++inFlight_;
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (inFlight_ > 0) --inFlight_;
    }
    cv_.notify_one();
}

size_t ConcurrencyGate::inFlight() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return inFlight_;
}

const std::vector<std::string>& userAgentPool() {
    static const std::vector<std::string> pool = {
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/127.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/122.0.0.0 Safari/537.36",
        "Mozilla/5.0 (X11; Linux x86_64) Gecko/20100101 Firefox/115.0",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Mobile/15E148 Safari/604.1",
    };
    return pool;
}

const std::vector<std::string>& acceptLanguagePool() {
    static const std::vector<std::string> pool = {
        "en-US,en;q=0.9",
        "en-GB,en;q=0.9",
    };
    return pool;
}

Fetcher::Fetcher(net::HttpClient& client, FetchOptions options)
    : client_(client), options_(options), gate_(options.concurrency), rng_(std::random_device{}()) {}

net::Headers Fetcher::pickHeaders() {
    std::lock_guard<std::mutex> lk(rngMutex_);
    const auto& agents = userAgentPool();
    const auto& languages = acceptLanguagePool();
    std::uniform_int_distribution<size_t> agentDist(0, agents.size() - 1);
    std::uniform_int_distribution<size_t> langDist(0, languages.size() - 1);
    return net::Headers{
        {"User-Agent", agents[agentDist(rng_)]},
        {"Accept-Language", languages[langDist(rng_)]},
    };
}

std::optional<std::string> Fetcher::fetch(const std::string& url) {
    auto headers = pickHeaders();
    ConcurrencyGate::Permit permit(gate_);

    auto res = client_.get(url, headers, options_.timeout);
    if (!res) {
        std::cerr << "Fetcher: failed to fetch " << url << "\n";
        return std::nullopt;
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "Fetcher: " << url << " returned status " << res->status << "\n";
        return std::nullopt;
    }
    if (Analyzer::toLower(res->contentType).find("text/html") == std::string::npos) {
        std::cerr << "Fetcher: skipping non-HTML " << url << " (" << res->contentType << ")\n";
        return std::nullopt;
    }
    return std::move(res->body);
}

} // namespace konduit::crawler
