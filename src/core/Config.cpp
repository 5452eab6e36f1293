#include "konduit/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace konduit {

namespace {

void readString(const char* name, std::string& out) {
    if (const char* v = std::getenv(name)) out = v;
}

// stoull accepts "-5" and wraps it, so negatives are clamped up front like readInt does.
void readSize(const char* name, size_t& out, size_t minValue) {
    if (const char* v = std::getenv(name)) {
        std::string s(v);
        auto first = s.find_first_not_of(" \t");
        if (first != std::string::npos && s[first] == '-' && s.find_first_of("0123456789", first) != std::string::npos) {
            out = minValue;
            return;
        }
        try { out = std::max<size_t>(minValue, static_cast<size_t>(std::stoull(s))); }
        catch (const std::exception&) { std::cerr << "Config: ignoring invalid " << name << "=" << v << "\n"; }
    }
}

void readInt(const char* name, int& out, int minValue) {
    if (const char* v = std::getenv(name)) {
        try { out = std::max(minValue, std::stoi(v)); }
        catch (const std::exception&) { std::cerr << "Config: ignoring invalid " << name << "=" << v << "\n"; }
    }
}

void readDouble(const char* name, double& out) {
    if (const char* v = std::getenv(name)) {
        try { out = std::stod(v); }
        catch (const std::exception&) { std::cerr << "Config: ignoring invalid " << name << "=" << v << "\n"; }
    }
}

void readFlag(const char* name, bool& out) {
    if (const char* v = std::getenv(name)) {
        std::string s(v);
        out = !(s.empty() || s == "0" || s == "false" || s == "off");
    }
}

} // namespace

Config Config::fromEnvironment() {
    Config c;
    readString("KONDUIT_DATA_DIR", c.dataDir);
    readString("KONDUIT_LOG_DIR", c.logDir);
    readString("KONDUIT_HOST", c.host);
    readInt("KONDUIT_PORT", c.port, 1);

    readSize("KONDUIT_MAX_PAGES", c.maxPages, 1);
    readInt("KONDUIT_MAX_DEPTH", c.maxDepth, 0);
    readInt("KONDUIT_CRAWL_DELAY_MS", c.crawlDelayMs, 0);
    readInt("KONDUIT_FETCH_TIMEOUT", c.fetchTimeoutSec, 1);
    readSize("KONDUIT_FETCH_CONCURRENCY", c.fetchConcurrency, 1);
    readSize("KONDUIT_MAX_DOWNLOAD_BYTES", c.maxDownloadBytes, 1024);
    readFlag("KONDUIT_ROBOTS_CACHE", c.cacheRobots);
    readString("KONDUIT_FALLBACK_BASE", c.fallbackBase);
    readString("KONDUIT_FALLBACK_SEED", c.fallbackSeed);

    readString("KONDUIT_EMBED_URL", c.embedUrl);
    readSize("KONDUIT_EMBED_DIM", c.embedDim, 8);
    readString("KONDUIT_RERANK_URL", c.rerankUrl);
    readString("KONDUIT_MODEL_NAME", c.modelName);
    readSize("KONDUIT_TOP_K", c.topK, 1);
    readDouble("KONDUIT_HYBRID_WEIGHT", c.hybridWeight);
    c.hybridWeight = std::min(1.0, std::max(0.0, c.hybridWeight));
    readDouble("KONDUIT_MIN_SCORE", c.minScore);

    readFlag("KONDUIT_COMPRESS", c.compressArtifacts);
    return c;
}

nlohmann::json Config::toJson() const {
    return nlohmann::json{
        {"data_dir", dataDir},
        {"log_dir", logDir},
        {"host", host},
        {"port", port},
        {"max_pages", maxPages},
        {"max_depth", maxDepth},
        {"crawl_delay_ms", crawlDelayMs},
        {"fetch_timeout_sec", fetchTimeoutSec},
        {"fetch_concurrency", fetchConcurrency},
        {"max_download_bytes", maxDownloadBytes},
        {"robots_cache", cacheRobots},
        {"fallback_base", fallbackBase},
        {"fallback_seed", fallbackSeed},
        {"embed_url", embedUrl},
        {"embed_dim", embedDim},
        {"rerank_url", rerankUrl},
        {"model_name", modelName},
        {"top_k", topK},
        {"hybrid_weight", hybridWeight},
        {"min_score", minScore},
        {"compress_artifacts", compressArtifacts}
    };
}

} // namespace konduit
