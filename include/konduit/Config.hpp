#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace konduit {

struct Config {
    std::string dataDir = "data";
    std::string logDir = "logs";
    std::string host = "0.0.0.0";
    int port = 8000;

    // Crawl
    size_t maxPages = 50;
    int maxDepth = 2;
    int crawlDelayMs = 200;
    int fetchTimeoutSec = 10;
    size_t fetchConcurrency = 5;
    size_t maxDownloadBytes = 8 * 1024 * 1024;
    bool cacheRobots = false;
    std::string fallbackBase = "https://en.wikipedia.org/wiki/";
    std::string fallbackSeed = "https://en.wikipedia.org/wiki/Main_Page";

    // Retrieval
    std::string embedUrl;
    size_t embedDim = 384;
    std::string rerankUrl;
    std::string modelName = "sentence-transformers/all-MiniLM-L6-v2";
    size_t topK = 7;
    double hybridWeight = 0.7;
    double minScore = 0.15;

    bool compressArtifacts = false;

    // Defaults overridden by KONDUIT_* environment variables.
    static Config fromEnvironment();

    nlohmann::json toJson() const;
};

} // namespace konduit
