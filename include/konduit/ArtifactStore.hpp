#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "konduit/Types.hpp"

namespace konduit {

// Write-once JSON artifacts under dataDir. An empty dataDir disables writing.
class ArtifactStore {
public:
    explicit ArtifactStore(std::string dataDir, bool compress = false);

    // crawled_<domain>_<epoch>.json, with a _<n> suffix when that name is
    // already taken. Returns the written path or "" on failure.
    std::string writeCrawl(const std::string& domain, const std::vector<Page>& pages) const;

    // embeddings.json holding {chunks, urls}; returns the written path or "" on failure.
    std::string writeIndex(const std::vector<std::string>& chunks, const std::vector<std::string>& urls) const;

    // Reads an index artifact written by writeIndex (compressed or not).
    static bool loadIndex(const std::string& path, std::vector<std::string>& chunks, std::vector<std::string>& urls);

    bool enabled() const { return !dataDir_.empty(); }
    const std::string& dataDir() const { return dataDir_; }

private:
    std::string dataDir_;
    bool compress_;
    // Serializes crawl writes so concurrent crawls of one domain get distinct files.
    mutable std::mutex crawlMutex_;

    bool exists(const std::string& fileName) const;

    std::string writeDocument(const std::string& fileName, const nlohmann::json& doc) const;
};

} // namespace konduit
