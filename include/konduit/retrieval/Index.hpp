#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "konduit/ArtifactStore.hpp"
#include "konduit/Types.hpp"
#include "konduit/retrieval/Chunker.hpp"
#include "konduit/retrieval/Embedder.hpp"

namespace konduit::retrieval {

struct BuildReport {
    bool built = false;
    size_t pages = 0;
    size_t chunks = 0;
    uint64_t generation = 0;
    // False when the embedder failed and only keyword scores are available.
    bool semantic = false;
    std::string artifactPath;
    std::string message;
};

// Chunk store with one embedding per chunk. A build prepares a new snapshot
// off to the side and publishes it in one step, so readers never observe a
// partially built index.
class Index {
public:
    struct Snapshot {
        std::vector<std::string> chunks;
        std::vector<std::string> urls;
        // Empty when the embedder failed during the build.
        std::vector<Vector> embeddings;
        uint64_t generation = 0;
    };

    Index(Embedder& embedder, const ArtifactStore* store, size_t maxChunkLength = Chunker::kDefaultMaxLength);

    // Zero derivable chunks leaves the index unbuilt. When published is set it
    // receives the snapshot this build produced (null if unbuilt), even if a
    // later build has already replaced it.
    BuildReport build(const std::vector<Page>& pages, std::shared_ptr<const Snapshot>* published = nullptr);
    std::shared_future<BuildReport> buildAsync(std::vector<Page> pages);

    // Null while unbuilt.
    std::shared_ptr<const Snapshot> snapshot() const;
    bool built() const { return snapshot() != nullptr; }
    size_t size() const;
    uint64_t generation() const;

    // Memoized by exact query string. Empty when the embedder failed.
    std::optional<Vector> queryVector(const std::string& query);
    size_t queryCacheSize() const;

    Embedder& embedder() { return embedder_; }

private:
    Embedder& embedder_;
    const ArtifactStore* store_;
    size_t maxChunkLength_;

    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const Snapshot> current_;
    uint64_t generation_ = 0;

    std::mutex buildMutex_;

    mutable std::mutex cacheMutex_;
    std::unordered_map<std::string, Vector> queryCache_;

    void publish(std::shared_ptr<const Snapshot> next);
};

} // namespace konduit::retrieval
