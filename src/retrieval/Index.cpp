#include "konduit/retrieval/Index.hpp"

#include <chrono>
#include <iostream>
#include "konduit/Analyzer.hpp"

namespace konduit::retrieval {

Index::Index(Embedder& embedder, const ArtifactStore* store, size_t maxChunkLength)
    : embedder_(embedder), store_(store), maxChunkLength_(maxChunkLength) {}

BuildReport Index::build(const std::vector<Page>& pages, std::shared_ptr<const Snapshot>* published) {
    std::lock_guard<std::mutex> buildLock(buildMutex_);
    auto start = std::chrono::steady_clock::now();

    BuildReport report;
    report.pages = pages.size();

    auto next = std::make_shared<Snapshot>();
    for (const auto& page : pages) {
        std::string content = Analyzer::trim(page.content);
        if (content.empty()) continue;
        auto chunks = Chunker::chunk(content, maxChunkLength_);
        for (auto& c : chunks) {
            next->chunks.push_back(std::move(c));
            next->urls.push_back(page.url.empty() ? "unknown" : page.url);
        }
    }

    if (next->chunks.empty()) {
        publish(nullptr);
        if (published) published->reset();
        report.message = "no valid text found, index left unbuilt";
        std::cerr << "Index: no valid text in " << pages.size() << " pages, index unbuilt\n";
        return report;
    }

    try {
        next->embeddings = embedder_.encodeBatch(next->chunks);
        if (next->embeddings.size() != next->chunks.size()) {
            throw CapabilityError("embedder returned " + std::to_string(next->embeddings.size()) +
                                  " vectors for " + std::to_string(next->chunks.size()) + " chunks");
        }
        report.semantic = true;
    } catch (const CapabilityError& e) {
        std::cerr << "Index: embedding failed, semantic scores disabled for this build: " << e.what() << "\n";
        next->embeddings.clear();
    }

    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        next->generation = ++generation_;
    }
    report.built = true;
    report.chunks = next->chunks.size();
    report.generation = next->generation;

    if (store_ && store_->enabled()) {
        report.artifactPath = store_->writeIndex(next->chunks, next->urls);
    }
    if (published) *published = next;
    publish(std::move(next));

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    report.message = "indexed " + std::to_string(report.chunks) + " chunks from " + std::to_string(report.pages) + " pages";
    std::cerr << "Index: " << report.message << " in " << ms << " ms (generation " << report.generation << ")\n";
    return report;
}

std::shared_future<BuildReport> Index::buildAsync(std::vector<Page> pages) {
    return std::async(std::launch::async, [this, pages = std::move(pages)]() {
        return build(pages);
    }).share();
}

void Index::publish(std::shared_ptr<const Snapshot> next) {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    current_ = std::move(next);
}

std::shared_ptr<const Index::Snapshot> Index::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return current_;
}

size_t Index::size() const {
    auto snap = snapshot();
    return snap ? snap->chunks.size() : 0;
}

uint64_t Index::generation() const {
    auto snap = snapshot();
    return snap ? snap->generation : 0;
}

std::optional<Vector> Index::queryVector(const std::string& query) {
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = queryCache_.find(query);
        if (it != queryCache_.end()) return it->second;
    }
    Vector v;
    try {
        v = embedder_.encode(query);
    } catch (const CapabilityError& e) {
        std::cerr << "Index: query embedding failed: " << e.what() << "\n";
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(cacheMutex_);
    queryCache_.emplace(query, v);
    return v;
}

size_t Index::queryCacheSize() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return queryCache_.size();
}

} // namespace konduit::retrieval
