#include "konduit/ArtifactStore.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string_view>

#ifdef KONDUIT_USE_ZSTD
#include <zstd.h>
#endif

using json = nlohmann::json;

namespace konduit {

namespace {

constexpr const char* kZstdSuffix = ".zst";

#ifdef KONDUIT_USE_ZSTD
bool compressZstd(const std::string& in, std::string& out, int level = 3) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) return false;
    out.resize(written);
    return true;
}

bool decompressZstd(std::string_view in, std::string& out) {
    unsigned long long rawSize = ZSTD_getFrameContentSize(in.data(), in.size());
    if (rawSize == ZSTD_CONTENTSIZE_ERROR || rawSize == ZSTD_CONTENTSIZE_UNKNOWN) return false;
    out.resize(static_cast<size_t>(rawSize));
    size_t res = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(res)) return false;
    out.resize(res);
    return true;
}
#endif

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Keep the domain usable as a file name component.
std::string sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
        out.push_back(safe ? c : '_');
    }
    return out.empty() ? std::string("unknown") : out;
}

} // namespace

ArtifactStore::ArtifactStore(std::string dataDir, bool compress)
    : dataDir_(std::move(dataDir)), compress_(compress) {
#ifndef KONDUIT_USE_ZSTD
    if (compress_) {
        std::cerr << "ArtifactStore: built without zstd; writing uncompressed artifacts\n";
        compress_ = false;
    }
#endif
}

std::string ArtifactStore::writeDocument(const std::string& fileName, const json& doc) const {
    if (dataDir_.empty()) return std::string();
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dataDir_, ec);
    if (ec) {
        std::cerr << "ArtifactStore: failed to create " << dataDir_ << ": " << ec.message() << "\n";
        return std::string();
    }

    std::string payload = doc.dump(2, ' ', false, json::error_handler_t::replace);
    fs::path path = fs::path(dataDir_) / fileName;
#ifdef KONDUIT_USE_ZSTD
    if (compress_) {
        std::string compressed;
        if (compressZstd(payload, compressed)) {
            payload.swap(compressed);
            path += kZstdSuffix;
        } else {
            std::cerr << "ArtifactStore: zstd compression failed for " << fileName << "; writing raw\n";
        }
    }
#endif

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out) {
        std::cerr << "ArtifactStore: failed to write " << path << "\n";
        return std::string();
    }
    return path.string();
}

bool ArtifactStore::exists(const std::string& fileName) const {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path path = fs::path(dataDir_) / fileName;
    if (fs::exists(path, ec)) return true;
    path += kZstdSuffix;
    return fs::exists(path, ec);
}

std::string ArtifactStore::writeCrawl(const std::string& domain, const std::vector<Page>& pages) const {
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string base = "crawled_" + sanitize(domain) + "_" + std::to_string(epoch);

    std::lock_guard<std::mutex> lock(crawlMutex_);
    std::string name = base + ".json";
    for (int n = 1; exists(name); ++n) {
        name = base + "_" + std::to_string(n) + ".json";
    }
    return writeDocument(name, json(pages));
}

std::string ArtifactStore::writeIndex(const std::vector<std::string>& chunks, const std::vector<std::string>& urls) const {
    json doc = {
        {"chunks", chunks},
        {"urls", urls}
    };
    return writeDocument("embeddings.json", doc);
}

bool ArtifactStore::loadIndex(const std::string& path, std::vector<std::string>& chunks, std::vector<std::string>& urls) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "ArtifactStore: cannot open " << path << "\n";
        return false;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (endsWith(path, kZstdSuffix)) {
#ifdef KONDUIT_USE_ZSTD
        std::string raw;
        if (!decompressZstd(data, raw)) {
            std::cerr << "ArtifactStore: zstd decode failed for " << path << "\n";
            return false;
        }
        data.swap(raw);
#else
        std::cerr << "ArtifactStore: " << path << " is compressed but zstd support is not built in\n";
        return false;
#endif
    }

    auto doc = json::parse(data, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "ArtifactStore: invalid index artifact " << path << "\n";
        return false;
    }
    auto c = doc.value("chunks", json::array());
    auto u = doc.value("urls", json::array());
    if (!c.is_array() || !u.is_array() || c.size() != u.size()) {
        std::cerr << "ArtifactStore: misaligned index artifact " << path << "\n";
        return false;
    }
    chunks = c.get<std::vector<std::string>>();
    urls = u.get<std::vector<std::string>>();
    return true;
}

} // namespace konduit
