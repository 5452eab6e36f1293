#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace konduit::retrieval {

class Chunker {
public:
    static constexpr size_t kDefaultMaxLength = 300;
    static constexpr size_t kMinTextLength = 50;

    // Greedily packs whole sentences into chunks of at most maxLength chars.
    // A sentence longer than maxLength is split at word boundaries.
    static std::vector<std::string> chunk(const std::string& text, size_t maxLength = kDefaultMaxLength);
};

} // namespace konduit::retrieval
