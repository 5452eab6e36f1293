#pragma once

#include <cstddef>
#include <string>

namespace konduit::retrieval {

// Extractive, query-focused summary built from retrieved chunk text.
class Summarizer {
public:
    static constexpr const char* kNoContent = "No relevant content found.";
    static constexpr const char* kNoAnswer = "No clear answer could be derived.";

    explicit Summarizer(size_t maxSentences = 5, size_t maxChars = 1200)
        : maxSentences_(maxSentences), maxChars_(maxChars) {}

    std::string summarize(const std::string& text, const std::string& query = "") const;

    // Collapses whitespace and removes numeric citation markers such as "[12]".
    static std::string clean(const std::string& text);

private:
    size_t maxSentences_;
    size_t maxChars_;
};

} // namespace konduit::retrieval
