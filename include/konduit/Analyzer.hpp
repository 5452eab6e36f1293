#pragma once

#include <string>
#include <vector>

namespace konduit {

// Text helpers shared by the extractor, chunker and scorers.
class Analyzer {
public:
    // Split on non-alnum and lowercase.
    static std::vector<std::string> tokenize(const std::string& text);

    // Lowercased word tokens of at least minLength code points. UTF-8 aware:
    // NBSP, curly quotes and dashes separate words like ASCII punctuation.
    static std::vector<std::string> wordTokens(const std::string& text, size_t minLength);

    // Whitespace-delimited tokens, case preserved. Unicode spaces such as NBSP count.
    static std::vector<std::string> splitWhitespace(const std::string& text);

    // Collapse runs of whitespace to one space and trim both ends.
    static std::string normalizeWhitespace(const std::string& text);

    // Split after '.', '!' or '?' when followed by a space. Expects normalized text.
    static std::vector<std::string> splitSentences(const std::string& text);

    static std::string toLower(const std::string& text);
    static std::string trim(const std::string& text);
};

} // namespace konduit
