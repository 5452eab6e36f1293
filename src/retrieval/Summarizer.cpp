#include "konduit/retrieval/Summarizer.hpp"

#include <cctype>
#include <unordered_set>
#include <vector>
#include "konduit/Analyzer.hpp"

namespace konduit::retrieval {

namespace {
constexpr size_t kMinSentenceChars = 26;
}

std::string Summarizer::clean(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '[') {
            size_t j = i + 1;
            while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) ++j;
            if (j > i + 1 && j < text.size() && text[j] == ']') {
                i = j;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return Analyzer::normalizeWhitespace(out);
}

std::string Summarizer::summarize(const std::string& text, const std::string& query) const {
    if (Analyzer::trim(text).empty()) return kNoContent;

    std::vector<std::string> sentences;
    std::unordered_set<std::string> seen;
    for (const auto& s : Analyzer::splitSentences(clean(text))) {
        std::string key = Analyzer::toLower(Analyzer::trim(s));
        if (key.size() < kMinSentenceChars || !seen.insert(key).second) continue;
        sentences.push_back(Analyzer::trim(s));
    }

    auto terms = Analyzer::splitWhitespace(Analyzer::toLower(query));
    if (!terms.empty()) {
        std::vector<std::string> relevant;
        for (const auto& s : sentences) {
            std::string lower = Analyzer::toLower(s);
            for (const auto& t : terms) {
                if (lower.find(t) != std::string::npos) {
                    relevant.push_back(s);
                    break;
                }
            }
        }
        if (!relevant.empty()) sentences.swap(relevant);
    }

    std::string summary;
    size_t used = 0;
    for (const auto& s : sentences) {
        if (used == maxSentences_) break;
        if (!summary.empty() && summary.size() + 1 + s.size() > maxChars_) break;
        if (!summary.empty()) summary += ' ';
        summary += s;
        ++used;
    }
    return summary.empty() ? kNoAnswer : summary;
}

} // namespace konduit::retrieval
