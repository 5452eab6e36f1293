#include "konduit/retrieval/Chunker.hpp"

#include "konduit/Analyzer.hpp"

namespace konduit::retrieval {

namespace {

// Pieces of at most maxLength chars; a single word over the limit is kept whole.
std::vector<std::string> splitLongSentence(const std::string& sentence, size_t maxLength) {
    std::vector<std::string> out;
    std::string current;
    for (const auto& word : Analyzer::splitWhitespace(sentence)) {
        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= maxLength) {
            current += ' ';
            current += word;
        } else {
            out.push_back(std::move(current));
            current = word;
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

} // namespace

std::vector<std::string> Chunker::chunk(const std::string& text, size_t maxLength) {
    const std::string normalized = Analyzer::normalizeWhitespace(text);
    if (normalized.size() < kMinTextLength) return {};
    if (maxLength == 0) maxLength = kDefaultMaxLength;

    std::vector<std::string> pieces;
    for (const auto& sentence : Analyzer::splitSentences(normalized)) {
        if (sentence.size() <= maxLength) {
            pieces.push_back(sentence);
        } else {
            for (auto& part : splitLongSentence(sentence, maxLength)) pieces.push_back(std::move(part));
        }
    }

    std::vector<std::string> chunks;
    std::string current;
    for (const auto& piece : pieces) {
        if (piece.empty()) continue;
        if (current.empty()) {
            current = piece;
        } else if (current.size() + 1 + piece.size() <= maxLength) {
            current += ' ';
            current += piece;
        } else {
            chunks.push_back(std::move(current));
            current = piece;
        }
    }
    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

} // namespace konduit::retrieval
