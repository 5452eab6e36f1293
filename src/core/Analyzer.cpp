#include "konduit/Analyzer.hpp"

#include <algorithm>
#include <cctype>

namespace konduit {

namespace {

// Decodes the code point starting at text[i] and stores its byte length.
// Malformed sequences decode as U+FFFD with length 1.
char32_t decodeUtf8(const std::string& text, size_t i, size_t& length) {
    const auto lead = static_cast<unsigned char>(text[i]);
    length = 1;
    if (lead < 0x80) return lead;

    size_t extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return 0xFFFD;
    }
    if (i + extra >= text.size()) return 0xFFFD;
    for (size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(text[i + k]);
        if ((cont & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (cont & 0x3F);
    }
    length = extra + 1;
    return cp;
}

// Unicode White_Space outside ASCII, which str.split() style splitting honours.
bool isUnicodeSpace(char32_t cp) {
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool isSpace(char32_t cp) {
    return cp < 0x80 ? std::isspace(static_cast<unsigned char>(cp)) != 0 : isUnicodeSpace(cp);
}

// Word characters: ASCII alnum and '_', plus non-ASCII letters. Latin-1
// punctuation, General Punctuation, CJK punctuation and BOM separate words.
bool isWordChar(char32_t cp) {
    if (cp < 0x80) return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
    if (isUnicodeSpace(cp)) return false;
    if (cp >= 0xA1 && cp <= 0xBF) {
        // ª ² ³ µ ¹ º ¼ ½ ¾ are \w in Unicode regex engines.
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA ||
               (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) return false;
    if (cp >= 0x2190 && cp <= 0x2BFF) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    if (cp == 0xFEFF || cp == 0xFFFD) return false;
    return true;
}

} // namespace

std::vector<std::string> Analyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (std::isalnum(ch)) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::vector<std::string> Analyzer::wordTokens(const std::string& text, size_t minLength) {
    std::vector<std::string> tokens;
    std::string current;

    size_t chars = 0;
    auto flush = [&]() {
        if (chars >= minLength) tokens.push_back(current);
        current.clear();
        chars = 0;
    };

    size_t len = 0;
    for (size_t i = 0; i < text.size(); i += len) {
        char32_t cp = decodeUtf8(text, i, len);
        if (isWordChar(cp)) {
            if (cp < 0x80) {
                current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(cp))));
            } else {
                current.append(text, i, len);
            }
            ++chars;
        } else if (!current.empty()) {
            flush();
        }
    }
    if (!current.empty()) flush();

    return tokens;
}

std::vector<std::string> Analyzer::splitWhitespace(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    size_t len = 0;
    for (size_t i = 0; i < text.size(); i += len) {
        char32_t cp = decodeUtf8(text, i, len);
        if (isSpace(cp)) {
            if (!current.empty()) {
                out.push_back(current);
                current.clear();
            }
        } else {
            current.append(text, i, len);
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

std::string Analyzer::normalizeWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    size_t len = 0;
    for (size_t i = 0; i < text.size(); i += len) {
        char32_t cp = decodeUtf8(text, i, len);
        if (isSpace(cp)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.append(text, i, len);
    }
    return out;
}

std::vector<std::string> Analyzer::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        current.push_back(ch);
        bool terminal = ch == '.' || ch == '!' || ch == '?';
        if (terminal && i + 1 < text.size() && text[i + 1] == ' ') {
            sentences.push_back(current);
            current.clear();
            while (i + 1 < text.size() && text[i + 1] == ' ') ++i;
        }
    }
    if (!current.empty()) sentences.push_back(current);
    return sentences;
}

std::string Analyzer::toLower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string Analyzer::trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return std::string();
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

} // namespace konduit
