#pragma once

#include <cstddef>
#include <set>
#include <string>

namespace konduit::crawler {

// HTML to readable text and in-domain links, backed by lexbor.
class ContentExtractor {
public:
    // Elements shorter than this many words are dropped.
    static constexpr size_t kMinWords = 6;

    // Strips scripts, navigation, footers and similar chrome, prefers <main> or
    // <article>, and joins headings, paragraphs, list items and text containers.
    static std::string extract(const std::string& html);

    // Absolute http(s) links whose host is domain or a subdomain of it.
    static std::set<std::string> links(const std::string& html,
                                       const std::string& baseUrl,
                                       const std::string& domain);
};

} // namespace konduit::crawler
