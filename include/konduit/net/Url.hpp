#pragma once

#include <optional>
#include <string>

namespace konduit::net {

struct Url {
    std::string scheme;   // lowercased
    std::string host;     // lowercased, no port
    int port = 0;         // 0 when not given explicitly
    std::string path;     // "/" when the URL has none
    std::string query;    // without '?'

    // host[:port]
    std::string netloc() const;
    // scheme://host[:port]
    std::string origin() const;
    // path (or "/") plus "?query" when present
    std::string pathAndQuery() const;
    std::string toString() const;
};

// Absolute http(s)-style URL parser. Fragments are dropped.
std::optional<Url> parseUrl(const std::string& text);

// Resolve a reference against an absolute base URL. Returns an empty string
// when the base cannot be parsed. References with another scheme are returned as-is.
std::string resolveUrl(const std::string& base, const std::string& ref);

// True when host equals domain or is a subdomain of it.
bool hostMatches(const std::string& host, const std::string& domain);

bool isHttpScheme(const std::string& scheme);

} // namespace konduit::net
