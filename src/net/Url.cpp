#include "konduit/net/Url.hpp"

#include <cctype>
#include <stdexcept>
#include <vector>
#include "konduit/Analyzer.hpp"

namespace konduit::net {

namespace {

std::string stripFragment(const std::string& s) {
    auto pos = s.find('#');
    return pos == std::string::npos ? s : s.substr(0, pos);
}

// Length of a leading "scheme:" or 0 when the reference has none.
size_t schemeLength(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
    for (size_t i = 1; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == ':') return i;
        if (!(std::isalnum(c) || c == '+' || c == '-' || c == '.')) return 0;
    }
    return 0;
}

std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> out;
    size_t i = 0;
    bool trailingSlash = false;
    while (i <= path.size()) {
        size_t next = path.find('/', i);
        if (next == std::string::npos) next = path.size();
        std::string seg = path.substr(i, next - i);
        trailingSlash = false;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailingSlash = true;
        } else if (seg == ".") {
            trailingSlash = true;
        } else if (!seg.empty()) {
            out.push_back(seg);
        }
        i = next + 1;
    }
    std::string result;
    for (const auto& seg : out) {
        result.push_back('/');
        result.append(seg);
    }
    if (result.empty() || trailingSlash || (!path.empty() && path.back() == '/')) {
        result.push_back('/');
    }
    return result;
}

std::string mergePaths(const Url& base, const std::string& refPath) {
    if (base.path.empty()) return "/" + refPath;
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) return "/" + refPath;
    return base.path.substr(0, slash + 1) + refPath;
}

} // namespace

std::string Url::netloc() const {
    if (port == 0) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::origin() const {
    return scheme + "://" + netloc();
}

std::string Url::pathAndQuery() const {
    std::string out = path.empty() ? "/" : path;
    if (!query.empty()) out += "?" + query;
    return out;
}

std::string Url::toString() const {
    std::string out = origin() + path;
    if (!query.empty()) out += "?" + query;
    return out;
}

std::optional<Url> parseUrl(const std::string& text) {
    std::string s = stripFragment(Analyzer::trim(text));
    size_t schemeLen = schemeLength(s);
    if (schemeLen == 0 || s.compare(schemeLen, 3, "://") != 0) return std::nullopt;

    Url url;
    url.scheme = Analyzer::toLower(s.substr(0, schemeLen));
    size_t authStart = schemeLen + 3;
    size_t authEnd = s.find_first_of("/?", authStart);
    if (authEnd == std::string::npos) authEnd = s.size();
    std::string authority = s.substr(authStart, authEnd - authStart);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string hostPart = authority;
    std::string portPart;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        hostPart = authority.substr(0, close + 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') portPart = authority.substr(close + 2);
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            hostPart = authority.substr(0, colon);
            portPart = authority.substr(colon + 1);
        }
    }
    if (hostPart.empty()) return std::nullopt;
    url.host = Analyzer::toLower(hostPart);
    if (!portPart.empty()) {
        for (unsigned char c : portPart) {
            if (!std::isdigit(c)) return std::nullopt;
        }
        try { url.port = std::stoi(portPart); } catch (const std::out_of_range&) { return std::nullopt; }
        if (url.port <= 0 || url.port > 65535) return std::nullopt;
    }

    std::string rest = s.substr(authEnd);
    auto q = rest.find('?');
    if (q != std::string::npos) {
        url.path = rest.substr(0, q);
        url.query = rest.substr(q + 1);
    } else {
        url.path = rest;
    }
    if (url.path.empty()) url.path = "/";
    return url;
}

std::string resolveUrl(const std::string& base, const std::string& ref) {
    auto b = parseUrl(base);
    if (!b) return std::string();

    std::string r = stripFragment(Analyzer::trim(ref));
    if (r.empty()) return b->toString();

    if (schemeLength(r) > 0) {
        auto abs = parseUrl(r);
        return abs ? abs->toString() : r;
    }
    if (r.rfind("//", 0) == 0) {
        auto abs = parseUrl(b->scheme + ":" + r);
        return abs ? abs->toString() : std::string();
    }

    Url out = *b;
    std::string refPath = r;
    std::string refQuery;
    auto q = r.find('?');
    if (q != std::string::npos) {
        refPath = r.substr(0, q);
        refQuery = r.substr(q + 1);
    }

    if (refPath.empty()) {
        out.query = q != std::string::npos ? refQuery : b->query;
    } else if (refPath[0] == '/') {
        out.path = removeDotSegments(refPath);
        out.query = refQuery;
    } else {
        out.path = removeDotSegments(mergePaths(*b, refPath));
        out.query = refQuery;
    }
    return out.toString();
}

bool hostMatches(const std::string& host, const std::string& domain) {
    if (host.empty() || domain.empty()) return false;
    if (host == domain) return true;
    if (host.size() <= domain.size()) return false;
    return host.compare(host.size() - domain.size(), domain.size(), domain) == 0
        && host[host.size() - domain.size() - 1] == '.';
}

bool isHttpScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

} // namespace konduit::net
