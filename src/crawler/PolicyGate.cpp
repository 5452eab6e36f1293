#include "konduit/crawler/PolicyGate.hpp"

#include <iostream>
#include "konduit/Analyzer.hpp"

namespace konduit::crawler {

namespace {

const char* kPolicyAgent = "konduit-crawler/1.0";

} // namespace

RobotsRules RobotsRules::parse(const std::string& text) {
    RobotsRules out;
    bool inGroupHeader = false;   // still reading consecutive User-agent lines
    bool groupMatches = false;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        start = end + 1;

        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = Analyzer::trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = Analyzer::toLower(Analyzer::trim(line.substr(0, colon)));
        std::string value = Analyzer::trim(line.substr(colon + 1));

        if (key == "user-agent") {
            if (!inGroupHeader) {
                groupMatches = false;
                inGroupHeader = true;
            }
            if (value == "*") groupMatches = true;
            continue;
        }

        inGroupHeader = false;
        if (!groupMatches) continue;
        if (key == "allow") {
            if (!value.empty()) out.rules_.push_back({true, value});
        } else if (key == "disallow") {
            // An empty Disallow places no restriction.
            if (!value.empty()) out.rules_.push_back({false, value});
        }
    }
    return out;
}

RobotsRules RobotsRules::allowAll() {
    return RobotsRules{};
}

RobotsRules RobotsRules::denyAll() {
    RobotsRules r;
    r.denyAll_ = true;
    return r;
}

bool RobotsRules::allows(const std::string& pathAndQuery) const {
    if (denyAll_) return false;
    const std::string path = pathAndQuery.empty() ? std::string("/") : pathAndQuery;

    long bestLen = -1;
    bool verdict = true;
    for (const auto& rule : rules_) {
        if (!matchRobotsPattern(rule.pattern, path)) continue;
        long len = static_cast<long>(rule.pattern.size());
        if (len > bestLen || (len == bestLen && rule.allow)) {
            bestLen = len;
            verdict = rule.allow;
        }
    }
    return verdict;
}

bool matchRobotsPattern(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    const std::string pat = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;

    size_t p = 0, s = 0;
    size_t starP = std::string::npos, starS = 0;
    while (s < path.size()) {
        if (p < pat.size() && pat[p] == '*') {
            starP = p++;
            starS = s;
        } else if (p < pat.size() && pat[p] == path[s]) {
            ++p;
            ++s;
        } else if (p == pat.size() && !anchored) {
            return true;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            s = ++starS;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

const char* toString(PolicyDecision decision) {
    switch (decision) {
        case PolicyDecision::Allowed: return "ALLOWED";
        case PolicyDecision::Blocked: return "BLOCKED";
        case PolicyDecision::Unreadable: return "FAILED TO READ robots.txt";
    }
    return "UNKNOWN";
}

PolicyGate::PolicyGate(net::HttpClient& client,
                       AuditLog* audit,
                       std::chrono::seconds timeout,
                       bool cachePerOrigin)
    : client_(client), audit_(audit), timeout_(timeout), cachePerOrigin_(cachePerOrigin) {}

bool PolicyGate::allowed(const std::string& url) {
    return decide(url) == PolicyDecision::Allowed;
}

PolicyDecision PolicyGate::decide(const std::string& url) {
    auto parsed = net::parseUrl(url);
    if (!parsed || !net::isHttpScheme(parsed->scheme)) {
        std::cerr << "PolicyGate: cannot evaluate " << url << "; defaulting to disallow\n";
        record(PolicyDecision::Unreadable, url);
        return PolicyDecision::Unreadable;
    }

    auto rules = loadRules(*parsed);
    if (!rules) {
        std::cerr << "PolicyGate: could not read robots.txt for " << parsed->origin()
                  << "; defaulting to disallow " << url << "\n";
        record(PolicyDecision::Unreadable, url);
        return PolicyDecision::Unreadable;
    }

    PolicyDecision decision = rules->allows(parsed->pathAndQuery()) ? PolicyDecision::Allowed : PolicyDecision::Blocked;
    if (decision == PolicyDecision::Blocked) {
        std::cerr << "PolicyGate: disallowed by robots.txt: " << url << "\n";
    }
    record(decision, url);
    return decision;
}

std::optional<RobotsRules> PolicyGate::loadRules(const net::Url& url) {
    const std::string origin = url.origin();
    if (cachePerOrigin_) {
        std::lock_guard<std::mutex> lk(cacheMutex_);
        auto it = cache_.find(origin);
        if (it != cache_.end()) return it->second;
    }

    auto res = client_.get(origin + "/robots.txt", {{"User-Agent", kPolicyAgent}}, timeout_);
    if (!res) return std::nullopt;

    std::optional<RobotsRules> rules;
    if (res->status >= 200 && res->status < 300) {
        rules = RobotsRules::parse(res->body);
    } else if (res->status == 401 || res->status == 403) {
        rules = RobotsRules::denyAll();
    } else if (res->status >= 400 && res->status < 500) {
        rules = RobotsRules::allowAll();
    } else {
        return std::nullopt;
    }

    if (cachePerOrigin_) {
        std::lock_guard<std::mutex> lk(cacheMutex_);
        cache_[origin] = *rules;
    }
    return rules;
}

void PolicyGate::record(PolicyDecision decision, const std::string& url) {
    if (audit_) audit_->append(toString(decision), url);
}

} // namespace konduit::crawler
