#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "konduit/AuditLog.hpp"
#include "konduit/net/HttpClient.hpp"
#include "konduit/net/Url.hpp"

namespace konduit::crawler {

// Exclusion rules that apply to the wildcard agent ("User-agent: *").
class RobotsRules {
public:
    struct Rule {
        bool allow;
        std::string pattern;
    };

    static RobotsRules parse(const std::string& text);
    static RobotsRules allowAll();
    static RobotsRules denyAll();

    // Longest matching pattern wins; Allow wins ties. Supports '*' and a trailing '$'.
    bool allows(const std::string& pathAndQuery) const;

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
    bool denyAll_ = false;
};

bool matchRobotsPattern(const std::string& pattern, const std::string& path);

enum class PolicyDecision { Allowed, Blocked, Unreadable };

const char* toString(PolicyDecision decision);

// Fail-closed robots.txt gate. Every decision is written to the audit log.
class PolicyGate {
public:
    PolicyGate(net::HttpClient& client,
               AuditLog* audit,
               std::chrono::seconds timeout = std::chrono::seconds(10),
               bool cachePerOrigin = false);

    bool allowed(const std::string& url);
    PolicyDecision decide(const std::string& url);

private:
    net::HttpClient& client_;
    AuditLog* audit_;
    std::chrono::seconds timeout_;
    bool cachePerOrigin_;

    std::mutex cacheMutex_;
    std::unordered_map<std::string, RobotsRules> cache_;

    // Empty when the policy resource could not be read.
    std::optional<RobotsRules> loadRules(const net::Url& url);
    void record(PolicyDecision decision, const std::string& url);
};

} // namespace konduit::crawler
