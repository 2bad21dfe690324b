#include <sieve/search/cache_key.h>

#include <iomanip>
#include <sstream>

namespace sieve::search {

CacheKey CacheKey::fromQuery(const std::string& normalizedQuery, size_t limit, size_t rerankTopK,
                             std::optional<double> diversityLambda, const SearchFilters& filters) {
    Components c;
    c.queryText = normalizedQuery;
    c.limit = limit;
    c.rerankTopK = rerankTopK;
    c.diversityLambda = diversityLambda;
    c.filters = filters;

    CacheKey key;
    key.buildKey(c);
    return key;
}

CacheKey CacheKey::fromParts(std::string keyString, std::string fingerprint) {
    CacheKey key;
    key.fingerprint_ = std::move(fingerprint);
    key.keyString_ = std::move(keyString);
    key.hashValue_ = std::hash<std::string>{}(key.keyString_);
    return key;
}

std::string CacheKey::fingerprintFor(size_t limit, size_t rerankTopK,
                                     std::optional<double> diversityLambda,
                                     const SearchFilters& filters) {
    std::ostringstream ss;
    ss << "l:" << limit << ",r:" << rerankTopK << ",d:";
    if (diversityLambda) {
        ss << std::fixed << std::setprecision(4) << *diversityLambda;
    } else {
        ss << "-";
    }
    // std::map iterates in key order, so equal filter sets serialize identically
    if (!filters.empty()) {
        ss << "|f:";
        bool first = true;
        for (const auto& [k, v] : filters) {
            if (!first)
                ss << ";";
            ss << k << "=" << v;
            first = false;
        }
    }
    return ss.str();
}

void CacheKey::buildKey(const Components& c) {
    fingerprint_ = fingerprintFor(c.limit, c.rerankTopK, c.diversityLambda, c.filters);

    std::ostringstream ss;
    ss << "q:" << c.queryText << "|" << fingerprint_;
    keyString_ = ss.str();

    std::hash<std::string> hasher;
    hashValue_ = hasher(keyString_);
}

bool CacheKey::matchesPattern(const std::string& pattern) const {
    if (pattern.empty() || pattern == "*")
        return true;

    if (pattern.find('*') == std::string::npos) {
        return keyString_.find(pattern) != std::string::npos;
    }

    // Every literal segment must appear in order; leading/trailing segments are anchored
    // unless the pattern starts/ends with '*'.
    const bool anchorStart = pattern.front() != '*';
    const bool anchorEnd = pattern.back() != '*';

    size_t cursor = 0;
    size_t pos = 0;
    bool first = true;
    std::string lastToken;
    while (pos <= pattern.size()) {
        size_t next = pattern.find('*', pos);
        std::string token =
            (next == std::string::npos) ? pattern.substr(pos) : pattern.substr(pos, next - pos);
        if (!token.empty()) {
            size_t found = keyString_.find(token, cursor);
            if (found == std::string::npos)
                return false;
            if (first && anchorStart && found != 0)
                return false;
            cursor = found + token.size();
            first = false;
            lastToken = token;
        }
        if (next == std::string::npos)
            break;
        pos = next + 1;
    }

    if (anchorEnd && !lastToken.empty()) {
        return keyString_.size() >= lastToken.size() &&
               keyString_.compare(keyString_.size() - lastToken.size(), lastToken.size(),
                                  lastToken) == 0;
    }
    return true;
}

} // namespace sieve::search
