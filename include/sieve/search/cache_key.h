#pragma once

#include <functional>
#include <optional>
#include <string>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

/**
 * @brief Fingerprint of every request parameter that affects the ranked result.
 */
class CacheKey {
public:
    struct Components {
        std::string queryText;
        size_t limit = 0;
        size_t rerankTopK = 0;
        std::optional<double> diversityLambda;
        SearchFilters filters;
    };

    static CacheKey fromQuery(const std::string& normalizedQuery, size_t limit, size_t rerankTopK,
                              std::optional<double> diversityLambda,
                              const SearchFilters& filters = {});

    /// Rebuild a key from its persisted form.
    static CacheKey fromParts(std::string keyString, std::string fingerprint);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }

    const std::string& toString() const { return keyString_; }

    /// Everything except the query text; two queries with equal fingerprints are comparable.
    const std::string& paramFingerprint() const { return fingerprint_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }

    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    /// Glob match with '*' against the key string.
    bool matchesPattern(const std::string& pattern) const;

    static std::string fingerprintFor(size_t limit, size_t rerankTopK,
                                      std::optional<double> diversityLambda,
                                      const SearchFilters& filters);

private:
    void buildKey(const Components& components);

    std::string keyString_;
    std::string fingerprint_;
    size_t hashValue_ = 0;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace sieve::search
