#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <sieve/core/concurrency.h>
#include <sieve/search/cache_stats.h>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

struct SemanticCacheConfig {
    size_t capacity = 1000;
    double similarityThreshold = 0.85;
    std::chrono::seconds ttl{3600};
};

struct SemanticHit {
    std::vector<SearchCandidate> results;
    double similarity = 0.0;
    std::string matchedQuery;
};

/**
 * @brief Cache keyed by query embedding; returns results of a semantically close query.
 *
 * Lookups are a linear scan over at most `capacity` entries. The scan runs on a snapshot of
 * entry pointers taken under the lock, so puts and gets from other threads are only blocked
 * for the copy. Entries are immutable once inserted; recency and hit counts live beside them.
 *
 * Only entries whose parameter fingerprint equals the lookup's are considered, so a hit never
 * returns results computed for a different limit, rerank depth, lambda or filter set.
 */
class SemanticCache {
public:
    using ClockFn = std::function<SteadyClock::time_point()>;

    /// @throws std::invalid_argument on capacity 0 or a threshold outside [0, 1]
    explicit SemanticCache(SemanticCacheConfig config = {}, ClockFn clock = {});

    std::optional<SemanticHit> get(const std::vector<float>& embedding,
                                   const std::string& paramFingerprint);

    void put(const std::vector<float>& embedding, const std::string& paramFingerprint,
             const std::string& queryText, std::vector<SearchCandidate> results);

    /**
     * @brief Closest entry with similarity >= @p floor, ignoring TTL and the hit threshold.
     *
     * Used for the stale fallback when every backend is down. Does not update statistics.
     */
    std::optional<SemanticHit> findClosest(const std::vector<float>& embedding,
                                           const std::string& paramFingerprint, double floor);

    /// Most frequently hit queries, highest first.
    std::vector<std::pair<std::string, uint64_t>> topQueries(size_t n) const;

    size_t removeExpired();
    void clear();

    size_t size() const;
    CacheStats stats() const;
    double similarityThreshold() const { return config_.similarityThreshold; }

    static double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    struct Entry {
        uint64_t id = 0;
        std::vector<float> embedding; // unit length
        std::string paramFingerprint;
        std::string queryText;
        std::vector<SearchCandidate> results;
        SteadyClock::time_point insertedAt;
    };
    using EntryPtr = std::shared_ptr<const Entry>;

    struct Slot {
        EntryPtr entry;
        std::list<uint64_t>::iterator lruPos;
        uint64_t hitCount = 0;
    };

    struct Match {
        EntryPtr entry;
        double similarity = -1.0;
    };

    static std::vector<float> normalize(const std::vector<float>& v);
    Match scan(const std::vector<EntryPtr>& snapshot, const std::vector<float>& unitQuery,
               const std::string& paramFingerprint, std::optional<SteadyClock::time_point> now) const;
    std::vector<EntryPtr> snapshot() const;
    bool isExpired(const Entry& e, SteadyClock::time_point now) const;
    static std::string queryIndexKey(const std::string& paramFingerprint,
                                     const std::string& queryText);
    // Requires mutex_.
    void eraseSlot(uint64_t id);

    SemanticCacheConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    uint64_t nextId_ = 1;
    std::list<uint64_t> lru_; // front = most recent
    std::unordered_map<uint64_t, Slot> slots_;
    std::unordered_map<std::string, uint64_t> byQuery_; // fingerprint + query text -> id
    CacheStats stats_;
};

} // namespace sieve::search
