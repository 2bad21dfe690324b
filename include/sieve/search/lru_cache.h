#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <sieve/core/concurrency.h>
#include <sieve/core/types.h>
#include <sieve/search/cache_key.h>
#include <sieve/search/cache_stats.h>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

struct LruCacheConfig {
    size_t capacity = 100;
    /// Entries older than this miss on get() but stay available to getStale(). 0 disables.
    std::chrono::seconds ttl{0};
};

/**
 * @brief Thread-safe exact-match LRU cache of ranked results.
 *
 * One mutex guards the recency list and the index; every critical section is O(1) list/map
 * work. Values are copied in and out.
 */
class LruCache {
public:
    using Value = std::vector<SearchCandidate>;
    using ClockFn = std::function<SteadyClock::time_point()>;

    /// @throws std::invalid_argument if capacity is 0
    explicit LruCache(LruCacheConfig config = {}, ClockFn clock = {});

    std::optional<Value> get(const CacheKey& key);

    /// Returns the entry even if its TTL elapsed. Does not touch hit/miss counters.
    std::optional<Value> getStale(const CacheKey& key);

    void put(const CacheKey& key, Value value);

    bool contains(const CacheKey& key) const;
    void invalidate(const CacheKey& key);
    size_t invalidatePattern(const std::string& pattern);
    size_t removeExpired();
    void clear();

    size_t size() const;
    size_t capacity() const { return config_.capacity; }
    CacheStats stats() const;

    /// Keys from most to least recently used.
    std::vector<CacheKey> keys() const;

    /// Write all live entries as JSON, most recent first.
    Result<void> saveToFile(const std::filesystem::path& path) const;

    /// Replace the contents with a file written by saveToFile. On error the cache is left empty.
    Result<void> loadFromFile(const std::filesystem::path& path);

private:
    struct Entry {
        CacheKey key;
        Value value;
        SteadyClock::time_point insertedAt;
        SteadyClock::time_point lastAccessedAt;
    };
    using List = std::list<Entry>;

    bool isExpired(const Entry& entry, SteadyClock::time_point now) const;
    // Requires mutex_.
    void evictOverflow();

    LruCacheConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    List lru_;
    std::unordered_map<CacheKey, List::iterator, CacheKeyHash> index_;
    CacheStats stats_;
};

} // namespace sieve::search
