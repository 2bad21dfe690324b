#pragma once

#include <cstddef>
#include <cstdint>

namespace sieve::search {

/**
 * @brief Point-in-time statistics of a result cache.
 */
struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;

    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t insertions = 0;
    uint64_t expirations = 0;
    uint64_t invalidations = 0;

    double hitRate() const {
        uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    double utilization() const {
        return capacity > 0 ? static_cast<double>(size) / static_cast<double>(capacity) : 0.0;
    }
};

} // namespace sieve::search
