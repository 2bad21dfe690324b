#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sieve/resilience/circuit_breaker.h>
#include <sieve/search/cache_stats.h>

namespace sieve::search {

/**
 * @brief Snapshot of engine state for health endpoints.
 *
 * Healthy when every breaker is closed, Degraded while any breaker is open or half-open.
 * Built from per-component snapshots, so holding one never blocks the engine.
 */
struct EngineHealth {
    enum class Status { Healthy, Degraded };

    Status status = Status::Healthy;
    std::vector<resilience::CircuitBreaker::Stats> breakers;
    CacheStats exactCache;
    std::optional<CacheStats> semanticCache;
    std::optional<std::chrono::system_clock::time_point> lastDegradedAt;

    uint64_t totalQueries = 0;
    uint64_t degradedQueries = 0;
    uint64_t failedQueries = 0;

    nlohmann::json toJson() const;
};

const char* statusToString(EngineHealth::Status status);

} // namespace sieve::search
