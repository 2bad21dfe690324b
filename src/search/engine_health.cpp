#include <sieve/search/engine_health.h>

namespace sieve::search {

namespace {

nlohmann::json cacheToJson(const CacheStats& s) {
    return {{"size", s.size},
            {"capacity", s.capacity},
            {"hits", s.hits},
            {"misses", s.misses},
            {"evictions", s.evictions},
            {"insertions", s.insertions},
            {"expirations", s.expirations},
            {"hit_rate", s.hitRate()},
            {"utilization", s.utilization()}};
}

int64_t epochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* statusToString(EngineHealth::Status status) {
    switch (status) {
        case EngineHealth::Status::Healthy: return "healthy";
        case EngineHealth::Status::Degraded: return "degraded";
    }
    return "unknown";
}

nlohmann::json EngineHealth::toJson() const {
    nlohmann::json j;
    j["status"] = statusToString(status);

    nlohmann::json breakersJson = nlohmann::json::object();
    for (const auto& b : breakers) {
        breakersJson[b.name] = {{"state", resilience::stateToString(b.state)},
                                {"failure_count", b.failureCount},
                                {"failure_threshold", b.failureThreshold},
                                {"total_rejected", b.totalRejected},
                                {"total_opened", b.totalOpened},
                                {"total_closed", b.totalClosed},
                                {"total_successes", b.totalSuccesses},
                                {"total_failures", b.totalFailures},
                                {"state_changes", b.stateChanges}};
    }
    j["circuit_breakers"] = std::move(breakersJson);

    j["caches"]["exact"] = cacheToJson(exactCache);
    if (semanticCache) {
        j["caches"]["semantic"] = cacheToJson(*semanticCache);
    }

    j["last_degraded_at_ms"] = lastDegradedAt ? nlohmann::json(epochMillis(*lastDegradedAt))
                                              : nlohmann::json(nullptr);
    j["queries"] = {{"total", totalQueries},
                    {"degraded", degradedQueries},
                    {"failed", failedQueries}};
    return j;
}

} // namespace sieve::search
