#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include <sieve/config/engine_config.h>
#include <sieve/core/metrics.h>
#include <sieve/core/types.h>
#include <sieve/resilience/circuit_breaker.h>
#include <sieve/resilience/retry_executor.h>
#include <sieve/search/backends.h>
#include <sieve/search/cache_key.h>
#include <sieve/search/engine_health.h>
#include <sieve/search/query_expander.h>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

struct SearchRequest {
    std::string query;
    bool useCache = true;
    std::optional<size_t> resultLimit;
    std::optional<size_t> rerankTopK;
    std::optional<double> diversityLambda;
    SearchFilters filters;
    /// Overall deadline for this request; the engine default applies when absent.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Validated, normalised view of one request. Built once, then read-only.
 */
struct QueryContext {
    std::string rawQuery;
    std::string normalizedQuery;
    std::vector<std::string> expandedTerms;
    bool useCache = true;
    size_t resultLimit = 0;
    size_t rerankTopK = 0;
    std::optional<double> diversityLambda;
    SearchFilters filters;
    SteadyClock::time_point deadline;
    CacheKey cacheKey;
};

enum class CacheTier { None, Exact, Semantic, Stale };

const char* cacheTierToString(CacheTier tier);

struct SearchTiming {
    double totalMs = 0.0;
    double embedMs = 0.0;
    double vectorMs = 0.0;
    double keywordMs = 0.0;
    double fusionMs = 0.0;
    double rerankMs = 0.0;
};

struct SearchResponse {
    std::vector<SearchCandidate> results;
    /// Set when any retrieval path failed and a fallback produced the results.
    bool degradedMode = false;
    CacheTier cacheTier = CacheTier::None;
    std::vector<std::string> expandedTerms;
    /// Components that failed for this request: embedding, vector, keyword, rerank, diversity.
    std::vector<std::string> failedComponents;
    SearchTiming timing;
};

/**
 * @brief Collaborators of the engine. Only keywordBackend is required.
 *
 * Without vectorBackend or embedder the engine runs keyword-only (not degraded). Without
 * crossEncoder the rerank stage is skipped.
 */
struct EngineDependencies {
    std::shared_ptr<IVectorBackend> vectorBackend;
    std::shared_ptr<IKeywordBackend> keywordBackend;
    std::shared_ptr<IEmbeddingProvider> embedder;
    std::shared_ptr<ICrossEncoder> crossEncoder;
    std::shared_ptr<const ISynonymSource> synonyms;
    std::shared_ptr<IMetricsSink> metrics;
    std::shared_ptr<spdlog::logger> logger;
    /// Clock used by the circuit breakers.
    resilience::ClockFn clock;
    /// Sleep used between retries.
    resilience::RetryExecutor::SleepFn sleep;
};

/**
 * @brief Hybrid retrieval: caches, vector + keyword search, fusion, reranking, diversity.
 *
 * Fallback order when components fail: fused results, then whichever single path
 * succeeded, then a stale cache entry, then ErrorCode::Unavailable. Degraded and stale
 * responses are never written to the caches.
 *
 * search() may be called from any number of threads.
 */
class HybridQueryEngine {
public:
    /// @throws std::invalid_argument on an invalid config or a missing keyword backend
    HybridQueryEngine(config::EngineConfig config, EngineDependencies deps);
    ~HybridQueryEngine();

    HybridQueryEngine(const HybridQueryEngine&) = delete;
    HybridQueryEngine& operator=(const HybridQueryEngine&) = delete;

    /// Non-throwing construction.
    static Result<std::unique_ptr<HybridQueryEngine>> create(config::EngineConfig config,
                                                             EngineDependencies deps);

    Result<SearchResponse> search(const SearchRequest& request);

    /// Run each query through the normal path; returns how many ended up cached.
    size_t warmCache(const std::vector<std::string>& queries);

    void clearCaches();

    /// Write the exact cache to config().cachePersistPath.
    Result<void> persistCache() const;

    /// Reload the exact cache from config().cachePersistPath.
    Result<void> restoreCache();

    EngineHealth health() const;

    const config::EngineConfig& config() const;

    resilience::CircuitBreaker::Stats vectorBreakerStats() const;
    resilience::RetryExecutor::Stats retryStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace sieve::search
