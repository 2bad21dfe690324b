#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <sieve/config/config_helpers.h>
#include <sieve/core/types.h>
#include <sieve/resilience/circuit_breaker.h>
#include <sieve/resilience/retry_executor.h>
#include <sieve/search/lru_cache.h>
#include <sieve/search/query_expander.h>
#include <sieve/search/reranker.h>
#include <sieve/search/score_fusion.h>
#include <sieve/search/semantic_cache.h>

namespace sieve::config {

/**
 * @brief Every tunable of the query engine, with production defaults.
 *
 * File sections: [engine] [cache] [semantic_cache] [circuit_breaker] [embedding_breaker]
 * [retry] [fusion] [rerank] [expansion] [logging]. Environment variables named
 * SIEVE_<SECTION>_<KEY> override file values.
 */
struct EngineConfig {
    // [engine]
    size_t workerThreads = 4;
    size_t defaultResultLimit = 10;
    size_t maxResultLimit = 100;
    /// Candidates requested from each backend before fusion.
    size_t candidatePoolSize = 50;
    /// 0 disables cross-encoder reranking unless a request asks for it.
    size_t defaultRerankTopK = 20;
    std::optional<double> defaultDiversityLambda;
    /// Bound on a single backend call; each vector retry attempt gets a fresh one.
    std::chrono::milliseconds backendTimeout{3000};
    std::chrono::milliseconds embedTimeout{2000};
    std::chrono::milliseconds requestTimeout{10'000};
    /// Minimum similarity for serving a semantic cache entry when everything else failed.
    double staleSimilarityFloor = 0.5;

    // [cache]
    search::LruCacheConfig cache;
    /// Empty disables persistence.
    std::filesystem::path cachePersistPath;

    // [semantic_cache]
    bool enableSemanticCache = true;
    search::SemanticCacheConfig semanticCache;

    resilience::CircuitBreakerConfig vectorBreaker;
    resilience::CircuitBreakerConfig embeddingBreaker;
    resilience::RetryPolicy retry;

    search::ScoreFusionConfig fusion;
    search::RerankerConfig rerank;
    search::QueryExpanderConfig expansion;

    // [logging]
    std::string logLevel = "info";

    Result<void> validate() const;
};

/**
 * @brief Load @p path (missing file means defaults), apply environment overrides, validate.
 */
Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

/// Apply a parsed table on top of @p config. Unknown keys are logged and ignored.
Result<void> apply_config_table(EngineConfig& config, const ConfigTable& table);

/// Apply SIEVE_<SECTION>_<KEY> variables.
Result<void> apply_env_overrides(EngineConfig& config);

/// trace | debug | info | warn | error | critical | off
Result<void> apply_log_level(const std::string& level);

} // namespace sieve::config
