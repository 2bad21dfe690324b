#include <sieve/search/hybrid_query_engine.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <future>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <sieve/core/concurrency.h>
#include <sieve/core/thread_pool.h>
#include <sieve/search/lru_cache.h>
#include <sieve/search/reranker.h>
#include <sieve/search/score_fusion.h>
#include <sieve/search/semantic_cache.h>

namespace sieve::search {

const char* cacheTierToString(CacheTier tier) {
    switch (tier) {
        case CacheTier::None: return "none";
        case CacheTier::Exact: return "exact";
        case CacheTier::Semantic: return "semantic";
        case CacheTier::Stale: return "stale";
    }
    return "unknown";
}

namespace {

double msSince(SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

SteadyClock::time_point earliest(SteadyClock::time_point a, SteadyClock::time_point b) {
    return a < b ? a : b;
}

Result<void> checkDependencies(const config::EngineConfig& config, const EngineDependencies& deps) {
    if (!deps.keywordBackend) {
        return Error{ErrorCode::InvalidArgument, "HybridQueryEngine requires a keyword backend"};
    }
    return config.validate();
}

} // namespace

// =============================================================================
// Impl
// =============================================================================

class HybridQueryEngine::Impl {
public:
    Impl(config::EngineConfig config, EngineDependencies deps)
        : config_(std::move(config)), deps_(std::move(deps)),
          log_(deps_.logger ? deps_.logger : spdlog::default_logger()),
          metrics_(deps_.metrics ? deps_.metrics : std::make_shared<NullMetricsSink>()),
          exactCache_(config_.cache, deps_.clock), expander_(config_.expansion, deps_.synonyms),
          fusion_(config_.fusion), reranker_(deps_.crossEncoder, config_.rerank),
          vectorBreaker_("vector-backend", config_.vectorBreaker, metrics_, deps_.clock),
          embeddingBreaker_("embedding-provider", config_.embeddingBreaker, metrics_,
                            deps_.clock),
          retry_(metrics_, deps_.sleep) {
        if (config_.enableSemanticCache) {
            semanticCache_ = std::make_unique<SemanticCache>(config_.semanticCache, deps_.clock);
        }
        if (auto level = spdlog::level::from_str(config_.logLevel);
            level != spdlog::level::off || config_.logLevel == "off") {
            log_->set_level(level);
        }
        if (!config_.cachePersistPath.empty() && std::filesystem::exists(config_.cachePersistPath)) {
            if (auto r = exactCache_.loadFromFile(config_.cachePersistPath); !r) {
                log_->warn("Starting with an empty cache: {}", r.error().message);
            }
        }
        pool_.start(config_.workerThreads);
        log_->debug("HybridQueryEngine started with {} workers (vector={}, rerank={})",
                    config_.workerThreads, vectorEnabled(), deps_.crossEncoder != nullptr);
    }

    ~Impl() {
        // Running backend tasks reference members; join them before anything is destroyed.
        pool_.stop();
        if (!config_.cachePersistPath.empty()) {
            if (auto r = exactCache_.saveToFile(config_.cachePersistPath); !r) {
                log_->warn("Failed to persist cache: {}", r.error().message);
            }
        }
    }

    bool vectorEnabled() const { return deps_.vectorBackend && deps_.embedder; }

    Result<QueryContext> buildContext(const SearchRequest& request) const {
        QueryContext ctx;
        ctx.rawQuery = request.query;
        ctx.normalizedQuery = QueryExpander::normalize(request.query);
        if (ctx.normalizedQuery.empty()) {
            return Error{ErrorCode::ValidationError, "query must not be empty"};
        }

        ctx.resultLimit = request.resultLimit.value_or(config_.defaultResultLimit);
        if (ctx.resultLimit == 0 || ctx.resultLimit > config_.maxResultLimit) {
            return Error{ErrorCode::InvalidArgument,
                         "result limit must be in [1, " + std::to_string(config_.maxResultLimit) +
                             "]"};
        }

        ctx.diversityLambda =
            request.diversityLambda ? request.diversityLambda : config_.defaultDiversityLambda;
        if (ctx.diversityLambda && !(*ctx.diversityLambda >= 0.0 && *ctx.diversityLambda <= 1.0)) {
            return Error{ErrorCode::InvalidArgument, "diversity lambda must be in [0, 1]"};
        }

        if (request.timeout && request.timeout->count() <= 0) {
            return Error{ErrorCode::InvalidArgument, "timeout must be positive"};
        }

        ctx.rerankTopK = request.rerankTopK.value_or(config_.defaultRerankTopK);
        ctx.useCache = request.useCache;
        ctx.filters = request.filters;
        ctx.deadline = SteadyClock::now() + request.timeout.value_or(config_.requestTimeout);
        ctx.expandedTerms = expander_.expand(ctx.normalizedQuery);
        ctx.cacheKey = CacheKey::fromQuery(ctx.normalizedQuery, ctx.resultLimit, ctx.rerankTopK,
                                           ctx.diversityLambda, ctx.filters);
        return ctx;
    }

    template <typename T>
    Result<T> await(std::future<Result<T>>& fut, SteadyClock::time_point until,
                    std::stop_source& stop, const char* component) {
        if (fut.wait_until(until) != std::future_status::ready) {
            stop.request_stop();
            return Error{ErrorCode::Timeout, std::string(component) + " did not answer in time"};
        }
        try {
            return fut.get();
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string(component) + " failed: " + e.what()};
        }
    }

    std::optional<std::vector<float>> embedQuery(const QueryContext& ctx, SearchResponse& response) {
        auto start = SteadyClock::now();
        std::stop_source stop;
        auto fut = pool_.submit([this, text = ctx.normalizedQuery, token = stop.get_token()]() {
            return embeddingBreaker_.call([&] { return deps_.embedder->embed(text, token); });
        });
        auto r = await(fut, earliest(start + config_.embedTimeout, ctx.deadline), stop, "embedding");
        response.timing.embedMs = msSince(start);
        if (!r) {
            log_->warn("Query embedding failed: {}", r.error().message);
            response.failedComponents.push_back("embedding");
            return std::nullopt;
        }
        return std::move(r).value();
    }

    /**
     * One vector backend call bounded by backendTimeout. Running out of that budget is the
     * backend's fault and reported as a transient Timeout; hitting the request deadline first
     * is the caller giving up and reported as OperationCancelled.
     */
    Result<std::vector<BackendCandidate>> queryVectorOnce(const std::vector<float>& embedding,
                                                          const SearchFilters& filters,
                                                          size_t topK,
                                                          SteadyClock::time_point deadline) {
        const auto ownUntil = SteadyClock::now() + config_.backendTimeout;
        std::stop_source stop;
        auto fut = pool_.submit([backend = deps_.vectorBackend, embedding, filters, topK,
                                 token = stop.get_token()]() {
            return backend->query(embedding, topK, filters, token);
        });
        if (fut.wait_until(earliest(ownUntil, deadline)) != std::future_status::ready) {
            stop.request_stop();
            if (ownUntil <= deadline) {
                return Error{ErrorCode::Timeout,
                             "vector backend did not answer within " +
                                 std::to_string(config_.backendTimeout.count()) + "ms"};
            }
            return Error{ErrorCode::OperationCancelled,
                         "request deadline reached during vector query"};
        }
        try {
            return fut.get();
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("vector backend failed: ") + e.what()};
        }
    }

    std::optional<SearchResponse> lookupCaches(const QueryContext& ctx,
                                               const std::optional<std::vector<float>>& embedding,
                                               SearchResponse& response) {
        if (semanticCache_ && embedding) {
            if (auto hit = semanticCache_->get(*embedding, ctx.cacheKey.paramFingerprint())) {
                metrics_->incrementCounter(metric_names::kCacheHitsTotal, {{"tier", "semantic"}});
                log_->debug("Semantic cache hit for '{}' (matched '{}', similarity {:.3f})",
                            ctx.normalizedQuery, hit->matchedQuery, hit->similarity);
                response.results = std::move(hit->results);
                response.cacheTier = CacheTier::Semantic;
                return response;
            }
            metrics_->incrementCounter(metric_names::kCacheMissesTotal, {{"tier", "semantic"}});
        }

        if (auto hit = exactCache_.get(ctx.cacheKey)) {
            metrics_->incrementCounter(metric_names::kCacheHitsTotal, {{"tier", "exact"}});
            response.results = std::move(*hit);
            response.cacheTier = CacheTier::Exact;
            return response;
        }
        metrics_->incrementCounter(metric_names::kCacheMissesTotal, {{"tier", "exact"}});
        return std::nullopt;
    }

    std::optional<std::vector<SearchCandidate>>
    staleFallback(const QueryContext& ctx, const std::optional<std::vector<float>>& embedding) {
        if (auto stale = exactCache_.getStale(ctx.cacheKey))
            return stale;
        if (semanticCache_ && embedding) {
            if (auto hit = semanticCache_->findClosest(*embedding, ctx.cacheKey.paramFingerprint(),
                                                       config_.staleSimilarityFloor)) {
                log_->warn("Serving stale results of '{}' for '{}'", hit->matchedQuery,
                           ctx.normalizedQuery);
                return std::move(hit->results);
            }
        }
        return std::nullopt;
    }

    SearchResponse finish(SearchResponse response, SteadyClock::time_point start) {
        response.timing.totalMs = msSince(start);
        const char* outcome = response.degradedMode ? "degraded" : "success";
        metrics_->observeHistogram(metric_names::kQueryDurationMs, {{"outcome", outcome}},
                                   response.timing.totalMs);
        if (response.degradedMode) {
            degradedQueries_.fetch_add(1, std::memory_order_relaxed);
            std::lock_guard<std::mutex> lock(healthMutex_);
            lastDegradedAt_ = std::chrono::system_clock::now();
        }
        return response;
    }

    Error fail(Error error, SteadyClock::time_point start) {
        failedQueries_.fetch_add(1, std::memory_order_relaxed);
        metrics_->observeHistogram(metric_names::kQueryDurationMs, {{"outcome", "error"}},
                                   msSince(start));
        return error;
    }

    Result<SearchResponse> search(const SearchRequest& request) {
        const auto start = SteadyClock::now();
        totalQueries_.fetch_add(1, std::memory_order_relaxed);

        auto built = buildContext(request);
        if (!built) {
            return fail(built.error(), start);
        }
        const QueryContext ctx = std::move(built).value();

        SearchResponse response;
        response.expandedTerms = ctx.expandedTerms;

        std::optional<std::vector<float>> embedding;
        if (deps_.embedder) {
            embedding = embedQuery(ctx, response);
        }

        if (ctx.useCache) {
            if (auto cached = lookupCaches(ctx, embedding, response)) {
                return finish(std::move(*cached), start);
            }
        }

        // Keyword retrieval runs on the pool while this thread drives the vector path.
        using Hits = Result<std::vector<BackendCandidate>>;
        const size_t topK = config_.candidatePoolSize;
        const auto backendStart = SteadyClock::now();
        const auto keywordUntil = earliest(backendStart + config_.backendTimeout, ctx.deadline);

        std::stop_source keywordStop;
        auto keywordFut =
            pool_.submit([this, terms = ctx.expandedTerms, topK,
                          token = keywordStop.get_token()]() -> Hits {
                return deps_.keywordBackend->query(terms, topK, token);
            });

        std::optional<std::vector<BackendCandidate>> vectorHits;
        std::optional<Error> vectorError;
        if (vectorEnabled() && embedding) {
            // A retry only starts if a full backend timeout still fits before the deadline.
            const auto lastAttemptStart = ctx.deadline - config_.backendTimeout;
            auto r = vectorBreaker_.call([&] {
                return retry_.execute(
                    [&] { return queryVectorOnce(*embedding, ctx.filters, topK, ctx.deadline); },
                    config_.retry, std::stop_token{}, lastAttemptStart);
            });
            response.timing.vectorMs = msSince(backendStart);
            metrics_->observeHistogram(metric_names::kVectorBackendDurationMs,
                                       {{"outcome", r ? "success" : "error"}},
                                       response.timing.vectorMs);
            if (r) {
                vectorHits = std::move(r).value();
            } else {
                vectorError = r.error();
                response.failedComponents.push_back("vector");
                log_->warn("Vector retrieval failed, continuing keyword-only: {}",
                           r.error().message);
            }
        } else if (vectorEnabled()) {
            vectorError = Error{ErrorCode::Unavailable, "no query embedding"};
            response.failedComponents.push_back("vector");
        }

        std::optional<std::vector<BackendCandidate>> keywordHits;
        std::optional<Error> keywordError;
        {
            auto r = await(keywordFut, keywordUntil, keywordStop, "keyword backend");
            response.timing.keywordMs = msSince(backendStart);
            if (r) {
                keywordHits = std::move(r).value();
            } else {
                keywordError = r.error();
                response.failedComponents.push_back("keyword");
                log_->warn("Keyword retrieval failed: {}", r.error().message);
            }
        }

        if (!vectorHits && !keywordHits) {
            if (auto stale = staleFallback(ctx, embedding)) {
                log_->warn("All retrieval paths failed for '{}', serving stale cache entry",
                           ctx.normalizedQuery);
                response.results = std::move(*stale);
                response.cacheTier = CacheTier::Stale;
                response.degradedMode = true;
                return finish(std::move(response), start);
            }
            std::string detail = "keyword: " + keywordError.value_or(Error{}).message;
            if (vectorError)
                detail = "vector: " + vectorError->message + "; " + detail;
            return fail(Error{ErrorCode::Unavailable, "all retrieval paths exhausted (" + detail + ")"},
                        start);
        }

        response.degradedMode = (vectorEnabled() && !vectorHits) || !keywordHits;

        auto fusionStart = SteadyClock::now();
        auto results = fusion_.fuse(vectorHits.value_or(std::vector<BackendCandidate>{}),
                                    keywordHits.value_or(std::vector<BackendCandidate>{}));
        response.timing.fusionMs = msSince(fusionStart);

        if (ctx.rerankTopK > 0 && deps_.crossEncoder && !results.empty()) {
            auto rerankStart = SteadyClock::now();
            auto budget = std::min(config_.rerank.timeout, remainingUntil(ctx.deadline));
            if (budget.count() <= 0) {
                response.failedComponents.push_back("rerank");
                log_->warn("Request deadline reached before reranking");
            } else {
                auto outcome = reranker_.rerank(ctx.rawQuery, results, ctx.rerankTopK, budget);
                response.timing.rerankMs = msSince(rerankStart);
                metrics_->observeHistogram(metric_names::kRerankDurationMs,
                                           {{"outcome", outcome.applied ? "success" : "error"}},
                                           response.timing.rerankMs);
                if (!outcome.applied) {
                    response.failedComponents.push_back("rerank");
                }
                results = std::move(outcome.results);
            }
        }

        if (ctx.diversityLambda && !results.empty()) {
            auto diversified = reranker_.diversify(results, *ctx.diversityLambda, ctx.resultLimit);
            if (diversified) {
                results = std::move(diversified).value();
            } else {
                response.failedComponents.push_back("diversity");
                log_->warn("Diversification skipped: {}", diversified.error().message);
            }
        }

        if (results.size() > ctx.resultLimit) {
            results.resize(ctx.resultLimit);
        }
        response.results = std::move(results);

        if (ctx.useCache && !response.degradedMode && response.failedComponents.empty()) {
            exactCache_.put(ctx.cacheKey, response.results);
            if (semanticCache_ && embedding) {
                semanticCache_->put(*embedding, ctx.cacheKey.paramFingerprint(),
                                    ctx.normalizedQuery, response.results);
            }
        }

        if (response.degradedMode) {
            std::string failed;
            for (const auto& c : response.failedComponents)
                failed += (failed.empty() ? "" : ", ") + c;
            log_->warn("Degraded response for '{}' (failed: {})", ctx.normalizedQuery, failed);
        }
        return finish(std::move(response), start);
    }

    EngineHealth health() const {
        EngineHealth h;
        h.breakers.push_back(vectorBreaker_.stats());
        h.breakers.push_back(embeddingBreaker_.stats());
        h.exactCache = exactCache_.stats();
        if (semanticCache_)
            h.semanticCache = semanticCache_->stats();
        {
            std::lock_guard<std::mutex> lock(healthMutex_);
            h.lastDegradedAt = lastDegradedAt_;
        }
        h.totalQueries = totalQueries_.load(std::memory_order_relaxed);
        h.degradedQueries = degradedQueries_.load(std::memory_order_relaxed);
        h.failedQueries = failedQueries_.load(std::memory_order_relaxed);

        bool allClosed = std::all_of(h.breakers.begin(), h.breakers.end(), [](const auto& b) {
            return b.state == resilience::CircuitBreaker::State::Closed;
        });
        h.status = allClosed ? EngineHealth::Status::Healthy : EngineHealth::Status::Degraded;
        return h;
    }

    config::EngineConfig config_;
    EngineDependencies deps_;
    std::shared_ptr<spdlog::logger> log_;
    std::shared_ptr<IMetricsSink> metrics_;

    LruCache exactCache_;
    std::unique_ptr<SemanticCache> semanticCache_;
    QueryExpander expander_;
    ScoreFusion fusion_;
    Reranker reranker_;
    resilience::CircuitBreaker vectorBreaker_;
    resilience::CircuitBreaker embeddingBreaker_;
    resilience::RetryExecutor retry_;

    std::atomic<uint64_t> totalQueries_{0};
    std::atomic<uint64_t> degradedQueries_{0};
    std::atomic<uint64_t> failedQueries_{0};
    mutable std::mutex healthMutex_;
    std::optional<std::chrono::system_clock::time_point> lastDegradedAt_;

    // Declared last so it is torn down first.
    ThreadPool pool_;
};

// =============================================================================
// HybridQueryEngine
// =============================================================================

HybridQueryEngine::HybridQueryEngine(config::EngineConfig config, EngineDependencies deps) {
    if (auto r = checkDependencies(config, deps); !r) {
        throw std::invalid_argument(r.error().message);
    }
    pImpl = std::make_unique<Impl>(std::move(config), std::move(deps));
}

HybridQueryEngine::~HybridQueryEngine() = default;

Result<std::unique_ptr<HybridQueryEngine>>
HybridQueryEngine::create(config::EngineConfig config, EngineDependencies deps) {
    if (auto r = checkDependencies(config, deps); !r) {
        return r.error();
    }
    return std::make_unique<HybridQueryEngine>(std::move(config), std::move(deps));
}

Result<SearchResponse> HybridQueryEngine::search(const SearchRequest& request) {
    return pImpl->search(request);
}

size_t HybridQueryEngine::warmCache(const std::vector<std::string>& queries) {
    size_t cached = 0;
    for (const auto& q : queries) {
        SearchRequest request;
        request.query = q;
        auto r = pImpl->search(request);
        if (!r) {
            pImpl->log_->warn("Cache warm-up for '{}' failed: {}", q, r.error().message);
            continue;
        }
        const auto& resp = r.value();
        if (resp.cacheTier == CacheTier::Exact || resp.cacheTier == CacheTier::Semantic ||
            (!resp.degradedMode && resp.failedComponents.empty())) {
            ++cached;
        }
    }
    pImpl->log_->info("Cache warm-up cached {}/{} queries", cached, queries.size());
    return cached;
}

void HybridQueryEngine::clearCaches() {
    pImpl->exactCache_.clear();
    if (pImpl->semanticCache_)
        pImpl->semanticCache_->clear();
}

Result<void> HybridQueryEngine::persistCache() const {
    if (pImpl->config_.cachePersistPath.empty()) {
        return Error{ErrorCode::InvalidState, "cache.persist_path is not configured"};
    }
    return pImpl->exactCache_.saveToFile(pImpl->config_.cachePersistPath);
}

Result<void> HybridQueryEngine::restoreCache() {
    if (pImpl->config_.cachePersistPath.empty()) {
        return Error{ErrorCode::InvalidState, "cache.persist_path is not configured"};
    }
    return pImpl->exactCache_.loadFromFile(pImpl->config_.cachePersistPath);
}

EngineHealth HybridQueryEngine::health() const {
    return pImpl->health();
}

const config::EngineConfig& HybridQueryEngine::config() const {
    return pImpl->config_;
}

resilience::CircuitBreaker::Stats HybridQueryEngine::vectorBreakerStats() const {
    return pImpl->vectorBreaker_.stats();
}

resilience::RetryExecutor::Stats HybridQueryEngine::retryStats() const {
    return pImpl->retry_.stats();
}

} // namespace sieve::search
