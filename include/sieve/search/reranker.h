#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sieve/core/thread_pool.h>
#include <sieve/core/types.h>
#include <sieve/search/backends.h>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

struct RerankerConfig {
    size_t batchSize = 32;
    std::chrono::milliseconds timeout{500};
    /// Workers running model calls; a call that outlives its timeout keeps its worker busy.
    size_t workerThreads = 2;
};

struct RerankOutcome {
    std::vector<SearchCandidate> results;
    bool applied = false;
    std::optional<Error> failure;
};

/**
 * @brief Cross-encoder re-scoring and MMR diversification of fused results.
 *
 * Both stages return new vectors. After either one finalScore is clamped to be
 * non-increasing down the list and ranks are reassigned.
 */
class Reranker {
public:
    struct Stats {
        uint64_t reranks = 0;
        uint64_t fallbacks = 0;
        uint64_t timeouts = 0;
        uint64_t diversifications = 0;
    };

    explicit Reranker(std::shared_ptr<ICrossEncoder> encoder, RerankerConfig config = {});
    ~Reranker();

    Reranker(const Reranker&) = delete;
    Reranker& operator=(const Reranker&) = delete;

    /**
     * @brief Re-score the first @p topK candidates and reorder them by rerankScore.
     *
     * Candidates past topK follow in their incoming order. On timeout, model error, a
     * non-ready model or a wrong number of scores the input order is returned with
     * applied == false and the failure recorded.
     */
    RerankOutcome rerank(const std::string& query, const std::vector<SearchCandidate>& candidates,
                         size_t topK, std::optional<std::chrono::milliseconds> timeout = {});

    /**
     * @brief Maximal marginal relevance selection.
     *
     * Picks argmax lambda * rel(d) - (1 - lambda) * max_{s in selected} sim(d, s) until
     * @p limit candidates (all by default) are chosen. rel is the min-max normalised
     * finalScore, sim the Jaccard similarity of content tokens.
     */
    Result<std::vector<SearchCandidate>> diversify(const std::vector<SearchCandidate>& candidates,
                                                   double lambda,
                                                   std::optional<size_t> limit = {}) const;

    bool available() const;
    Stats stats() const;

    static double jaccardSimilarity(const std::vector<std::string>& a,
                                    const std::vector<std::string>& b);

private:
    RerankOutcome fallback(const std::vector<SearchCandidate>& candidates, Error error);

    std::shared_ptr<ICrossEncoder> encoder_;
    RerankerConfig config_;
    ThreadPool pool_;

    std::atomic<uint64_t> reranks_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> timeouts_{0};
    mutable std::atomic<uint64_t> diversifications_{0};
};

} // namespace sieve::search
