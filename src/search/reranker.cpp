#include <sieve/search/reranker.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <set>
#include <spdlog/spdlog.h>
#include <sieve/search/query_expander.h>
#include <sieve/search/score_fusion.h>

namespace sieve::search {

namespace {

double logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

// Maps raw model output into [0, 1]; scores already in range are kept as they are.
std::vector<double> normalizeModelScores(const std::vector<float>& raw) {
    bool inRange = std::all_of(raw.begin(), raw.end(),
                               [](float s) { return s >= 0.0f && s <= 1.0f; });
    std::vector<double> out;
    out.reserve(raw.size());
    for (float s : raw)
        out.push_back(inRange ? static_cast<double>(s) : logistic(static_cast<double>(s)));
    return out;
}

std::vector<std::string> contentTokens(const SearchCandidate& c) {
    auto tokens = QueryExpander::tokenize(c.contentRef);
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

} // namespace

Reranker::Reranker(std::shared_ptr<ICrossEncoder> encoder, RerankerConfig config)
    : encoder_(std::move(encoder)), config_(config) {
    if (config_.batchSize == 0)
        config_.batchSize = 1;
    if (encoder_) {
        pool_.start(std::max<size_t>(1, config_.workerThreads));
    }
}

Reranker::~Reranker() {
    pool_.stop();
}

bool Reranker::available() const {
    return encoder_ && encoder_->isReady();
}

RerankOutcome Reranker::fallback(const std::vector<SearchCandidate>& candidates, Error error) {
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("Reranking skipped, keeping fused order: {}", error.message);
    RerankOutcome out;
    out.results = candidates;
    out.applied = false;
    out.failure = std::move(error);
    return out;
}

RerankOutcome Reranker::rerank(const std::string& query,
                               const std::vector<SearchCandidate>& candidates, size_t topK,
                               std::optional<std::chrono::milliseconds> timeout) {
    if (candidates.empty() || topK == 0) {
        return RerankOutcome{candidates, false, std::nullopt};
    }
    if (!encoder_) {
        return fallback(candidates, Error{ErrorCode::NotInitialized, "no cross-encoder configured"});
    }
    if (!encoder_->isReady()) {
        return fallback(candidates, Error{ErrorCode::Unavailable, "cross-encoder not ready"});
    }

    const size_t head = std::min(topK, candidates.size());
    std::vector<std::string> docs;
    docs.reserve(head);
    for (size_t i = 0; i < head; ++i)
        docs.push_back(candidates[i].contentRef);

    // The task owns copies of its inputs; it may outlive this call after a timeout.
    auto encoder = encoder_;
    const size_t batchSize = config_.batchSize;
    auto future = pool_.submit([encoder, query, docs = std::move(docs),
                                batchSize]() -> Result<std::vector<float>> {
        std::vector<float> scores;
        scores.reserve(docs.size());
        for (size_t start = 0; start < docs.size(); start += batchSize) {
            size_t end = std::min(docs.size(), start + batchSize);
            std::vector<std::string> batch(docs.begin() + static_cast<std::ptrdiff_t>(start),
                                           docs.begin() + static_cast<std::ptrdiff_t>(end));
            auto r = encoder->scoreDocuments(query, batch);
            if (!r)
                return r.error();
            if (r.value().size() != batch.size()) {
                return Error{ErrorCode::InvalidData,
                             "cross-encoder returned " + std::to_string(r.value().size()) +
                                 " scores for " + std::to_string(batch.size()) + " documents"};
            }
            scores.insert(scores.end(), r.value().begin(), r.value().end());
        }
        return scores;
    });

    auto budget = timeout.value_or(config_.timeout);
    if (future.wait_for(budget) != std::future_status::ready) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        return fallback(candidates, Error{ErrorCode::Timeout, "cross-encoder exceeded " +
                                                                  std::to_string(budget.count()) +
                                                                  "ms"});
    }

    Result<std::vector<float>> scored = [&]() -> Result<std::vector<float>> {
        try {
            return future.get();
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("cross-encoder threw: ") + e.what()};
        }
    }();
    if (!scored) {
        return fallback(candidates, scored.error());
    }

    auto scores = normalizeModelScores(scored.value());
    std::vector<SearchCandidate> headList(candidates.begin(),
                                          candidates.begin() + static_cast<std::ptrdiff_t>(head));
    for (size_t i = 0; i < head; ++i) {
        headList[i].rerankScore = scores[i];
        headList[i].finalScore = scores[i];
    }
    std::stable_sort(headList.begin(), headList.end(),
                     [](const SearchCandidate& a, const SearchCandidate& b) {
                         return *a.rerankScore > *b.rerankScore;
                     });

    RerankOutcome out;
    out.results = std::move(headList);
    out.results.insert(out.results.end(), candidates.begin() + static_cast<std::ptrdiff_t>(head),
                       candidates.end());

    // Model scores and fused scores live on different scales. Scale the tail proportionally
    // under the lowest reranked score so it keeps its spread instead of collapsing onto it.
    if (head < out.results.size()) {
        const double floor = out.results[head - 1].finalScore;
        double tailMax = 0.0;
        for (size_t i = head; i < out.results.size(); ++i)
            tailMax = std::max(tailMax, out.results[i].finalScore);
        if (tailMax > floor) {
            for (size_t i = head; i < out.results.size(); ++i)
                out.results[i].finalScore = floor * std::max(0.0, out.results[i].finalScore) / tailMax;
        }
    }
    finalizeRanking(out.results);
    out.applied = true;
    reranks_.fetch_add(1, std::memory_order_relaxed);
    return out;
}

double Reranker::jaccardSimilarity(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b) {
    if (a.empty() && b.empty())
        return 0.0;
    std::set<std::string> sa(a.begin(), a.end());
    std::set<std::string> sb(b.begin(), b.end());
    size_t inter = 0;
    for (const auto& t : sa)
        inter += sb.count(t);
    size_t uni = sa.size() + sb.size() - inter;
    return uni > 0 ? static_cast<double>(inter) / static_cast<double>(uni) : 0.0;
}

Result<std::vector<SearchCandidate>> Reranker::diversify(
    const std::vector<SearchCandidate>& candidates, double lambda,
    std::optional<size_t> limit) const {
    if (!(lambda >= 0.0 && lambda <= 1.0)) {
        return Error{ErrorCode::InvalidArgument, "diversity lambda must be in [0, 1]"};
    }
    if (candidates.empty())
        return std::vector<SearchCandidate>{};

    const size_t n = candidates.size();
    const size_t want = std::min(n, limit.value_or(n));

    std::vector<double> finals;
    finals.reserve(n);
    for (const auto& c : candidates)
        finals.push_back(c.finalScore);
    auto relevance = fusion::normalizeScores(finals);

    std::vector<std::vector<std::string>> tokens;
    tokens.reserve(n);
    for (const auto& c : candidates)
        tokens.push_back(contentTokens(c));

    auto similarity = [&](size_t i, size_t j) {
        if (tokens[i].empty() && tokens[j].empty())
            return candidates[i].docId == candidates[j].docId ? 1.0 : 0.0;
        return jaccardSimilarity(tokens[i], tokens[j]);
    };

    std::vector<bool> picked(n, false);
    std::vector<double> maxSim(n, 0.0);
    std::vector<SearchCandidate> out;
    out.reserve(want);

    while (out.size() < want) {
        size_t best = n;
        double bestScore = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (picked[i])
                continue;
            double mmr = lambda * relevance[i] - (1.0 - lambda) * maxSim[i];
            // Strict comparison keeps the earlier (better fused) candidate on ties
            if (best == n || mmr > bestScore) {
                best = i;
                bestScore = mmr;
            }
        }
        picked[best] = true;
        out.push_back(candidates[best]);
        for (size_t i = 0; i < n; ++i) {
            if (!picked[i])
                maxSim[i] = std::max(maxSim[i], similarity(i, best));
        }
    }

    finalizeRanking(out);
    diversifications_.fetch_add(1, std::memory_order_relaxed);
    return out;
}

Reranker::Stats Reranker::stats() const {
    Stats s;
    s.reranks = reranks_.load(std::memory_order_relaxed);
    s.fallbacks = fallbacks_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.diversifications = diversifications_.load(std::memory_order_relaxed);
    return s;
}

} // namespace sieve::search
