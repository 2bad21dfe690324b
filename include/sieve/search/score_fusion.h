#pragma once

#include <cstddef>
#include <vector>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

enum class FusionStrategy {
    ReciprocalRank,   ///< sum of 1/(k + rank) over the lists a document appears in
    LinearCombination ///< alpha * norm(vector) + (1 - alpha) * norm(keyword)
};

struct ScoreFusionConfig {
    FusionStrategy strategy = FusionStrategy::ReciprocalRank;
    double rrfK = 60.0;
    /// Weight of the vector score for LinearCombination.
    double vectorWeight = 0.7;
};

/**
 * @brief Merges the vector and keyword result lists into one ranked list.
 *
 * Output is sorted by fused score descending with ties broken by higher raw vector score,
 * then by docId. finalScore equals fusedScore and ranks are 1..n, so the result does not
 * depend on the order of equal-scored inputs.
 */
class ScoreFusion {
public:
    explicit ScoreFusion(ScoreFusionConfig config = {});

    std::vector<SearchCandidate> fuse(const std::vector<BackendCandidate>& vectorResults,
                                      const std::vector<BackendCandidate>& keywordResults) const;

    static std::vector<SearchCandidate>
    reciprocalRankFusion(const std::vector<BackendCandidate>& vectorResults,
                         const std::vector<BackendCandidate>& keywordResults, double k = 60.0);

    static std::vector<SearchCandidate>
    linearCombination(const std::vector<BackendCandidate>& vectorResults,
                      const std::vector<BackendCandidate>& keywordResults, double vectorWeight);

    const ScoreFusionConfig& config() const { return config_; }

private:
    ScoreFusionConfig config_;
};

namespace fusion {

/// Contribution of a 1-based rank.
double rrfContribution(size_t rank, double k);

/// Min-max normalise into [0, 1]; all-equal input maps to 1.0.
std::vector<double> normalizeScores(const std::vector<double>& scores);

/// Fusion ordering: fused score desc, vector score desc (absent lowest), docId asc.
bool fusedBefore(const SearchCandidate& a, const SearchCandidate& b);

} // namespace fusion

} // namespace sieve::search
