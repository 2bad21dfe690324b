#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sieve::search {

using SearchFilters = std::map<std::string, std::string>;

/**
 * @brief A scored document produced by a retrieval backend.
 */
struct BackendCandidate {
    std::string docId;
    double score = 0.0;
    std::string content;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief One document as it moves through fusion, reranking and diversification.
 *
 * rank is 1-based; 0 means the candidate has not been ranked yet. Ranks are only assigned
 * once finalScore is computed, and a ranked list has non-increasing finalScore.
 */
struct SearchCandidate {
    std::string docId;
    std::string contentRef;

    std::optional<double> vectorScore;
    std::optional<double> keywordScore;
    double fusedScore = 0.0;
    std::optional<double> rerankScore;
    double finalScore = 0.0;

    size_t rank = 0;

    std::map<std::string, std::string> metadata;

    bool isRanked() const { return rank != 0; }

    bool operator==(const SearchCandidate& other) const = default;
};

/// Assign 1-based ranks in list order.
void assignRanks(std::vector<SearchCandidate>& candidates);

/// Clamp finalScore so it never increases down the list, then assign ranks.
void finalizeRanking(std::vector<SearchCandidate>& candidates);

/// True if ranks are 1..n in order and finalScore is non-increasing.
bool isWellRanked(const std::vector<SearchCandidate>& candidates);

} // namespace sieve::search
