#include <sieve/search/search_candidate.h>

#include <algorithm>

namespace sieve::search {

void assignRanks(std::vector<SearchCandidate>& candidates) {
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].rank = i + 1;
    }
}

void finalizeRanking(std::vector<SearchCandidate>& candidates) {
    for (size_t i = 1; i < candidates.size(); ++i) {
        candidates[i].finalScore =
            std::min(candidates[i].finalScore, candidates[i - 1].finalScore);
    }
    assignRanks(candidates);
}

bool isWellRanked(const std::vector<SearchCandidate>& candidates) {
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].rank != i + 1)
            return false;
        if (i > 0 && candidates[i].finalScore > candidates[i - 1].finalScore)
            return false;
    }
    return true;
}

} // namespace sieve::search
